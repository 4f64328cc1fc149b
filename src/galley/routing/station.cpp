/**
 * @file station.cpp
 * @brief Station enum names and paper geometry.
 */
#include "galley/routing/station.hpp"

namespace galley::routing {

const char* to_string(StationKind k) noexcept {
    switch (k) {
        case StationKind::Display: return "display";
        case StationKind::Printer: return "printer";
    }
    return "unknown";
}

const char* to_string(PrinterDialect d) noexcept {
    switch (d) {
        case PrinterDialect::Thermal: return "thermal";
        case PrinterDialect::Impact:  return "impact";
    }
    return "unknown";
}

std::uint16_t columns_for_paper(std::uint16_t paper_width_mm) noexcept {
    using namespace config::constants;
    if (paper_width_mm <= 40) return PAPER_40MM_COLUMNS;
    if (paper_width_mm <= 58) return PAPER_58MM_COLUMNS;
    return PAPER_80MM_COLUMNS;
}

} // namespace galley::routing
