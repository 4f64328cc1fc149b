#pragma once
/**
 * @file escpos.hpp
 * @brief Ticket -> ESC/POS bytes, and back.
 * @details Two dialects share the command set except for emphasis and paper
 *          handling. Thermal: GS B inverse, GS ! sizes, GS V cut. Impact:
 *          ESC r red ribbon instead of inverse, ESC ! sizes, no cutter.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "galley/compat/expected.hpp"
#include "galley/print/instruction.hpp"
#include "galley/routing/station.hpp"

namespace galley::print {

using Bytes = std::vector<std::uint8_t>;

/** @struct EncodeError
 *  @brief First instruction the encoder could not represent.
 */
struct EncodeError {
    enum class Code : std::uint8_t {
        UnsupportedCommand,   ///< The dialect has no such command (impact + Cut)
        NonPrintableText,     ///< Text outside 0x20..0x7E
        ArgumentOutOfRange    ///< Enum operand the protocol cannot express
    };
    Code        code{Code::UnsupportedCommand};
    std::size_t index{0};     ///< Offending instruction index
    Op          op{Op::Initialize};
};

const char* to_string(EncodeError::Code c) noexcept;

/** @struct DecodeError
 *  @brief First byte sequence the decoder could not map.
 */
struct DecodeError {
    enum class Code : std::uint8_t {
        Truncated,         ///< Command cut short by end of input
        UnknownCommand,    ///< Byte sequence not produced by the encoder
        BadArgument        ///< Known command with an unexpected operand
    };
    Code        code{Code::UnknownCommand};
    std::size_t offset{0};    ///< Byte offset of the command
};

const char* to_string(DecodeError::Code c) noexcept;

/** @class TicketEncoder
 *  @brief Maps abstract tickets to a concrete printer protocol.
 */
class TicketEncoder {
public:
    virtual ~TicketEncoder() = default;
    virtual galley_detail::expected<Bytes, EncodeError> encode(const Ticket& t) const = 0;
    virtual const char* name() const noexcept = 0;
};

/** @class EscPosEncoder
 *  @brief ESC/POS encoder for thermal or impact printers.
 */
class EscPosEncoder final : public TicketEncoder {
public:
    explicit EscPosEncoder(routing::PrinterDialect dialect) noexcept : dialect_(dialect) {}

    galley_detail::expected<Bytes, EncodeError> encode(const Ticket& t) const override;
    const char* name() const noexcept override;

    routing::PrinterDialect dialect() const noexcept { return dialect_; }

private:
    routing::PrinterDialect dialect_;
};

/**
 * @brief Reverse of EscPosEncoder::encode for the same dialect.
 * @details Consecutive text bytes decode into one Text instruction.
 */
galley_detail::expected<Ticket, DecodeError>
decode_escpos(std::span<const std::uint8_t> bytes, routing::PrinterDialect dialect);

/// Real-time status request (DLE EOT 1).
Bytes status_query();

/// True when a DLE EOT 1 reply byte reports the printer online.
bool status_online(std::uint8_t reply) noexcept;

} // namespace galley::print
