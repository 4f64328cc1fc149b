#pragma once
/**
 * @file printer_transport.hpp
 * @brief Printer-side station client: connect, write, status.
 * @details A delivery attempt is split into phases (connect, pre-write status,
 *          write, post-write status) so the dispatcher can decide between
 *          phases whether a cancellation is still possible.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>

#include "galley/compat/expected.hpp"
#include "galley/routing/station.hpp"

namespace galley::dispatch {

/** @enum TransportError
 *  @brief Failure of one transport phase.
 */
enum class TransportError : std::uint8_t {
    ResolveFailed,   ///< Host name did not resolve
    ConnectFailed,   ///< TCP connect refused or unreachable
    Timeout,         ///< Phase exceeded its deadline
    WriteFailed,     ///< Connection broke while writing
    PrinterOffline   ///< Status byte reports offline (cover open, paper out, ...)
};

const char* to_string(TransportError e) noexcept;

/** @class PrinterConnection
 *  @brief One open connection to a printer.
 */
class PrinterConnection {
public:
    virtual ~PrinterConnection() = default;

    /// Write every byte of @p bytes within @p timeout.
    virtual galley_detail::expected<void, TransportError>
    write(std::span<const std::uint8_t> bytes, std::chrono::milliseconds timeout) = 0;

    /// Send DLE EOT 1 and return the status byte.
    virtual galley_detail::expected<std::uint8_t, TransportError>
    query_status(std::chrono::milliseconds timeout) = 0;
};

/** @class PrinterTransport
 *  @brief Factory of printer connections. Implementations must be thread-safe.
 */
class PrinterTransport {
public:
    virtual ~PrinterTransport() = default;

    virtual galley_detail::expected<std::unique_ptr<PrinterConnection>, TransportError>
    connect(const routing::PrinterAddress& address, std::chrono::milliseconds timeout) = 0;
};

/** @class TcpPrinterTransport
 *  @brief Raw TCP (port 9100) transport over POSIX sockets.
 */
class TcpPrinterTransport final : public PrinterTransport {
public:
    galley_detail::expected<std::unique_ptr<PrinterConnection>, TransportError>
    connect(const routing::PrinterAddress& address, std::chrono::milliseconds timeout) override;
};

} // namespace galley::dispatch
