/**
 * @file tcp_printer_transport.cpp
 * @brief Non-blocking connect + poll()-bounded write/read on a RAW printer socket.
 */
#include "galley/dispatch/printer_transport.hpp"
#include "galley/obs/logger.hpp"
#include "galley/print/escpos.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace galley::dispatch {

const char* to_string(TransportError e) noexcept {
    switch (e) {
        case TransportError::ResolveFailed:  return "resolve_failed";
        case TransportError::ConnectFailed:  return "connect_failed";
        case TransportError::Timeout:        return "timeout";
        case TransportError::WriteFailed:    return "write_failed";
        case TransportError::PrinterOffline: return "printer_offline";
    }
    return "unknown";
}

namespace {

using Clock = std::chrono::steady_clock;

int remaining_ms(Clock::time_point deadline) noexcept {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

/// Wait for @p events on @p fd until @p deadline. False on timeout or error.
bool wait_fd(int fd, short events, Clock::time_point deadline) {
    for (;;) {
        pollfd p{fd, events, 0};
        const int rc = ::poll(&p, 1, remaining_ms(deadline));
        if (rc > 0) return (p.revents & events) != 0;
        if (rc == 0) return false;
        if (errno != EINTR) return false;
    }
}

class TcpConnection final : public PrinterConnection {
public:
    explicit TcpConnection(int fd) noexcept : fd_(fd) {}
    ~TcpConnection() override {
        if (fd_ >= 0) ::close(fd_);
    }

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    galley_detail::expected<void, TransportError>
    write(std::span<const std::uint8_t> bytes, std::chrono::milliseconds timeout) override {
        const auto deadline = Clock::now() + timeout;
        std::size_t off = 0;
        while (off < bytes.size()) {
            if (!wait_fd(fd_, POLLOUT, deadline)) {
                return galley_detail::unexpected(remaining_ms(deadline) == 0 ? TransportError::Timeout
                                                                            : TransportError::WriteFailed);
            }
            const ssize_t n = ::send(fd_, bytes.data() + off, bytes.size() - off, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
                return galley_detail::unexpected(TransportError::WriteFailed);
            }
            off += static_cast<std::size_t>(n);
        }
        return {};
    }

    galley_detail::expected<std::uint8_t, TransportError>
    query_status(std::chrono::milliseconds timeout) override {
        const auto q = print::status_query();
        if (auto w = write(q, timeout); !w) return galley_detail::unexpected(w.error());

        const auto deadline = Clock::now() + timeout;
        for (;;) {
            if (!wait_fd(fd_, POLLIN, deadline)) return galley_detail::unexpected(TransportError::Timeout);
            std::uint8_t b = 0;
            const ssize_t n = ::recv(fd_, &b, 1, 0);
            if (n == 1) return b;
            if (n == 0) return galley_detail::unexpected(TransportError::WriteFailed); // peer closed
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return galley_detail::unexpected(TransportError::WriteFailed);
        }
    }

private:
    int fd_{-1};
};

} // namespace

galley_detail::expected<std::unique_ptr<PrinterConnection>, TransportError>
TcpPrinterTransport::connect(const routing::PrinterAddress& address, std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;

    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    const std::string port = std::to_string(address.port);
    if (const int rc = ::getaddrinfo(address.host.c_str(), port.c_str(), &hints, &res); rc != 0) {
        obs::logger()->debug("tcp: resolve '{}' failed: {}", address.host, ::gai_strerror(rc));
        return galley_detail::unexpected(TransportError::ResolveFailed);
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(res, &::freeaddrinfo);

    TransportError last = TransportError::ConnectFailed;
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) continue;
        auto conn = std::make_unique<TcpConnection>(fd);

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) return std::unique_ptr<PrinterConnection>(std::move(conn));
        if (errno != EINPROGRESS) {
            last = TransportError::ConnectFailed;
            continue;
        }
        if (!wait_fd(fd, POLLOUT, deadline)) {
            last = TransportError::Timeout;
            if (remaining_ms(deadline) == 0) break;
            continue;
        }
        int err = 0;
        socklen_t len = sizeof(err);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0) {
            return std::unique_ptr<PrinterConnection>(std::move(conn));
        }
        obs::logger()->debug("tcp: connect {}:{} failed: {}", address.host, address.port, std::strerror(err));
        last = TransportError::ConnectFailed;
    }
    return galley_detail::unexpected(last);
}

} // namespace galley::dispatch
