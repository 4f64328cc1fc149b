// apps/printer_probe/src/main.cpp
// galley: printer_probe
// Purpose: check that a kitchen printer answers on its RAW port before it is
// put into the station configuration. Sends DLE EOT 1 and decodes the reply.
//
// Usage:
//   ./printer_probe <host> [port] [count]
//
// Notes:
// - Uses the same TcpPrinterTransport as dispatch, so connect/timeout behavior
//   matches what print jobs will see.
// - Exit code 0 when every probe reported the printer online.

#include <chrono>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "galley/config/constants.hpp"
#include "galley/dispatch/printer_transport.hpp"
#include "galley/print/escpos.hpp"

namespace {

bool probe_once(galley::dispatch::PrinterTransport& transport, const galley::routing::PrinterAddress& addr, int seq) {
    using namespace std::chrono;
    const auto connect_timeout = milliseconds{galley::config::constants::DISPATCH_CONNECT_TIMEOUT_MS};
    const auto io_timeout      = milliseconds{galley::config::constants::DISPATCH_ATTEMPT_TIMEOUT_MS};

    const auto t0 = steady_clock::now();
    auto conn = transport.connect(addr, connect_timeout);
    if (!conn) {
        std::cout << "PROBE " << addr.host << ":" << addr.port << " seq=" << seq
                  << " error=" << galley::dispatch::to_string(conn.error()) << std::endl;
        return false;
    }
    auto status = (*conn)->query_status(io_timeout);
    const auto rtt = duration_cast<milliseconds>(steady_clock::now() - t0).count();
    if (!status) {
        std::cout << "PROBE " << addr.host << ":" << addr.port << " seq=" << seq
                  << " error=" << galley::dispatch::to_string(status.error()) << " rtt=" << rtt << " ms" << std::endl;
        return false;
    }
    const bool online = galley::print::status_online(*status);
    std::cout << "PROBE " << addr.host << ":" << addr.port << " seq=" << seq
              << " status=0x" << std::hex << static_cast<int>(*status) << std::dec
              << (online ? " online" : " offline") << " rtt=" << rtt << " ms" << std::endl;
    return online;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <host> [port] [count]\n";
        return 2;
    }
    galley::routing::PrinterAddress addr;
    addr.host = argv[1];
    int count = 3;
    try {
        if (argc > 2) {
            const int port = std::stoi(argv[2]);
            if (port <= 0 || port > 65535) {
                std::cerr << "port out of range: " << port << "\n";
                return 2;
            }
            addr.port = static_cast<std::uint16_t>(port);
        }
        if (argc > 3) count = std::stoi(argv[3]);
    } catch (const std::logic_error& e) {
        std::cerr << "bad argument: " << e.what() << "\n";
        return 2;
    }

    galley::dispatch::TcpPrinterTransport transport;
    int online = 0;
    for (int i = 0; i < count; ++i) {
        if (probe_once(transport, addr, i)) ++online;
        if (i + 1 < count) std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
    std::cout << online << "/" << count << " probes online" << std::endl;
    return online == count ? 0 : 1;
}
