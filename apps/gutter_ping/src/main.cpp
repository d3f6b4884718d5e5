// apps/gutter_ping/src/main.cpp
// gutters: gutter_ping
// Purpose: connect to a gutter_basin and throw_and_wait a series of double
// logs, printing the round-trip time of each (throw + hail back).
//
// Usage:
//   ./gutter_ping [host] [port] [count] [-v]
//
// Notes:
// - Each log carries its sequence number as a double (native byte order).
// - The RTT includes the peer's pick_up and hail, nothing else.

#include <chrono>
#include <cstdio>
#include <iostream>

#include "gutters/config/config_loader.hpp"
#include "gutters/gutters.hpp"

int main(int argc, char** argv) {
    using clock = std::chrono::steady_clock;

    auto cfg = gutters::config::Loader::from_args(argc, argv);
    if (!cfg) {
        std::cerr << "gutter_ping: " << cfg.error() << "\n"
                  << "Usage: gutter_ping [host] [port] [count] [-v]" << std::endl;
        return 2;
    }

    std::cout << "gutters " << gutters::version_string << ": gutter_ping starting" << std::endl;
    std::cout << "Target: " << cfg->host << ":" << cfg->port
              << ", count: " << cfg->count << std::endl;

    auto sock = gutters::io::tcp_connect(cfg->host, cfg->port);
    if (!sock) {
        std::cerr << "connect failed: " << sock.error().message() << std::endl;
        return 1;
    }

    auto* observer = gutters::obs::make_simple_observer();
    observer->set_verbose(cfg->verbose);
    gutters::obs::ObservedGutter<gutters::io::FdGutter> gutter(*sock, *observer, "ping");

    for (std::uint32_t i = 0; i < cfg->count; ++i) {
        const double log = static_cast<double>(i);
        const auto t0 = clock::now();
        if (auto r = gutters::throw_and_wait(gutter, log); !r) {
            std::cerr << "seq=" << i << " failed: " << r.error().message() << std::endl;
            return 1;
        }
        const auto us = std::chrono::duration_cast<std::chrono::microseconds>(clock::now() - t0).count();
        std::cout << "THROW " << cfg->host
                  << " seq=" << i
                  << " rtt=" << us << " us"
                  << std::endl;
    }

    const auto c = observer->snapshot();
    std::cout << "gutter_ping finished: "
              << c.bytes_written << " bytes thrown, "
              << c.bytes_read << " hails received" << std::endl;
    return 0;
}
