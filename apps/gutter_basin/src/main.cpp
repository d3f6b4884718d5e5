// apps/gutter_basin/src/main.cpp
// gutters: gutter_basin
// Purpose: accept one peer and pick_up_and_hail double logs until it hangs up.
// Pairs with gutter_ping.
//
// Usage:
//   ./gutter_basin [bind_host] [port] [-v]
//
// A clean end of stream between two logs ends the session with status 0;
// any other failure (including a log cut short) exits with status 1.

#include <iostream>
#include <system_error>

#include "gutters/config/config_loader.hpp"
#include "gutters/gutters.hpp"

int main(int argc, char** argv) {
    auto cfg = gutters::config::Loader::from_server_args(argc, argv);
    if (!cfg) {
        std::cerr << "gutter_basin: " << cfg.error() << "\n"
                  << "Usage: gutter_basin [bind_host] [port] [-v]" << std::endl;
        return 2;
    }

    auto listener = gutters::io::TcpListener::bind(cfg->host, cfg->port);
    if (!listener) {
        std::cerr << "listen failed: " << listener.error().message() << std::endl;
        return 1;
    }
    std::cout << "gutters " << gutters::version_string
              << ": gutter_basin listening on " << cfg->host << ":" << listener->port() << std::endl;

    auto sock = listener->accept();
    if (!sock) {
        std::cerr << "accept failed: " << sock.error().message() << std::endl;
        return 1;
    }
    std::cout << "peer connected" << std::endl;

    auto* observer = gutters::obs::make_simple_observer();
    observer->set_verbose(cfg->verbose);
    gutters::obs::ObservedGutter<gutters::io::FdGutter> gutter(*sock, *observer, "basin");

    std::uint64_t picked = 0;
    for (;;) {
        double log = 0.0;
        const auto before = observer->snapshot().bytes_read;
        auto r = gutters::pick_up_and_hail(gutter, log);
        if (!r) {
            const bool eof = r.error() == gutters::GutterError::UnexpectedEof;
            const bool between_logs = observer->snapshot().bytes_read == before;
            if (eof && between_logs) break;
            std::cerr << "log " << picked << " failed: " << r.error().message() << std::endl;
            return 1;
        }
        std::cout << "PICKED seq=" << picked << " value=" << log << std::endl;
        ++picked;
    }

    std::cout << "gutter_basin finished: " << picked << " logs picked up" << std::endl;
    return 0;
}
