/**
* @file observability.cpp
 * @brief printf-backed implementation of SimpleObserver.
 */
#include "gutters/obs/observability.hpp"

#include <string>

namespace gutters::obs {

    static const char* to_string(Direction d) {
        return d == Direction::Read ? "read" : "write";
    }

    void SimpleObserver::record(const TransferEvent& e) {
        std::lock_guard<std::mutex> lk(mu_);
        if (e.direction == Direction::Read) {
            ctr_.read_calls++;
            ctr_.bytes_read += e.transferred;
        } else {
            ctr_.write_calls++;
            ctr_.bytes_written += e.transferred;
        }
        if (e.error) ctr_.failures++;

        if (!verbose_ || !out_) return;
        // JSON-ish line
        if (e.error) {
            const std::string msg = e.error.message();
            std::fprintf(out_,
              R"({"gutter":"%s","op":"%s","requested":%zu,"transferred":%zu,"error":"%s:%d","message":"%s"})" "\n",
              e.gutter, to_string(e.direction), e.requested, e.transferred,
              e.error.category().name(), e.error.value(), msg.c_str());
        } else {
            std::fprintf(out_,
              R"({"gutter":"%s","op":"%s","requested":%zu,"transferred":%zu})" "\n",
              e.gutter, to_string(e.direction), e.requested, e.transferred);
        }
        std::fflush(out_);
    }

    Counters SimpleObserver::snapshot() const {
        std::lock_guard<std::mutex> lk(mu_);
        return ctr_;
    }

    void SimpleObserver::set_verbose(bool v) {
        std::lock_guard<std::mutex> lk(mu_);
        verbose_ = v;
    }

    SimpleObserver* make_simple_observer() {
        static SimpleObserver obs; // process-wide singleton
        return &obs;
    }

} // namespace gutters::obs
