/**
 * @file throw_bench.cpp
 * @brief Microbenchmark for log transfer across a socket pair (1 thrower / 1 picker).
 *
 * Runs two disciplines over AF_UNIX socket pairs:
 *   1) streaming: throw_ on one end, pick_up on the other
 *   2) lockstep:  throw_and_wait against pick_up_and_hail
 *
 * with two payload types:
 *   - `double` (8 bytes)
 *   - `Frame`  (256-byte struct)
 *
 * Reports: logs/sec, MiB/sec and ns per log.
 */

#include <array>
#include <barrier>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

#include "gutters/config/constants.hpp"
#include "gutters/gutters.hpp"

namespace bench {
using clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;

struct Frame {
  std::array<std::uint64_t, 32> words{};
};

struct Result {
  std::string name;           // e.g., "stream/double"
  std::size_t N = 0;          // logs transferred
  double      seconds = 0.0;  // wall time
  double      logs_per_s = 0.0;
  double      mib_per_s  = 0.0;
  double      ns_per_log = 0.0;
};

inline void check(const gutters::IoResult& r, const char* what) {
  if (!r) {
    std::cerr << what << " failed: " << r.error().message() << "\n";
    std::abort();
  }
}

// -----------------------------------------------------------------------------
// Core benchmark runner (template on payload type)
// -----------------------------------------------------------------------------

template <class T>
Result run_one(std::string name, std::size_t N, bool lockstep) {
  auto pair = gutters::io::make_socket_pair();
  if (!pair) {
    std::cerr << "socketpair failed: " << pair.error().message() << "\n";
    std::abort();
  }
  auto& thrower = pair->first;
  auto& picker  = pair->second;

  std::barrier sync(2);
  clock::time_point t_start, t_end;

  std::thread prod([&] {
    T log{};
    sync.arrive_and_wait();
    for (std::size_t i = 0; i < N; ++i) {
      check(lockstep ? gutters::throw_and_wait(thrower, log)
                     : gutters::throw_(thrower, log), "throw");
    }
  });

  std::thread cons([&] {
    T log{};
    sync.arrive_and_wait();
    t_start = clock::now();
    for (std::size_t i = 0; i < N; ++i) {
      check(lockstep ? gutters::pick_up_and_hail(picker, log)
                     : gutters::pick_up(picker, log), "pick_up");
    }
    t_end = clock::now();
  });

  prod.join();
  cons.join();

  const double seconds = std::chrono::duration_cast<ns>(t_end - t_start).count() / 1e9;
  Result r;
  r.name       = std::move(name);
  r.N          = N;
  r.seconds    = seconds;
  r.logs_per_s = (seconds > 0.0) ? (static_cast<double>(N) / seconds) : 0.0;
  r.mib_per_s  = r.logs_per_s * static_cast<double>(sizeof(T)) / (1024.0 * 1024.0);
  r.ns_per_log = (r.logs_per_s > 0.0) ? 1e9 / r.logs_per_s : 0.0;
  return r;
}

inline void print(const Result& r) {
  std::cout << std::fixed << std::setprecision(2)
            << std::left << std::setw(18) << r.name
            << "  N=" << std::setw(9) << r.N
            << "  time=" << std::setw(8) << r.seconds << " s"
            << "  logs/s=" << std::setw(12) << r.logs_per_s
            << "  MiB/s="  << std::setw(10) << r.mib_per_s
            << "  ns/log=" << std::setw(10) << r.ns_per_log
            << '\n';
}

} // namespace bench

int main() {
  using bench::Frame;
  using bench::print;
  using bench::run_one;

  constexpr std::size_t N = gutters::config::constants::BENCH_ITERATIONS;

  std::cout << "gutters socketpair microbenchmark\n";
  std::cout << "----------------------------------------------------------\n";

  print(run_one<double>("stream/double", N, false));
  print(run_one<Frame>("stream/frame256", N, false));
  print(run_one<double>("lockstep/double", N / 10, true));
  print(run_one<Frame>("lockstep/frame256", N / 10, true));

  std::cout << std::flush;
  return 0;
}
