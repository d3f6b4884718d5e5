#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named values for the wire handshake and the demo tools.
 * @details The handshake byte is part of the wire contract and must never
 *          change. Everything below it only seeds defaults for the apps and
 *          the benchmark; override them via config::Loader.
 */

#include <cstddef>
#include <cstdint>

namespace gutters::config::constants {

// =====================
// Wire contract
// =====================
/// Byte emitted by hail(). The receiving wait() never inspects it.
inline constexpr std::byte HAIL_BYTE{0x0A};

// =====================
// Demo endpoint defaults (gutter_ping / gutter_basin)
// =====================
inline constexpr const char* DEFAULT_HOST     = "127.0.0.1";
inline constexpr std::uint16_t DEFAULT_PORT   = 34254;
inline constexpr std::uint32_t DEFAULT_COUNT  = 5;      ///< Logs thrown by gutter_ping
inline constexpr std::uint32_t MAX_COUNT      = 1'000'000;

// =====================
// Benchmark defaults
// =====================
inline constexpr std::size_t BENCH_ITERATIONS = 200'000; ///< Logs per run

} // namespace gutters::config::constants
