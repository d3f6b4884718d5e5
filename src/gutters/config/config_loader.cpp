/**
* @file config_loader.cpp
 * @brief Positional argv parser for the demo apps.
 */
#include "gutters/config/config_loader.hpp"

#include <charconv>
#include <string_view>
#include <system_error>
#include <vector>

namespace gutters::config {
    using namespace gutters::config::constants;

    template <class Int>
    static bool parse_uint(std::string_view s, Int& out) {
        if (s.empty()) return false;
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
        return ec == std::errc{} && ptr == s.data() + s.size();
    }

    gutters_detail::expected<EndpointConfig, std::string>
    Loader::from_args(int argc, const char* const* argv) {
        return parse(argc, argv, true);
    }

    gutters_detail::expected<EndpointConfig, std::string>
    Loader::from_server_args(int argc, const char* const* argv) {
        return parse(argc, argv, false);
    }

    gutters_detail::expected<EndpointConfig, std::string>
    Loader::parse(int argc, const char* const* argv, bool with_count) {
        using Err = gutters_detail::unexpected<std::string>;

        EndpointConfig cfg;
        std::vector<std::string_view> positional;
        for (int i = 1; i < argc; ++i) {
            const std::string_view arg{argv[i]};
            if (arg == "-v" || arg == "--verbose") { cfg.verbose = true; continue; }
            if (arg.size() > 1 && arg.front() == '-') {
                return Err("unknown option: " + std::string(arg));
            }
            positional.push_back(arg);
        }
        if (with_count && positional.size() > 3) {
            return Err("too many arguments (expected [host] [port] [count] [-v])");
        }
        if (!with_count && positional.size() > 2) {
            return Err("too many arguments (expected [bind_host] [port] [-v])");
        }

        if (positional.size() > 0) {
            cfg.host = std::string(positional[0]);
        }
        if (positional.size() > 1) {
            std::uint16_t port{};
            if (!parse_uint(positional[1], port)) {
                return Err("invalid port: " + std::string(positional[1]));
            }
            cfg.port = port;
        }
        if (positional.size() > 2) {
            std::uint32_t count{};
            if (!parse_uint(positional[2], count) || count == 0 || count > MAX_COUNT) {
                return Err("invalid count: " + std::string(positional[2]) +
                           " (1.." + std::to_string(MAX_COUNT) + ")");
            }
            cfg.count = count;
        }
        return cfg;
    }

} // namespace gutters::config
