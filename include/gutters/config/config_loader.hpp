#pragma once
/**
 * @file config_loader.hpp
 * @brief Endpoint settings for the demo apps, parsed from the command line.
 * @details Defaults reference named constants to avoid magic numbers. The
 *          library itself takes no configuration.
 */

#include <cstdint>
#include <string>

#include "gutters/compat/expected.hpp"
#include "gutters/config/constants.hpp"

namespace gutters::config {

    /** @struct EndpointConfig
     *  @brief Where to connect/listen and how many logs to exchange.
     */
    struct EndpointConfig {
        std::string   host{constants::DEFAULT_HOST};   ///< Peer host (client) or bind host (server)
        std::uint16_t port{constants::DEFAULT_PORT};   ///< TCP port
        std::uint32_t count{constants::DEFAULT_COUNT}; ///< Logs to throw (client only)
        bool          verbose{false};                  ///< Print every read/write
    };

    /** @class Loader
     *  @brief Builds an EndpointConfig from `[host] [port] [count] [-v]` (client)
     *         or `[bind_host] [port] [-v]` (server).
     */
    class Loader {
    public:
        /**
         * @brief Parse positional arguments; missing ones keep their defaults.
         * @param argc,argv As passed to main (argv[0] is skipped).
         * @return EndpointConfig, or a human-readable reason the input was rejected.
         */
        static gutters_detail::expected<EndpointConfig, std::string>
        from_args(int argc, const char* const* argv);

        /**
         * @brief Server form: `[bind_host] [port] [-v]`. A count is rejected
         *        since a server picks up until its peer hangs up.
         */
        static gutters_detail::expected<EndpointConfig, std::string>
        from_server_args(int argc, const char* const* argv);

    private:
        static gutters_detail::expected<EndpointConfig, std::string>
        parse(int argc, const char* const* argv, bool with_count);
    };

} // namespace gutters::config
