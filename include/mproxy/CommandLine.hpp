/**
 * @file CommandLine.hpp
 * @brief Argument parsing for the mproxy-client executable.
 */

#pragma once

#include "Dispatcher.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mproxy
{

/**
 * @class UsageException
 * @ingroup core
 * @brief Invalid command line; the message says what is wrong.
 */
class UsageException final : public std::runtime_error
{
  public:
    explicit UsageException(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @struct CommandLine
 * @ingroup core
 * @brief Result of parsing `mproxy-client` arguments.
 */
struct CommandLine
{
    DispatcherOptions options;
    std::optional<unsigned int> ipv6Interface; ///< `--ipv6-interface` override.
    std::optional<Ipv6ConnectMode> ipv6Connect; ///< `--ipv6-connect` override.
    bool help = false;
};

/**
 * @brief Parse `argv` of mproxy-client.
 *
 * Options taking a value accept both `--opt value` and `--opt=value`. Unless `--help` is
 * given, at least one `--server-addr` is required.
 *
 * @throws UsageException on unknown options, missing or malformed values.
 */
[[nodiscard]] CommandLine parseCommandLine(int argc, const char* const argv[]);

/// Help text printed by `--help` and after usage errors.
[[nodiscard]] std::string usage(std::string_view program);

} // namespace mproxy
