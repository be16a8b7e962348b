/**
 * @file ErrorPolicy.hpp
 * @brief Error kinds and their session severity for mproxy.
 */

#pragma once

#include <cstdint>
#include <string_view>

namespace mproxy
{

/**
 * @brief Category of a failure raised anywhere in a streaming session.
 * @ingroup exceptions
 *
 * Every exception thrown by mproxy carries one of these values (see ProxyException::kind()).
 * The Dispatcher uses it, through classify(), to decide whether a failure ends the session
 * or is logged and counted while delivery continues.
 */
enum class ErrorKind : std::uint8_t
{
    Socket,            ///< Generic socket-layer failure (option, close, query).
    AddressResolution, ///< A target string could not be parsed or resolved.
    Bind,              ///< A sending socket could not be created or bound.
    MulticastJoin,     ///< Joining a multicast group (or IPv6 pre-connect) failed.
    Read,              ///< The input source could not be opened or read.
    Send,              ///< A datagram could not be handed to the kernel for one target.
    BackupIO,          ///< The backup directory or file could not be created or appended.
    TeeWrite           ///< Standard output rejected teed data.
};

/**
 * @brief How a failure of a given ErrorKind affects the running session.
 * @ingroup exceptions
 */
enum class Severity : std::uint8_t
{
    SessionFatal, ///< Abort the session; nothing further is read or sent.
    Recoverable   ///< Log and count the failure, continue with the next target or chunk.
};

/**
 * @brief Classify an ErrorKind.
 * @ingroup exceptions
 *
 * Setup-time failures (resolution, bind, join), input failures and tee failures end the
 * session. Per-chunk delivery failures (send, backup) are recoverable so that one bad
 * downstream or one bad backup write never stops delivery to the remaining targets.
 *
 * @param[in] kind Failure category.
 * @return Severity of @p kind.
 */
[[nodiscard]] constexpr Severity classify(const ErrorKind kind) noexcept
{
    switch (kind)
    {
        case ErrorKind::Send:
        case ErrorKind::BackupIO:
            return Severity::Recoverable;
        default:
            return Severity::SessionFatal;
    }
}

/**
 * @brief Short lowercase name of an ErrorKind, used in diagnostics.
 */
[[nodiscard]] constexpr std::string_view toString(const ErrorKind kind) noexcept
{
    switch (kind)
    {
        case ErrorKind::Socket:
            return "socket";
        case ErrorKind::AddressResolution:
            return "address resolution";
        case ErrorKind::Bind:
            return "bind";
        case ErrorKind::MulticastJoin:
            return "multicast join";
        case ErrorKind::Read:
            return "read";
        case ErrorKind::Send:
            return "send";
        case ErrorKind::BackupIO:
            return "backup";
        case ErrorKind::TeeWrite:
            return "tee";
    }
    return "unknown";
}

} // namespace mproxy
