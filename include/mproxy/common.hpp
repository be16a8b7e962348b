/**
 * @file common.hpp
 * @brief Common platform includes, constants and socket utilities for mproxy.
 */

#pragma once

#include "Exceptions.hpp"

#include <cstddef> // std::size_t
#include <cstdint>
#include <cstring> // std::memset, std::memcpy
#include <memory>
#include <string>
#include <string_view>

#ifdef __GNUC__
#define MPROXY_QUOTE(s) #s
#define MPROXY_DIAGNOSTIC_PUSH() _Pragma("GCC diagnostic push")
#define MPROXY_DIAGNOSTIC_IGNORE(warning) _Pragma(MPROXY_QUOTE(GCC diagnostic ignored warning))
#define MPROXY_DIAGNOSTIC_POP() _Pragma("GCC diagnostic pop")
#else
#define MPROXY_DIAGNOSTIC_PUSH()
#define MPROXY_DIAGNOSTIC_IGNORE(warning)
#define MPROXY_DIAGNOSTIC_POP()
#endif

#ifdef _WIN32

// Do not reorder includes here, because Windows headers have specific order requirements.
// clang-format off
#include <winsock2.h> // Must come first: socket, bind, sendto, etc.
#include <ws2tcpip.h> // getaddrinfo, getnameinfo, inet_ntop, inet_pton, ip_mreq, ipv6_mreq
#include <windows.h>  // FormatMessageA
#include <iphlpapi.h> // GetAdaptersAddresses
// clang-format on

#ifdef _MSC_VER
#pragma comment(lib, "Ws2_32.lib")   // Winsock library
#pragma comment(lib, "iphlpapi.lib") // GetAdaptersAddresses
#endif

#else

// Assuming POSIX
#include <arpa/inet.h>  //inet_ntop, inet_pton
#include <cerrno>       //errno
#include <ifaddrs.h>    //getifaddrs
#include <net/if.h>     //if_nametoindex
#include <netdb.h>      //addrinfo
#include <netinet/in.h> //sockaddr_in, sockaddr_in6, ip_mreq, ipv6_mreq
#include <poll.h>       //poll
#include <sys/socket.h> //socket
#include <sys/types.h>  //socket
#include <unistd.h>     //close

#endif

/**
 * @defgroup mproxy mproxy: UDP stream dispatcher with multicast support
 * @brief Forward a byte stream to unicast and multicast UDP targets, with tee and dated backups.
 */

/**
 * @defgroup core Core Utilities and Types
 * @ingroup mproxy
 * @brief Platform abstractions, constants and address helpers shared across mproxy.
 */

/**
 * @defgroup internal Internal Helpers
 * @ingroup mproxy
 * @brief Implementation-only utilities. Not part of the public API.
 */

/**
 * @defgroup udp UDP Sockets
 * @ingroup mproxy
 * @brief Sending sockets, endpoints and multicast setup.
 */

/**
 * @defgroup dispatch Dispatching
 * @ingroup mproxy
 * @brief Input sources and the read/forward/tee/backup loop.
 */

/**
 * @defgroup backup Backups
 * @ingroup mproxy
 * @brief Date-bucketed backup files and their retention sweep.
 */

/**
 * @defgroup exceptions Exception Classes
 * @ingroup mproxy
 * @brief Exception types and the error policy.
 */

/**
 * @namespace mproxy
 * @brief Multicast-aware UDP stream dispatcher.
 *
 * The mproxy namespace contains:
 * - DatagramSocket, Endpoint: RAII UDP sockets and resolved addresses (IPv4 and IPv6)
 * - SocketBinder, Target: per-destination socket setup including multicast joins
 * - InputSource: the stdin/file reader
 * - BackupManager: dated backup files and the retention sweep
 * - Dispatcher: the streaming loop tying them together
 *
 * @note Classes in this namespace are not thread-safe unless explicitly stated. A streaming
 *       session runs on a single thread.
 */
namespace mproxy
{
#ifdef _WIN32

typedef long ssize_t;

inline int InitSockets()
{
    WSADATA WSAData;
    return WSAStartup(MAKEWORD(2, 2), &WSAData);
}

inline int CleanupSockets()
{
    return WSACleanup();
}

inline int GetSocketError()
{
    return WSAGetLastError();
}

// NOLINTNEXTLINE(misc-const-correctness) - changes socket state
inline int CloseSocket(SOCKET fd)
{
    return closesocket(fd);
}

#else

typedef int SOCKET;
constexpr SOCKET INVALID_SOCKET = -1;
constexpr SOCKET SOCKET_ERROR = -1;

constexpr int InitSockets()
{
    return 0;
}
constexpr int CleanupSockets()
{
    return 0;
}
inline int GetSocketError()
{
    return errno;
}
inline int CloseSocket(const SOCKET fd)
{
    return close(fd);
}

#endif

/**
 * @brief Convert a socket-related error code to a human-readable message.
 * @ingroup core
 *
 * - For APIs that set `errno` or `WSAGetLastError()`, pass that code with @p gaiStrerror false.
 * - For `getaddrinfo()`/`getnameinfo()` failures, pass the returned `EAI_*` value with
 *   @p gaiStrerror true.
 *
 * @param[in] error       Numeric error code.
 * @param[in] gaiStrerror True if @p error belongs to the `EAI_*` domain.
 * @return Best-effort description; empty when @p error is zero.
 */
std::string SocketErrorMessage(int error, bool gaiStrerror = false);

/**
 * @typedef Port
 * @brief Type alias representing a UDP port number.
 * @ingroup core
 */
using Port = std::uint16_t;

/**
 * @brief Largest chunk read from the input and sent as a single datagram.
 * @ingroup core
 *
 * Every datagram payload is exactly one chunk, so this is also the largest payload a
 * downstream listener has to accept.
 */
inline constexpr std::size_t MaxChunkSize = 8096;

/**
 * @brief Input path that selects standard input instead of a file.
 * @ingroup core
 */
inline constexpr std::string_view StdinPath = "-";

/**
 * @brief Default backup directory, relative to the working directory.
 * @ingroup core
 */
inline constexpr std::string_view DefaultBackupDirectory = "ais_backup";

/**
 * @brief Return the numeric IP string of an IPv4 or IPv6 socket address.
 * @ingroup core
 * @throws ProxyException on an unsupported family or conversion failure.
 */
std::string ipFromSockaddr(const sockaddr* addr);

/**
 * @brief Return the host-order port of an IPv4 or IPv6 socket address.
 * @ingroup core
 * @throws ProxyException on an unsupported family.
 */
Port portFromSockaddr(const sockaddr* addr);

/**
 * @brief Format a socket address as `ip:port`, bracketing IPv6 literals (`[ff02::1]:9920`).
 * @ingroup core
 *
 * @return The formatted address, or `"unknown"` for families other than IPv4/IPv6.
 */
std::string addressToString(const sockaddr_storage& addr);

/**
 * @brief Whether a socket address is an IPv4 (224.0.0.0/4) or IPv6 (ff00::/8) multicast address.
 * @ingroup core
 */
bool isMulticastAddress(const sockaddr_storage& addr) noexcept;

} // namespace mproxy

namespace mproxy::internal
{

/**
 * @brief Deleter for `addrinfo` lists returned by `getaddrinfo()`.
 * @ingroup internal
 */
struct AddrinfoDeleter
{
    void operator()(addrinfo* p) const noexcept
    {
        if (p)
            freeaddrinfo(p);
    }
};

/**
 * @brief Owning pointer to an `addrinfo` list.
 * @ingroup internal
 */
using AddrinfoPtr = std::unique_ptr<addrinfo, AddrinfoDeleter>;

/**
 * @brief Resolve a host/port pair with `getaddrinfo()`.
 * @ingroup internal
 *
 * @param[in] host     Host name or numeric address; empty means the wildcard/loopback.
 * @param[in] port     Port number.
 * @param[in] family   `AF_UNSPEC`, `AF_INET` or `AF_INET6`.
 * @param[in] socktype Socket type hint, e.g. `SOCK_DGRAM`.
 * @param[in] protocol Protocol hint, e.g. `IPPROTO_UDP`.
 * @param[in] flags    `ai_flags`, e.g. `AI_PASSIVE` or `AI_NUMERICHOST`.
 * @return Non-empty owning list of results.
 * @throws AddressResolutionException if `getaddrinfo()` fails or returns nothing.
 */
[[nodiscard]] inline AddrinfoPtr resolveAddress(const std::string_view host, const Port port, const int family,
                                                const int socktype, const int protocol, const int flags = 0)
{
    addrinfo hints{};
    hints.ai_family = family;
    hints.ai_socktype = socktype;
    hints.ai_protocol = protocol;
    hints.ai_flags = flags;

    const std::string hostStr{host};
    const std::string portStr = std::to_string(port);
    addrinfo* raw = nullptr;

    if (const int ret = ::getaddrinfo(hostStr.empty() ? nullptr : hostStr.c_str(), portStr.c_str(), &hints, &raw);
        ret != 0)
    {
        throw AddressResolutionException(ret, "Cannot resolve '" + hostStr + "': " + SocketErrorMessage(ret, true));
    }

    AddrinfoPtr result{raw};
    if (!result)
        throw AddressResolutionException("Cannot resolve '" + hostStr + "': no addresses returned");

    return result;
}

/**
 * @brief Close a socket descriptor without throwing. Used by destructors.
 * @ingroup internal
 * @return `true` if the descriptor was already invalid or closed successfully.
 */
inline bool tryCloseNoexcept(const SOCKET fd) noexcept
{
    if (fd == INVALID_SOCKET)
        return true;
    return CloseSocket(fd) == 0;
}

} // namespace mproxy::internal
