/**
 * @file Endpoint.hpp
 * @brief Resolved UDP destination address (IPv4 or IPv6) for mproxy.
 */

#pragma once

#include "common.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace mproxy
{

/**
 * @class Endpoint
 * @ingroup udp
 * @brief A resolved socket address: family, IP and port, stored as `sockaddr_storage`.
 *
 * Endpoints are produced from user-supplied target strings of the form `host:port`, where
 * IPv6 literals are bracketed:
 *
 * | Input                 | Family   | Multicast |
 * |-----------------------|----------|-----------|
 * | `127.0.0.1:9910`      | AF_INET  | no        |
 * | `224.0.0.110:9911`    | AF_INET  | yes       |
 * | `[::1]:9912`          | AF_INET6 | no        |
 * | `[ff02::1]:9913`      | AF_INET6 | yes       |
 * | `localhost:9921`      | first `getaddrinfo()` result | no |
 *
 * Endpoints are small value types; copy them freely.
 */
class Endpoint
{
  public:
    /**
     * @brief Parse and resolve a `host:port` target string.
     *
     * Host names are resolved with `getaddrinfo()` (`SOCK_DGRAM`, `IPPROTO_UDP`) and the
     * first result is used.
     *
     * @param[in] hostPort Target string, e.g. `"[ff02::1]:9920"`.
     * @return The resolved endpoint.
     * @throws AddressResolutionException if the string is malformed, the port is not in
     *         [1, 65535], or resolution yields no address.
     */
    [[nodiscard]] static Endpoint parse(std::string_view hostPort);

    /**
     * @brief Split a target string into host and port without resolving it.
     *
     * Brackets around IPv6 literals are removed: `"[::1]:80"` yields `{"::1", 80}`.
     *
     * @throws AddressResolutionException on malformed input.
     */
    [[nodiscard]] static std::pair<std::string, Port> splitHostPort(std::string_view hostPort);

    /**
     * @brief Build an endpoint from a raw socket address.
     * @throws AddressResolutionException if the family is not IPv4/IPv6 or @p len is too large.
     */
    [[nodiscard]] static Endpoint fromSockaddr(const sockaddr* addr, socklen_t len);

    /**
     * @brief The unspecified address of a family (`0.0.0.0` or `::`) with the given port.
     */
    [[nodiscard]] static Endpoint unspecified(int family, Port port);

    [[nodiscard]] int family() const noexcept { return _addr.ss_family; }
    [[nodiscard]] bool isIPv4() const noexcept { return _addr.ss_family == AF_INET; }
    [[nodiscard]] bool isIPv6() const noexcept { return _addr.ss_family == AF_INET6; }

    /**
     * @brief Whether the address is in 224.0.0.0/4 (IPv4) or ff00::/8 (IPv6).
     */
    [[nodiscard]] bool isMulticast() const noexcept { return isMulticastAddress(_addr); }

    /**
     * @brief Port in host byte order.
     */
    [[nodiscard]] Port port() const { return portFromSockaddr(data()); }

    /**
     * @brief Numeric IP string without brackets or port.
     */
    [[nodiscard]] std::string ip() const { return ipFromSockaddr(data()); }

    /**
     * @brief IPv4 address in network byte order.
     * @throws ProxyException if this is not an IPv4 endpoint.
     */
    [[nodiscard]] in_addr ipv4Address() const;

    /**
     * @brief IPv6 address.
     * @throws ProxyException if this is not an IPv6 endpoint.
     */
    [[nodiscard]] in6_addr ipv6Address() const;

    [[nodiscard]] const sockaddr* data() const noexcept { return reinterpret_cast<const sockaddr*>(&_addr); }
    [[nodiscard]] socklen_t length() const noexcept { return _len; }

    /**
     * @brief `ip:port`, with IPv6 literals bracketed.
     */
    [[nodiscard]] std::string toString() const { return addressToString(_addr); }

  private:
    Endpoint() = default;

    sockaddr_storage _addr{}; ///< Address in network byte order.
    socklen_t _len = 0;       ///< Valid length of @ref _addr.
};

} // namespace mproxy
