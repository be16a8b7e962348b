/**
 * @file SocketOptions.hpp
 * @brief Low-level socket option access and multicast membership for mproxy sockets.
 */

#pragma once

#include "common.hpp"

namespace mproxy
{

/**
 * @class SocketOptions
 * @brief Base class for raw socket option access via `setsockopt()` and `getsockopt()`.
 * @ingroup udp
 *
 * `SocketOptions` gives socket-owning classes a cross-platform way to set the options mproxy
 * needs (address reuse, multicast loopback) and to join multicast groups, without
 * duplicating the `#ifdef _WIN32` casts at every call site.
 *
 * ## Intended Usage
 * - Derived classes pass their descriptor to the constructor (or `INVALID_SOCKET`).
 * - After creating, moving or closing the descriptor they must call `setSocketFd()`.
 * - This class does **not** own the socket.
 *
 * @note This class is **not thread-safe**.
 */
class SocketOptions
{
  public:
    /**
     * @brief Initializes the option interface with a socket descriptor.
     * @param[in] sock A valid descriptor or `INVALID_SOCKET`.
     */
    explicit SocketOptions(const SOCKET sock) noexcept : _sockFd(sock) {}

    virtual ~SocketOptions() = default;

    /**
     * @brief Native socket handle, without ownership transfer.
     *
     * Intended for tests and integration with external event loops. Never close it.
     */
    [[nodiscard]] SOCKET getSocketFd() const noexcept { return _sockFd; }

    /**
     * @brief Set an integer socket option.
     *
     * @param[in] level   Protocol level (`SOL_SOCKET`, `IPPROTO_IP`, `IPPROTO_IPV6`, ...).
     * @param[in] optName Option name.
     * @param[in] value   Integer value.
     * @throws ProxyException if the socket is not open or `setsockopt()` fails.
     */
    void setOption(int level, int optName, int value);

    /**
     * @brief Set a socket option from a raw buffer.
     *
     * @param[in] level   Protocol level.
     * @param[in] optName Option name.
     * @param[in] value   Pointer to the option value.
     * @param[in] len     Size of the value in bytes.
     * @throws ProxyException if the socket is not open, the buffer is null or `setsockopt()` fails.
     */
    void setOption(int level, int optName, const void* value, socklen_t len);

    /**
     * @brief Read an integer socket option.
     * @throws ProxyException if the socket is not open or `getsockopt()` fails.
     */
    [[nodiscard]] int getOption(int level, int optName) const;

    /**
     * @brief Read a socket option into a raw buffer.
     * @throws ProxyException if the socket is not open, the buffer is invalid or `getsockopt()` fails.
     */
    void getOption(int level, int optName, void* result, socklen_t* len) const;

    /**
     * @brief Enable or disable `SO_REUSEADDR` (and `SO_REUSEPORT` where available).
     *
     * Must be called before binding. Required when several receivers on one host join the
     * same multicast group on the same port.
     */
    void setReuseAddress(bool on);

    /**
     * @brief Whether outgoing multicast datagrams are looped back to local members.
     */
    [[nodiscard]] bool getMulticastLoopback() const;

    /**
     * @brief Join an IPv4 multicast group (`IP_ADD_MEMBERSHIP`).
     *
     * @param[in] group Multicast group address (network byte order).
     * @param[in] iface Local interface address; `INADDR_ANY` lets the kernel choose.
     * @throws MulticastJoinException if the kernel rejects the membership.
     *
     * @code
     * in_addr group{};
     * inet_pton(AF_INET, "224.0.0.110", &group);
     * in_addr any{};
     * any.s_addr = htonl(INADDR_ANY);
     * sock.joinGroupIPv4(group, any);
     * @endcode
     */
    void joinGroupIPv4(in_addr group, in_addr iface);

    /**
     * @brief Join an IPv6 multicast group (`IPV6_JOIN_GROUP`).
     *
     * @param[in] group   Multicast group address.
     * @param[in] ifindex Interface index; 0 lets the kernel choose the default interface.
     * @throws MulticastJoinException if the kernel rejects the membership.
     */
    void joinGroupIPv6(const in6_addr& group, unsigned int ifindex);

    /**
     * @brief Select the outgoing interface for IPv6 multicast (`IPV6_MULTICAST_IF`).
     *
     * On Linux this also supplies the scope of a later `connect()` to a link-local group.
     *
     * @param[in] ifindex Interface index; 0 restores the kernel default.
     * @throws MulticastJoinException if the kernel rejects the interface.
     */
    void setMulticastInterfaceIPv6(unsigned int ifindex);

  protected:
    /**
     * @brief Update the descriptor used by this object after create, move or close.
     */
    void setSocketFd(const SOCKET sock) noexcept { _sockFd = sock; }

  private:
    SOCKET _sockFd = INVALID_SOCKET; ///< Underlying socket file descriptor
};

} // namespace mproxy
