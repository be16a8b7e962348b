/**
 * @file DatagramSocket.hpp
 * @brief RAII UDP socket used by mproxy targets and by loopback listeners.
 */

#pragma once

#include "common.hpp"
#include "SocketOptions.hpp"

#include <cstddef>
#include <span>
#include <string>

namespace mproxy
{

/**
 * @class DatagramSocket
 * @ingroup udp
 * @brief Owning wrapper around a single UDP socket of a fixed address family.
 *
 * A `DatagramSocket` is created for one family (`AF_INET` or `AF_INET6`), bound once, and
 * optionally connected once. It supports the two send paths mproxy needs:
 *
 * - **Unconnected** `sendTo()` with an explicit destination (unicast and IPv4 multicast).
 * - **Connected** `send()` with no destination (IPv6 multicast, after the pre-connect done by
 *   SocketBinder).
 *
 * Sends are all-or-nothing: a datagram is either fully handed to the kernel or a
 * SendException is thrown. Receiving (`waitReadable()`, `receive()`) exists for loopback
 * listeners in tools and tests.
 *
 * ### Ownership
 * Move-only. The descriptor is closed by the destructor.
 *
 * @code
 * DatagramSocket sock(AF_INET);
 * sock.bindAny();
 * sock.sendTo(bytes, reinterpret_cast<const sockaddr*>(&dest), sizeof(sockaddr_in));
 * @endcode
 *
 * @note Not thread-safe.
 */
class DatagramSocket : public SocketOptions
{
  public:
    /**
     * @brief Create an unbound UDP socket.
     *
     * @param[in] family `AF_INET` or `AF_INET6`.
     * @throws BindException if @p family is unsupported or `socket()` fails.
     */
    explicit DatagramSocket(int family);

    /**
     * @brief Closes the socket if still open. Never throws.
     */
    ~DatagramSocket() noexcept override;

    DatagramSocket(const DatagramSocket&) = delete;
    DatagramSocket& operator=(const DatagramSocket&) = delete;

    /**
     * @brief Transfer ownership of the descriptor. The source is left closed.
     */
    DatagramSocket(DatagramSocket&& rhs) noexcept
        : SocketOptions(rhs.getSocketFd()), _family(rhs._family), _isBound(rhs._isBound),
          _isConnected(rhs._isConnected)
    {
        rhs.setSocketFd(INVALID_SOCKET);
        rhs._isBound = false;
        rhs._isConnected = false;
    }

    /**
     * @brief Release the current descriptor (if any) and take ownership of @p rhs's.
     */
    DatagramSocket& operator=(DatagramSocket&& rhs) noexcept
    {
        if (this != &rhs)
        {
            internal::tryCloseNoexcept(getSocketFd());
            setSocketFd(rhs.getSocketFd());
            _family = rhs._family;
            _isBound = rhs._isBound;
            _isConnected = rhs._isConnected;

            rhs.setSocketFd(INVALID_SOCKET);
            rhs._isBound = false;
            rhs._isConnected = false;
        }
        return *this;
    }

    /**
     * @brief Bind to an explicit local address.
     *
     * @param[in] addr Local address of this socket's family.
     * @param[in] len  Size of @p addr.
     * @throws BindException if the socket is closed, already bound, or `bind()` fails.
     */
    void bind(const sockaddr* addr, socklen_t len);

    /**
     * @brief Bind to the unspecified address of this socket's family (`0.0.0.0` or `::`).
     *
     * @param[in] port Local port; 0 (default) lets the OS assign an ephemeral port.
     * @throws BindException if binding fails.
     */
    void bindAny(Port port = 0);

    /**
     * @brief Associate the socket with a default peer so that `send()` can be used.
     *
     * Connecting a UDP socket sends nothing on the wire; it fixes the destination of
     * `send()` and filters received datagrams to that peer.
     *
     * @throws ProxyException if the socket is closed or `connect()` fails.
     */
    void connect(const sockaddr* addr, socklen_t len);

    /**
     * @brief Send one datagram to the connected peer.
     *
     * @param[in] data Payload; sent as exactly one datagram.
     * @throws SendException if the socket is closed or not connected, `send()` fails, or the
     *         kernel accepted fewer bytes than requested.
     */
    void send(std::span<const std::byte> data) const;

    /**
     * @brief Send one datagram to an explicit destination.
     *
     * @param[in] data Payload; sent as exactly one datagram.
     * @param[in] addr Destination address.
     * @param[in] len  Size of @p addr.
     * @throws SendException on failure or partial send.
     */
    void sendTo(std::span<const std::byte> data, const sockaddr* addr, socklen_t len) const;

    /**
     * @brief Wait until a datagram is available or the timeout expires.
     *
     * @param[in] timeoutMillis Milliseconds to wait; negative waits forever.
     * @return `true` if a datagram can be received without blocking.
     * @throws ProxyException if polling fails.
     */
    [[nodiscard]] bool waitReadable(int timeoutMillis) const;

    /**
     * @brief Receive one datagram.
     *
     * Datagrams longer than @p out are truncated by the OS.
     *
     * @return Number of bytes written to @p out.
     * @throws ProxyException if `recv()` fails (including `SO_RCVTIMEO` expiry).
     */
    std::size_t receive(std::span<std::byte> out) const;

    /**
     * @brief Local port assigned by `bind()`, in host byte order.
     * @throws ProxyException if the socket is not open or `getsockname()` fails.
     */
    [[nodiscard]] Port getLocalPort() const;

    [[nodiscard]] int family() const noexcept { return _family; }
    [[nodiscard]] bool isOpen() const noexcept { return getSocketFd() != INVALID_SOCKET; }
    [[nodiscard]] bool isBound() const noexcept { return _isBound; }
    [[nodiscard]] bool isConnected() const noexcept { return _isConnected; }

  private:
    int _family;               ///< Address family the socket was created with.
    bool _isBound = false;     ///< True once bind() succeeded.
    bool _isConnected = false; ///< True once connect() succeeded.
};

} // namespace mproxy
