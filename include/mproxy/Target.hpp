/**
 * @file Target.hpp
 * @brief One downstream UDP destination and the socket that exclusively serves it.
 */

#pragma once

#include "DatagramSocket.hpp"
#include "Endpoint.hpp"

#include <cstddef>
#include <span>
#include <string>

namespace mproxy
{

/**
 * @class Target
 * @ingroup udp
 * @brief A resolved destination paired with its own bound (and possibly multicast-joined) socket.
 *
 * Targets are created by SocketBinder::bind() and owned by the Dispatcher for the whole
 * session. Each Target exclusively owns its socket: Targets are move-only and never share
 * a descriptor.
 *
 * send() chooses the send path from the destination:
 * - IPv4 (unicast or multicast) and IPv6 unicast: `sendto()` with the explicit destination.
 * - IPv6 multicast: `send()` on the socket pre-connected during binding.
 */
class Target
{
  public:
    /**
     * @brief Take ownership of a ready-to-send socket for @p endpoint.
     *
     * @param[in] destination Target string as given by the user (kept for diagnostics).
     * @param[in] endpoint    Resolved destination.
     * @param[in] socket      Bound socket; for IPv6 multicast it must already be connected.
     */
    Target(std::string destination, const Endpoint& endpoint, DatagramSocket socket)
        : _destination(std::move(destination)), _endpoint(endpoint), _socket(std::move(socket))
    {
    }

    Target(const Target&) = delete;
    Target& operator=(const Target&) = delete;
    Target(Target&&) noexcept = default;
    Target& operator=(Target&&) noexcept = default;
    ~Target() = default;

    /**
     * @brief Send one chunk as one datagram to this target.
     * @throws SendException if the datagram could not be sent.
     */
    void send(std::span<const std::byte> chunk) const;

    /**
     * @brief Whether send() uses the pre-connected, destination-less path.
     */
    [[nodiscard]] bool usesConnectedSend() const noexcept { return _endpoint.isIPv6() && _endpoint.isMulticast(); }

    [[nodiscard]] const std::string& destination() const noexcept { return _destination; }
    [[nodiscard]] const Endpoint& endpoint() const noexcept { return _endpoint; }
    [[nodiscard]] const DatagramSocket& socket() const noexcept { return _socket; }

  private:
    std::string _destination;
    Endpoint _endpoint;
    DatagramSocket _socket;
};

} // namespace mproxy
