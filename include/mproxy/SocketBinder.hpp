/**
 * @file SocketBinder.hpp
 * @brief Turns a target address string into a ready-to-send Target.
 */

#pragma once

#include "InterfaceProvider.hpp"
#include "Target.hpp"

#include <string_view>

namespace mproxy
{

/**
 * @class SocketBinder
 * @ingroup udp
 * @brief Resolves, binds and (for multicast) joins the socket of one downstream target.
 *
 * For each destination string, bind():
 * 1. resolves it with Endpoint::parse() (AddressResolutionException on failure);
 * 2. creates a UDP socket of the resolved family and binds it to the unspecified address
 *    on an ephemeral port (BindException on failure);
 * 3. if the destination is multicast:
 *    - IPv4: joins the group on `INADDR_ANY`;
 *    - IPv6: selects InterfaceProvider::ipv6MulticastInterface() as the outgoing interface
 *      (when non-zero), pre-connects the socket according to InterfaceProvider::ipv6ConnectMode(),
 *      then joins the group on that interface;
 *    (MulticastJoinException on failure).
 *
 * There is no retry: every failure is fatal for the session being set up.
 *
 * @code
 * const auto provider = mproxy::makePlatformInterfaceProvider();
 * const mproxy::SocketBinder binder(*provider);
 * mproxy::Target t = binder.bind("[ff02::1]:9920");
 * t.send(chunk);
 * @endcode
 */
class SocketBinder
{
  public:
    /**
     * @param[in] interfaces Platform answers for IPv6 multicast; must outlive the binder.
     */
    explicit SocketBinder(const InterfaceProvider& interfaces) noexcept : _interfaces(interfaces) {}

    /**
     * @brief Produce a Target for one `host:port` destination.
     *
     * @throws AddressResolutionException, BindException, MulticastJoinException
     */
    [[nodiscard]] Target bind(std::string_view destination) const;

    /// @p group with its scope id set to @p ifindex, if it is a link- or interface-local group without one.
    [[nodiscard]] static Endpoint scopedGroup(const Endpoint& group, unsigned int ifindex);

  private:
    void joinIPv6Group(DatagramSocket& socket, const Endpoint& group) const;

    const InterfaceProvider& _interfaces;
};

} // namespace mproxy
