#include "mproxy/SocketBinder.hpp"

#include <cstring>

using namespace mproxy;

Target SocketBinder::bind(const std::string_view destination) const
{
    const Endpoint endpoint = Endpoint::parse(destination);

    // Ephemeral port on the wildcard address of the destination's family.
    DatagramSocket socket(endpoint.family());
    socket.bindAny();

    if (endpoint.isMulticast())
    {
        if (endpoint.isIPv4())
        {
            in_addr any4{};
            any4.s_addr = htonl(INADDR_ANY);
            socket.joinGroupIPv4(endpoint.ipv4Address(), any4);
        }
        else
        {
            joinIPv6Group(socket, endpoint);
        }
    }

    return Target(std::string(destination), endpoint, std::move(socket));
}

void SocketBinder::joinIPv6Group(DatagramSocket& socket, const Endpoint& group) const
{
    const unsigned int ifindex = _interfaces.ipv6MulticastInterface();
    if (ifindex != 0)
        socket.setMulticastInterfaceIPv6(ifindex);

    const Endpoint peer = _interfaces.ipv6ConnectMode() == Ipv6ConnectMode::FullTarget
                              ? scopedGroup(group, ifindex)
                              : Endpoint::unspecified(AF_INET6, group.port());

    try
    {
        socket.connect(peer.data(), peer.length());
    }
    catch (const ProxyException& ex)
    {
        throw MulticastJoinException(ex.getErrorCode(),
                                     "Cannot pre-connect IPv6 multicast socket to " + peer.toString() + ": " + ex.what());
    }

    socket.joinGroupIPv6(group.ipv6Address(), ifindex);
}

Endpoint SocketBinder::scopedGroup(const Endpoint& group, const unsigned int ifindex)
{
    if (ifindex == 0 || !group.isIPv6())
        return group;

    sockaddr_in6 addr{};
    std::memcpy(&addr, group.data(), sizeof(addr));
    if (addr.sin6_scope_id != 0 ||
        (!IN6_IS_ADDR_MC_LINKLOCAL(&addr.sin6_addr) && !IN6_IS_ADDR_MC_NODELOCAL(&addr.sin6_addr)))
        return group;

    addr.sin6_scope_id = ifindex;
    return Endpoint::fromSockaddr(reinterpret_cast<const sockaddr*>(&addr), static_cast<socklen_t>(sizeof(addr)));
}
