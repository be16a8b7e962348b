// InterfaceProvider for macOS: IPv6 joins need the default interface's index, 0 is rejected.

#include "mproxy/InterfaceProvider.hpp"

#include <array>
#include <cstdint>
#include <cstring>
#include <net/route.h>
#include <string>

namespace mproxy
{

namespace
{

// Owns a PF_ROUTE socket.
class RouteSocket
{
  public:
    explicit RouteSocket(const int family) : _fd(::socket(PF_ROUTE, SOCK_RAW, family))
    {
        if (_fd < 0)
        {
            const int error = GetSocketError();
            throw MulticastJoinException(error, "socket(PF_ROUTE) failed: " + SocketErrorMessage(error));
        }
    }

    ~RouteSocket() { ::close(_fd); }

    RouteSocket(const RouteSocket&) = delete;
    RouteSocket& operator=(const RouteSocket&) = delete;

    [[nodiscard]] int fd() const noexcept { return _fd; }

  private:
    int _fd;
};

// Routing-socket addresses are padded to 32-bit boundaries.
constexpr std::size_t roundUp(const std::size_t len) noexcept
{
    return len == 0 ? sizeof(std::uint32_t) : 1 + ((len - 1) | (sizeof(std::uint32_t) - 1));
}

template <typename Sockaddr> char* appendZeroAddress(char* out, const int family)
{
    Sockaddr addr{};
    reinterpret_cast<sockaddr*>(&addr)->sa_len = sizeof(addr);
    reinterpret_cast<sockaddr*>(&addr)->sa_family = static_cast<sa_family_t>(family);
    std::memcpy(out, &addr, sizeof(addr));
    return out + roundUp(sizeof(addr));
}

// Interface index of the default route of @p family (an RTM_GET for the all-zero
// destination and netmask), or 0 when there is no such route.
unsigned int defaultRouteIndex(const int family)
{
    const RouteSocket route(family);

    alignas(rt_msghdr) std::array<char, 2048> buf{};
    auto* rtm = reinterpret_cast<rt_msghdr*>(buf.data());
    rtm->rtm_version = RTM_VERSION;
    rtm->rtm_type = RTM_GET;
    rtm->rtm_flags = RTF_UP | RTF_GATEWAY;
    rtm->rtm_addrs = RTA_DST | RTA_NETMASK;
    rtm->rtm_seq = 1;
    rtm->rtm_pid = ::getpid();

    char* end = buf.data() + sizeof(rt_msghdr);
    for (int i = 0; i < 2; ++i)
        end = family == AF_INET6 ? appendZeroAddress<sockaddr_in6>(end, family)
                                 : appendZeroAddress<sockaddr_in>(end, family);
    rtm->rtm_msglen = static_cast<u_short>(end - buf.data());

    const pid_t pid = rtm->rtm_pid;
    const int seq = rtm->rtm_seq;

    if (::write(route.fd(), buf.data(), rtm->rtm_msglen) < 0)
    {
        const int error = GetSocketError();
        if (error == ESRCH)
            return 0;
        throw MulticastJoinException(error, "RTM_GET for the default route failed: " + SocketErrorMessage(error));
    }

    // The socket also sees unrelated routing messages; wait for the reply to ours.
    while (true)
    {
        const ssize_t n = ::read(route.fd(), buf.data(), buf.size());
        if (n < 0)
        {
            const int error = GetSocketError();
            throw MulticastJoinException(error, "Reading the RTM_GET reply failed: " + SocketErrorMessage(error));
        }
        if (static_cast<std::size_t>(n) < sizeof(rt_msghdr))
            continue;

        if (rtm->rtm_type == RTM_GET && rtm->rtm_seq == seq && rtm->rtm_pid == pid)
            return rtm->rtm_errno == 0 ? rtm->rtm_index : 0;
    }
}

// First interface that is up, running, multicast-capable, not loopback, and has an IPv6
// address. Used when the routing table has no default route.
std::string firstMulticastInterface()
{
    ifaddrs* ifAddrStruct = nullptr;
    if (getifaddrs(&ifAddrStruct))
    {
        const int error = GetSocketError();
        throw MulticastJoinException(error, "getifaddrs() failed: " + SocketErrorMessage(error));
    }

    std::string name;
    for (const ifaddrs* ifa = ifAddrStruct; ifa != nullptr; ifa = ifa->ifa_next)
    {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET6)
            continue;

        constexpr unsigned int wanted = IFF_UP | IFF_RUNNING | IFF_MULTICAST;
        if ((ifa->ifa_flags & wanted) != wanted || (ifa->ifa_flags & IFF_LOOPBACK) != 0)
            continue;

        name = ifa->ifa_name;
        break;
    }

    freeifaddrs(ifAddrStruct);
    return name;
}

class DarwinInterfaceProvider final : public InterfaceProvider
{
  public:
    [[nodiscard]] unsigned int ipv6MulticastInterface() const override;

    // The BSD stack maps a connect() to "::" onto "::1", which never reaches the group.
    [[nodiscard]] Ipv6ConnectMode ipv6ConnectMode() const noexcept override { return Ipv6ConnectMode::FullTarget; }
};

unsigned int DarwinInterfaceProvider::ipv6MulticastInterface() const
{
    for (const int family : {AF_INET6, AF_INET})
    {
        if (const unsigned int index = defaultRouteIndex(family); index != 0)
            return index;
    }

    const std::string name = firstMulticastInterface();
    if (name.empty())
        throw MulticastJoinException("No default route and no multicast-capable IPv6 network interface is up");

    const unsigned int index = if_nametoindex(name.c_str());
    if (index == 0)
    {
        const int error = GetSocketError();
        throw MulticastJoinException(error, "if_nametoindex(" + name + ") failed: " + SocketErrorMessage(error));
    }

    return index;
}

} // namespace

std::unique_ptr<InterfaceProvider> makePlatformInterfaceProvider()
{
    return std::make_unique<DarwinInterfaceProvider>();
}

} // namespace mproxy
