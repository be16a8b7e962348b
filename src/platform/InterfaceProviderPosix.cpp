// InterfaceProvider for Linux and other POSIX systems: interface of the default route, connect to the group.

#include "mproxy/InterfaceProvider.hpp"

#include <charconv>
#include <fstream>
#include <limits>
#include <net/route.h>
#include <sstream>
#include <string_view>

namespace mproxy
{

namespace
{

bool parseHex(const std::string_view text, unsigned long& out)
{
    const char* b = text.data();
    const char* e = b + text.size();
    auto [ptr, ec] = std::from_chars(b, e, out, 16);
    return ec == std::errc{} && ptr == e;
}

// Lowest-metric usable default route of /proc/net/ipv6_route:
// dst dst_len src src_len next_hop metric refcnt use flags device
std::string ipv6DefaultDevice(std::istream& table)
{
    std::string best;
    unsigned long bestMetric = std::numeric_limits<unsigned long>::max();

    std::string line;
    while (std::getline(table, line))
    {
        std::istringstream fields(line);
        std::string dst, dstLen, src, srcLen, nextHop, metric, refCnt, use, flags, device;
        if (!(fields >> dst >> dstLen >> src >> srcLen >> nextHop >> metric >> refCnt >> use >> flags >> device))
            continue;

        unsigned long m = 0;
        unsigned long f = 0;
        if (dstLen != "00" || dst.find_first_not_of('0') != std::string::npos || device == "lo" ||
            !parseHex(metric, m) || !parseHex(flags, f))
            continue;
        if ((f & RTF_UP) == 0 || (f & RTF_REJECT) != 0)
            continue;

        if (best.empty() || m < bestMetric)
        {
            best = device;
            bestMetric = m;
        }
    }
    return best;
}

// Lowest-metric default route of /proc/net/route (one header line):
// Iface Destination Gateway Flags RefCnt Use Metric Mask MTU Window IRTT
std::string ipv4DefaultDevice(std::istream& table)
{
    std::string best;
    unsigned long bestMetric = std::numeric_limits<unsigned long>::max();

    std::string line;
    std::getline(table, line);
    while (std::getline(table, line))
    {
        std::istringstream fields(line);
        std::string device, dst, gateway, flags, refCnt, use, metric, mask;
        if (!(fields >> device >> dst >> gateway >> flags >> refCnt >> use >> metric >> mask))
            continue;

        unsigned long m = 0;
        unsigned long f = 0;
        if (dst != "00000000" || mask != "00000000" || device == "lo" || !parseHex(flags, f))
            continue;
        if ((f & RTF_UP) == 0 || (f & RTF_REJECT) != 0)
            continue;

        // The metric column is decimal.
        const char* b = metric.data();
        if (auto [ptr, ec] = std::from_chars(b, b + metric.size(), m); ec != std::errc{})
            continue;

        if (best.empty() || m < bestMetric)
        {
            best = device;
            bestMetric = m;
        }
    }
    return best;
}

class PosixInterfaceProvider final : public InterfaceProvider
{
  public:
    [[nodiscard]] unsigned int ipv6MulticastInterface() const override;

    [[nodiscard]] Ipv6ConnectMode ipv6ConnectMode() const noexcept override { return Ipv6ConnectMode::FullTarget; }
};

unsigned int PosixInterfaceProvider::ipv6MulticastInterface() const
{
    std::ifstream ipv6Routes("/proc/net/ipv6_route");
    std::ifstream ipv4Routes("/proc/net/route");
    const std::string name = internal::defaultRouteDevice(ipv6Routes, ipv4Routes);

    // No routing table to read: let the kernel choose.
    if (name.empty())
        return 0;

    const unsigned int index = if_nametoindex(name.c_str());
    if (index == 0)
    {
        const int error = GetSocketError();
        throw MulticastJoinException(error, "if_nametoindex(" + name + ") failed: " + SocketErrorMessage(error));
    }

    return index;
}

} // namespace

std::string internal::defaultRouteDevice(std::istream& ipv6Routes, std::istream& ipv4Routes)
{
    if (std::string device = ipv6DefaultDevice(ipv6Routes); !device.empty())
        return device;
    return ipv4DefaultDevice(ipv4Routes);
}

std::unique_ptr<InterfaceProvider> makePlatformInterfaceProvider()
{
    return std::make_unique<PosixInterfaceProvider>();
}

} // namespace mproxy
