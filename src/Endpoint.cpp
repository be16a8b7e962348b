#include "mproxy/Endpoint.hpp"

#include <charconv>

using namespace mproxy;

std::pair<std::string, Port> Endpoint::splitHostPort(const std::string_view hostPort)
{
    const std::string quoted = "'" + std::string(hostPort) + "'";

    std::string_view host;
    std::string_view portStr;

    if (!hostPort.empty() && hostPort.front() == '[')
    {
        const auto close = hostPort.find(']');
        if (close == std::string_view::npos)
            throw AddressResolutionException("Missing ']' in target address " + quoted);

        host = hostPort.substr(1, close - 1);
        const auto rest = hostPort.substr(close + 1);
        if (rest.size() < 2 || rest.front() != ':')
            throw AddressResolutionException("Missing port in target address " + quoted);
        portStr = rest.substr(1);
    }
    else
    {
        const auto pos = hostPort.rfind(':');
        if (pos == std::string_view::npos)
            throw AddressResolutionException("Missing port in target address " + quoted);

        host = hostPort.substr(0, pos);
        // An unbracketed IPv6 literal is ambiguous ("::1:80"), so refuse it.
        if (host.find(':') != std::string_view::npos)
            throw AddressResolutionException("IPv6 addresses must be bracketed, e.g. [::1]:9920, got " + quoted);
        portStr = hostPort.substr(pos + 1);
    }

    if (host.empty())
        throw AddressResolutionException("Missing host in target address " + quoted);

    unsigned int port = 0;
    const char* b = portStr.data();
    const char* e = b + portStr.size();
    if (auto [ptr, ec] = std::from_chars(b, e, port); ec != std::errc{} || ptr != e || port == 0 || port > 65535)
        throw AddressResolutionException("Invalid port in target address " + quoted);

    return {std::string(host), static_cast<Port>(port)};
}

Endpoint Endpoint::parse(const std::string_view hostPort)
{
    const auto [host, port] = splitHostPort(hostPort);

    const auto result = internal::resolveAddress(host, port, AF_UNSPEC, SOCK_DGRAM, IPPROTO_UDP);

    for (const addrinfo* p = result.get(); p != nullptr; p = p->ai_next)
    {
        if (p->ai_family == AF_INET || p->ai_family == AF_INET6)
            return fromSockaddr(p->ai_addr, static_cast<socklen_t>(p->ai_addrlen));
    }

    throw AddressResolutionException("No IPv4 or IPv6 address for target '" + std::string(hostPort) + "'");
}

Endpoint Endpoint::fromSockaddr(const sockaddr* addr, const socklen_t len)
{
    if (addr->sa_family != AF_INET && addr->sa_family != AF_INET6)
        throw AddressResolutionException("Unsupported address family " + std::to_string(addr->sa_family));

    if (len == 0 || static_cast<std::size_t>(len) > sizeof(sockaddr_storage))
        throw AddressResolutionException("Invalid socket address length " + std::to_string(len));

    Endpoint ep;
    std::memcpy(&ep._addr, addr, static_cast<std::size_t>(len));
    ep._len = len;
    return ep;
}

Endpoint Endpoint::unspecified(const int family, const Port port)
{
    Endpoint ep;

    if (family == AF_INET)
    {
        auto* sa = reinterpret_cast<sockaddr_in*>(&ep._addr);
        sa->sin_family = AF_INET;
        sa->sin_addr.s_addr = htonl(INADDR_ANY);
        sa->sin_port = htons(port);
        ep._len = static_cast<socklen_t>(sizeof(sockaddr_in));
    }
    else if (family == AF_INET6)
    {
        auto* sa6 = reinterpret_cast<sockaddr_in6*>(&ep._addr);
        sa6->sin6_family = AF_INET6;
        sa6->sin6_addr = in6addr_any;
        sa6->sin6_port = htons(port);
        ep._len = static_cast<socklen_t>(sizeof(sockaddr_in6));
    }
    else
    {
        throw ProxyException("Endpoint::unspecified(): unsupported address family " + std::to_string(family));
    }

    return ep;
}

in_addr Endpoint::ipv4Address() const
{
    if (!isIPv4())
        throw ProxyException("Endpoint::ipv4Address(): not an IPv4 endpoint: " + toString());
    return reinterpret_cast<const sockaddr_in*>(&_addr)->sin_addr;
}

in6_addr Endpoint::ipv6Address() const
{
    if (!isIPv6())
        throw ProxyException("Endpoint::ipv6Address(): not an IPv6 endpoint: " + toString());
    return reinterpret_cast<const sockaddr_in6*>(&_addr)->sin6_addr;
}
