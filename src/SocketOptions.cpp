// SocketOptions.cpp

#include "mproxy/SocketOptions.hpp"

namespace mproxy
{

// NOLINTNEXTLINE(readability-make-member-function-const) - changes socket state
void SocketOptions::setOption(const int level, const int optName, const int value)
{
    setOption(level, optName,
#ifdef _WIN32
              reinterpret_cast<const char*>(&value),
#else
              static_cast<const void*>(&value),
#endif
              static_cast<socklen_t>(sizeof(value)));
}

// NOLINTNEXTLINE(readability-make-member-function-const) - changes socket state
void SocketOptions::setOption(const int level, const int optName, const void* value, const socklen_t len)
{
    if (_sockFd == INVALID_SOCKET)
        throw ProxyException("setOption() failed: socket not open.");

    if (!value || len == 0)
        throw ProxyException("setOption() failed: null buffer or zero length.");

    if (::setsockopt(_sockFd, level, optName,
#ifdef _WIN32
                     static_cast<const char*>(value),
#else
                     value,
#endif
                     len) < 0)
    {
        const int error = GetSocketError();
        throw ProxyException(error, SocketErrorMessage(error));
    }
}

int SocketOptions::getOption(const int level, const int optName) const
{
    int value = 0;
    socklen_t len = sizeof(value);

    getOption(level, optName, &value, &len);
    return value;
}

void SocketOptions::getOption(const int level, const int optName, void* result, socklen_t* len) const
{
    if (_sockFd == INVALID_SOCKET)
        throw ProxyException("getOption() failed: socket not open.");

    if (!result || !len || *len == 0)
        throw ProxyException("getOption() failed: invalid buffer or length.");

    if (::getsockopt(_sockFd, level, optName,
#ifdef _WIN32
                     static_cast<char*>(result),
#else
                     result,
#endif
                     len) < 0)
    {
        const int error = GetSocketError();
        throw ProxyException(error, SocketErrorMessage(error));
    }
}

// NOLINTNEXTLINE(readability-make-member-function-const) - changes socket state
void SocketOptions::setReuseAddress(const bool on)
{
    setOption(SOL_SOCKET, SO_REUSEADDR, on ? 1 : 0);
#if defined(SO_REUSEPORT)
    // BSD/macOS only deliver multicast to every member when all of them set SO_REUSEPORT.
    setOption(SOL_SOCKET, SO_REUSEPORT, on ? 1 : 0);
#endif
}

namespace
{

// Detect the bound family for this socket (AF_INET or AF_INET6).
int detectFamily(const SOCKET fd)
{
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &len) == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        throw ProxyException(error, SocketErrorMessage(error));
    }
    return ss.ss_family;
}

} // namespace

bool SocketOptions::getMulticastLoopback() const
{
    if (const int family = detectFamily(_sockFd); family == AF_INET6)
    {
        return getOption(IPPROTO_IPV6, IPV6_MULTICAST_LOOP) != 0;
    }
    return getOption(IPPROTO_IP, IP_MULTICAST_LOOP) != 0;
}

// NOLINTNEXTLINE(readability-make-member-function-const) - modifies socket state
void SocketOptions::joinGroupIPv4(const in_addr group, const in_addr iface)
{
    if (_sockFd == INVALID_SOCKET)
        throw MulticastJoinException("joinGroupIPv4() failed: socket not open.");

    ip_mreq mreq{};
    mreq.imr_multiaddr = group;
    mreq.imr_interface = iface;

    if (::setsockopt(_sockFd, IPPROTO_IP, IP_ADD_MEMBERSHIP,
#ifdef _WIN32
                     reinterpret_cast<const char*>(&mreq),
#else
                     &mreq,
#endif
                     static_cast<socklen_t>(sizeof(mreq))) < 0)
    {
        const int error = GetSocketError();
        throw MulticastJoinException(error, "IP_ADD_MEMBERSHIP failed: " + SocketErrorMessage(error));
    }
}

// NOLINTNEXTLINE(readability-make-member-function-const) - modifies socket state
void SocketOptions::joinGroupIPv6(const in6_addr& group, const unsigned int ifindex)
{
    if (_sockFd == INVALID_SOCKET)
        throw MulticastJoinException("joinGroupIPv6() failed: socket not open.");

    ipv6_mreq mreq{};
    mreq.ipv6mr_multiaddr = group;
    mreq.ipv6mr_interface = ifindex;

    if (::setsockopt(_sockFd, IPPROTO_IPV6, IPV6_JOIN_GROUP,
#ifdef _WIN32
                     reinterpret_cast<const char*>(&mreq),
#else
                     &mreq,
#endif
                     static_cast<socklen_t>(sizeof(mreq))) < 0)
    {
        const int error = GetSocketError();
        throw MulticastJoinException(error, "IPV6_JOIN_GROUP failed: " + SocketErrorMessage(error));
    }
}

// NOLINTNEXTLINE(readability-make-member-function-const) - modifies socket state
void SocketOptions::setMulticastInterfaceIPv6(const unsigned int ifindex)
{
    if (_sockFd == INVALID_SOCKET)
        throw MulticastJoinException("setMulticastInterfaceIPv6() failed: socket not open.");

#ifdef _WIN32
    const DWORD value = ifindex;
    const char* raw = reinterpret_cast<const char*>(&value);
#else
    const unsigned int value = ifindex;
    const void* raw = &value;
#endif

    if (::setsockopt(_sockFd, IPPROTO_IPV6, IPV6_MULTICAST_IF, raw, static_cast<socklen_t>(sizeof(value))) < 0)
    {
        const int error = GetSocketError();
        throw MulticastJoinException(error, "IPV6_MULTICAST_IF failed: " + SocketErrorMessage(error));
    }
}

} // namespace mproxy
