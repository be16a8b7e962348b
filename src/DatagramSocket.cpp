#include "mproxy/DatagramSocket.hpp"

using namespace mproxy;

namespace
{

int sendFlags() noexcept
{
#if defined(MSG_NOSIGNAL)
    // Avoid SIGPIPE if the peer side of a connected socket disappears.
    return MSG_NOSIGNAL;
#else
    return 0;
#endif
}

} // namespace

DatagramSocket::DatagramSocket(const int family) : SocketOptions(INVALID_SOCKET), _family(family)
{
    if (family != AF_INET && family != AF_INET6)
        throw BindException(0, "DatagramSocket: unsupported address family " + std::to_string(family));

    setSocketFd(::socket(family, SOCK_DGRAM, IPPROTO_UDP));
    if (getSocketFd() == INVALID_SOCKET)
    {
        const int error = GetSocketError();
        throw BindException(error, "socket() failed: " + SocketErrorMessage(error));
    }
}

DatagramSocket::~DatagramSocket() noexcept
{
    internal::tryCloseNoexcept(getSocketFd());
    setSocketFd(INVALID_SOCKET);
}

void DatagramSocket::bind(const sockaddr* addr, const socklen_t len)
{
    if (!isOpen())
        throw BindException(0, "DatagramSocket::bind(): socket is not open");

    if (_isBound)
        throw BindException(0, "DatagramSocket::bind(): socket is already bound");

    if (::bind(getSocketFd(), addr, len) == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        throw BindException(error, "bind() failed: " + SocketErrorMessage(error));
    }

    _isBound = true;
}

void DatagramSocket::bindAny(const Port port)
{
    if (_family == AF_INET)
    {
        sockaddr_in any4{};
        any4.sin_family = AF_INET;
        any4.sin_addr.s_addr = htonl(INADDR_ANY);
        any4.sin_port = htons(port);
        bind(reinterpret_cast<const sockaddr*>(&any4), static_cast<socklen_t>(sizeof(any4)));
    }
    else
    {
        sockaddr_in6 any6{};
        any6.sin6_family = AF_INET6;
        any6.sin6_addr = in6addr_any;
        any6.sin6_port = htons(port);
        bind(reinterpret_cast<const sockaddr*>(&any6), static_cast<socklen_t>(sizeof(any6)));
    }
}

void DatagramSocket::connect(const sockaddr* addr, const socklen_t len)
{
    if (!isOpen())
        throw ProxyException("DatagramSocket::connect(): socket is not open");

    if (::connect(getSocketFd(), addr, len) == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        throw ProxyException(error, "connect() failed: " + SocketErrorMessage(error));
    }

    _isConnected = true;
}

void DatagramSocket::send(const std::span<const std::byte> data) const
{
    if (!isOpen())
        throw SendException("DatagramSocket::send(): socket is not open.");

    if (!_isConnected)
        throw SendException("DatagramSocket::send(): socket is not connected. Use sendTo() instead.");

    const auto sent = ::send(getSocketFd(),
#ifdef _WIN32
                             reinterpret_cast<const char*>(data.data()), static_cast<int>(data.size()),
#else
                             data.data(), data.size(),
#endif
                             sendFlags());

    if (sent == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        throw SendException(error, "send() failed: " + SocketErrorMessage(error));
    }

    if (static_cast<std::size_t>(sent) != data.size())
        throw SendException("send(): partial datagram was sent.");
}

void DatagramSocket::sendTo(const std::span<const std::byte> data, const sockaddr* addr, const socklen_t len) const
{
    if (!isOpen())
        throw SendException("DatagramSocket::sendTo(): socket is not open.");

    const auto sent = ::sendto(getSocketFd(),
#ifdef _WIN32
                               reinterpret_cast<const char*>(data.data()), static_cast<int>(data.size()),
#else
                               data.data(), data.size(),
#endif
                               sendFlags(), addr, len);

    if (sent == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        throw SendException(error, "sendto() failed: " + SocketErrorMessage(error));
    }

    if (static_cast<std::size_t>(sent) != data.size())
        throw SendException("sendto(): partial datagram was sent.");
}

bool DatagramSocket::waitReadable(const int timeoutMillis) const
{
    if (!isOpen())
        throw ProxyException("DatagramSocket::waitReadable(): socket is not open.");

#if defined(_WIN32)
    WSAPOLLFD pfd{};
    pfd.fd = getSocketFd();
    pfd.events = POLLRDNORM;

    const int rc = ::WSAPoll(&pfd, 1, timeoutMillis);
    if (rc == 0)
        return false; // timed out
    if (rc == SOCKET_ERROR)
    {
        const int err = GetSocketError();
        throw ProxyException(err, SocketErrorMessage(err));
    }
    return (pfd.revents & POLLRDNORM) != 0;
#else
    pollfd pfd{};
    pfd.fd = getSocketFd();
    pfd.events = POLLIN;

    for (;;)
    {
        const int rc = ::poll(&pfd, 1, timeoutMillis);
        if (rc > 0)
        {
            if (pfd.revents & POLLNVAL)
                throw ProxyException(EBADF, SocketErrorMessage(EBADF));
            return (pfd.revents & POLLIN) != 0;
        }
        if (rc == 0)
            return false; // timed out

        const int err = errno;
        if (err == EINTR)
            continue; // retry on signal
        throw ProxyException(err, SocketErrorMessage(err));
    }
#endif
}

std::size_t DatagramSocket::receive(const std::span<std::byte> out) const
{
    if (!isOpen())
        throw ProxyException("DatagramSocket::receive(): socket is not open.");

    const auto n = ::recv(getSocketFd(),
#ifdef _WIN32
                          reinterpret_cast<char*>(out.data()), static_cast<int>(out.size()),
#else
                          out.data(), out.size(),
#endif
                          0);

    if (n == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        throw ProxyException(error, "recv() failed: " + SocketErrorMessage(error));
    }

    return static_cast<std::size_t>(n);
}

Port DatagramSocket::getLocalPort() const
{
    if (!isOpen())
        throw ProxyException("DatagramSocket::getLocalPort(): socket is not open.");

    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(getSocketFd(), reinterpret_cast<sockaddr*>(&addr), &len) == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        throw ProxyException(error, SocketErrorMessage(error));
    }

    return portFromSockaddr(reinterpret_cast<const sockaddr*>(&addr));
}
