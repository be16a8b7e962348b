#include "mproxy/common.hpp"

#include <system_error>

using namespace mproxy;

std::string mproxy::SocketErrorMessage(int error, [[maybe_unused]] const bool gaiStrerror /* = false */)
{
    // 0 means "no error" in both errno and WSA error spaces.
    if (error == 0)
        return {};

#ifdef _WIN32
    if (gaiStrerror)
    {
        // Windows exposes an ANSI variant: gai_strerrorA (static buffer, copy immediately).
        if (const char* m = ::gai_strerrorA(error); m && *m)
            return {m};
    }

    // FormatMessageA understands system codes and WSA* codes (10000-11999).
    {
        LPSTR buffer = nullptr;
        constexpr DWORD flags =
            FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS;
        constexpr DWORD lang = MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT);

        const DWORD size = ::FormatMessageA(flags, nullptr, static_cast<DWORD>(error), lang,
                                            reinterpret_cast<LPSTR>(&buffer), 0, nullptr);

        if (size != 0 && buffer)
        {
            std::string msg(buffer, size);
            ::LocalFree(buffer);

            // FormatMessage appends CR/LF and sometimes a trailing period.
            while (!msg.empty() && (msg.back() == '\r' || msg.back() == '\n' || msg.back() == ' ' || msg.back() == '.'))
                msg.pop_back();

            if (!msg.empty())
                return msg;
        }
    }

    if (std::string m = std::system_category().message(error); !m.empty())
        return m;

    return "Unknown error " + std::to_string(error);

#else
    // Some APIs return negative errno-like values; EAI_* codes are negative on glibc, so keep those as-is.
    if (gaiStrerror)
    {
        if (const char* m = ::gai_strerror(error); m && *m)
            return {m};
    }

    if (error < 0)
        error = -error;

    if (std::string m = std::system_category().message(error); !m.empty())
        return m;

    if (const char* m = ::strerror(error); m && *m)
        return {m};

    return "Unknown error " + std::to_string(error);
#endif
}

std::string mproxy::ipFromSockaddr(const sockaddr* addr)
{
    char buf[INET6_ADDRSTRLEN] = {};

    MPROXY_DIAGNOSTIC_PUSH()
    MPROXY_DIAGNOSTIC_IGNORE("-Wcast-align")
    if (addr->sa_family == AF_INET)
    {
        const auto* sa = reinterpret_cast<const sockaddr_in*>(addr);
        if (!inet_ntop(AF_INET, &sa->sin_addr, buf, sizeof(buf)))
        {
            const int error = GetSocketError();
            throw ProxyException(error, SocketErrorMessage(error));
        }
    }
    else if (addr->sa_family == AF_INET6)
    {
        const auto* sa6 = reinterpret_cast<const sockaddr_in6*>(addr);
        if (!inet_ntop(AF_INET6, &sa6->sin6_addr, buf, sizeof(buf)))
        {
            const int error = GetSocketError();
            throw ProxyException(error, SocketErrorMessage(error));
        }
    }
    else
    {
        throw ProxyException("Unsupported address family in ipFromSockaddr");
    }
    MPROXY_DIAGNOSTIC_POP()

    return {buf};
}

Port mproxy::portFromSockaddr(const sockaddr* addr)
{
    MPROXY_DIAGNOSTIC_PUSH()
    MPROXY_DIAGNOSTIC_IGNORE("-Wcast-align")
    switch (addr->sa_family)
    {
        case AF_INET:
            return ntohs(reinterpret_cast<const sockaddr_in*>(addr)->sin_port);

        case AF_INET6:
            return ntohs(reinterpret_cast<const sockaddr_in6*>(addr)->sin6_port);

        default:
            throw ProxyException("Unsupported address family in portFromSockaddr");
    }
    MPROXY_DIAGNOSTIC_POP()
}

std::string mproxy::addressToString(const sockaddr_storage& addr)
{
    const auto* sa = reinterpret_cast<const sockaddr*>(&addr);

    if (addr.ss_family == AF_INET)
        return ipFromSockaddr(sa) + ":" + std::to_string(portFromSockaddr(sa));

    if (addr.ss_family == AF_INET6)
        return "[" + ipFromSockaddr(sa) + "]:" + std::to_string(portFromSockaddr(sa));

    return "unknown";
}

bool mproxy::isMulticastAddress(const sockaddr_storage& addr) noexcept
{
    if (addr.ss_family == AF_INET)
    {
        const auto* sa = reinterpret_cast<const sockaddr_in*>(&addr);
        return IN_MULTICAST(ntohl(sa->sin_addr.s_addr));
    }

    if (addr.ss_family == AF_INET6)
    {
        const auto* sa6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        return IN6_IS_ADDR_MULTICAST(&sa6->sin6_addr);
    }

    return false;
}
