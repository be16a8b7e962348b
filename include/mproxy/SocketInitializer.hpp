/**
 * @file SocketInitializer.hpp
 * @brief Helper class for socket system initialization and cleanup (RAII) in mproxy.
 */

#pragma once

#include "common.hpp"

#include <iostream>

namespace mproxy
{
/**
 * @brief Initializes the socket subsystem for the lifetime of the object (RAII).
 * @ingroup core
 *
 * On Windows, calls WSAStartup/WSACleanup. On POSIX, does nothing. Create one instance in
 * `main()` before binding any target and keep it alive until every socket is closed.
 */
class SocketInitializer
{
  public:
    /**
     * @brief Initialize socket system (WSAStartup on Windows).
     * @throws ProxyException if initialization fails.
     */
    SocketInitializer()
    {
        if (InitSockets() != 0)
        {
            const int error = GetSocketError();
            throw ProxyException(error, SocketErrorMessage(error));
        }
    }

    /**
     * @brief Clean up socket system (WSACleanup on Windows).
     * @note Logs cleanup failures to stderr but does not throw.
     */
    ~SocketInitializer() noexcept
    {
        if (CleanupSockets() != 0)
            std::cerr << "Socket cleanup failed: " << SocketErrorMessage(GetSocketError()) << ": " << GetSocketError()
                      << std::endl;
    }

    SocketInitializer(const SocketInitializer& rhs) = delete;
    SocketInitializer& operator=(const SocketInitializer& rhs) = delete;
};

} // namespace mproxy
