/**
 * @file Exceptions.hpp
 * @brief Concrete exception types, one per ErrorKind, for mproxy.
 */

#pragma once

#include "ProxyException.hpp"

#include <string>

namespace mproxy
{

/**
 * @class AddressResolutionException
 * @ingroup exceptions
 * @brief A target string is malformed or resolves to no address.
 *
 * Thrown during setup; session-fatal. The error code is the `EAI_*` value returned by
 * `getaddrinfo()` when resolution itself failed, or 0 for parse errors.
 */
class AddressResolutionException final : public ProxyException
{
  public:
    explicit AddressResolutionException(const std::string& message)
        : ProxyException(message, ErrorKind::AddressResolution)
    {
    }

    AddressResolutionException(const int code, const std::string& message)
        : ProxyException(code, message, ErrorKind::AddressResolution)
    {
    }
};

/**
 * @class BindException
 * @ingroup exceptions
 * @brief The sending socket for a target could not be created or bound to the wildcard address.
 */
class BindException final : public ProxyException
{
  public:
    BindException(const int code, const std::string& message) : ProxyException(code, message, ErrorKind::Bind) {}
};

/**
 * @class MulticastJoinException
 * @ingroup exceptions
 * @brief Joining a multicast group failed, or the IPv6 pre-connect or interface query failed.
 */
class MulticastJoinException final : public ProxyException
{
  public:
    explicit MulticastJoinException(const std::string& message) : ProxyException(message, ErrorKind::MulticastJoin)
    {
    }

    MulticastJoinException(const int code, const std::string& message)
        : ProxyException(code, message, ErrorKind::MulticastJoin)
    {
    }
};

/**
 * @class ReadException
 * @ingroup exceptions
 * @brief The input source could not be opened or a read from it failed.
 */
class ReadException final : public ProxyException
{
  public:
    ReadException(const int code, const std::string& message) : ProxyException(code, message, ErrorKind::Read) {}
};

/**
 * @class SendException
 * @ingroup exceptions
 * @brief A datagram could not be sent to one target.
 *
 * Recoverable under the default error policy: the dispatcher records it against the target
 * and continues with the remaining targets.
 */
class SendException final : public ProxyException
{
  public:
    explicit SendException(const std::string& message) : ProxyException(message, ErrorKind::Send) {}

    SendException(const int code, const std::string& message) : ProxyException(code, message, ErrorKind::Send) {}
};

/**
 * @class BackupException
 * @ingroup exceptions
 * @brief The backup directory could not be created or the day's backup file could not be appended.
 */
class BackupException final : public ProxyException
{
  public:
    BackupException(const int code, const std::string& message) : ProxyException(code, message, ErrorKind::BackupIO)
    {
    }
};

/**
 * @class TeeException
 * @ingroup exceptions
 * @brief Writing or flushing teed data to standard output failed.
 */
class TeeException final : public ProxyException
{
  public:
    explicit TeeException(const std::string& message) : ProxyException(message, ErrorKind::TeeWrite) {}
};

} // namespace mproxy
