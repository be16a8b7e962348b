/**
 * @file ProxyException.hpp
 * @brief Base exception class for mproxy errors.
 */

#pragma once

#include "ErrorPolicy.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

namespace mproxy
{

/**
 * @class ProxyException
 * @ingroup exceptions
 * @brief Represents errors raised by the mproxy socket, input and backup layers.
 *
 * ProxyException is the common base of every exception thrown by mproxy. It encapsulates a
 * platform-specific error code (e.g., `errno`, a WSA error or an `EAI_*` resolver code), a
 * descriptive message, and the ErrorKind used by the dispatcher's error policy.
 *
 * Derived classes (see Exceptions.hpp) fix the kind, so handlers can either catch a specific
 * failure or catch ProxyException and inspect kind().
 *
 * ### Example
 * @code
 * try {
 *     dispatcher.setup();
 *     dispatcher.run();
 * } catch (const mproxy::ProxyException& ex) {
 *     std::cerr << toString(ex.kind()) << " error (" << ex.getErrorCode() << "): " << ex.what() << std::endl;
 * }
 * @endcode
 */
class ProxyException : public std::runtime_error
{
  public:
    /**
     * @brief Constructs a ProxyException with a message and no associated error code.
     *
     * Used for logic errors and precondition failures that do not map to a system error.
     *
     * @param message Human-readable description of the failure.
     * @param kind    Failure category (defaults to ErrorKind::Socket).
     */
    explicit ProxyException(const std::string& message = "ProxyException", const ErrorKind kind = ErrorKind::Socket)
        : std::runtime_error(message), _errorCode(0), _kind(kind)
    {
    }

    /**
     * @brief Constructs a ProxyException with a platform error code and message.
     *
     * The message passed to `std::runtime_error` has the form `"message (error code 111)"`.
     *
     * @param code    Error code reported by the operating system or resolver.
     * @param message Descriptive message.
     * @param kind    Failure category (defaults to ErrorKind::Socket).
     */
    explicit ProxyException(const int code, const std::string& message = "ProxyException",
                            const ErrorKind kind = ErrorKind::Socket)
        : std::runtime_error(buildErrorMessage(message, code)), _errorCode(code), _kind(kind)
    {
    }

    /**
     * @brief Platform error code captured when the exception was constructed (0 if none).
     */
    [[nodiscard]] int getErrorCode() const noexcept { return _errorCode; }

    /**
     * @brief Failure category of this exception.
     */
    [[nodiscard]] ErrorKind kind() const noexcept { return _kind; }

    /**
     * @brief Shortcut for `classify(kind())`.
     */
    [[nodiscard]] Severity severity() const noexcept { return classify(_kind); }

    ~ProxyException() override = default;

  private:
    int _errorCode;  ///< Platform-specific error code (errno, WSA error, EAI_*).
    ErrorKind _kind; ///< Category consumed by the error policy.

    static std::string buildErrorMessage(const std::string& msg, const int code)
    {
        std::ostringstream oss;
        oss << msg << " (error code " << code << ")";
        return oss.str();
    }
};

} // namespace mproxy
