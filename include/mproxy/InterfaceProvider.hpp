/**
 * @file InterfaceProvider.hpp
 * @brief Platform-specific choices for IPv6 multicast setup.
 */

#pragma once

#include "common.hpp"

#include <iosfwd>
#include <memory>
#include <string>

namespace mproxy
{

/**
 * @brief Where an IPv6 multicast target socket is connected before its group join.
 * @ingroup udp
 */
enum class Ipv6ConnectMode : std::uint8_t
{
    /**
     * Connect to the unspecified address (`::`) at the target port. Linux and the BSDs map this
     * peer to `::1`, so datagrams reach only local listeners on that port, never the group.
     * Selected with `--ipv6-connect unspecified`.
     */
    UnspecifiedAtTargetPort,

    /**
     * Connect to the fully resolved group address and port. Destination-less `send()` calls
     * then go out on the multicast path to every member. The default on all platforms.
     */
    FullTarget
};

/**
 * @class InterfaceProvider
 * @ingroup udp
 * @brief Capability that answers the platform-dependent questions of IPv6 multicast setup.
 *
 * IPv6 group membership needs an interface index, and the way a sending socket is
 * pre-connected differs between operating systems. Rather than branching on the platform
 * inside SocketBinder, those answers come from an InterfaceProvider:
 *
 * | Platform | ipv6MulticastInterface()                          | ipv6ConnectMode() |
 * |----------|---------------------------------------------------|-------------------|
 * | Linux    | default-route interface, 0 if `/proc` has none    | FullTarget        |
 * | macOS    | default-route interface                           | FullTarget        |
 * | Windows  | 0 (kernel default)                                | FullTarget        |
 *
 * The implementation for the current platform is chosen by the build configuration, and
 * returned by makePlatformInterfaceProvider(). FixedInterfaceProvider overrides the index
 * explicitly.
 */
class InterfaceProvider
{
  public:
    virtual ~InterfaceProvider() = default;

    /**
     * @brief Interface index to use for `IPV6_JOIN_GROUP`.
     * @throws MulticastJoinException if the platform cannot determine a usable interface.
     */
    [[nodiscard]] virtual unsigned int ipv6MulticastInterface() const = 0;

    /**
     * @brief Pre-connect strategy for IPv6 multicast target sockets.
     */
    [[nodiscard]] virtual Ipv6ConnectMode ipv6ConnectMode() const noexcept = 0;
};

/**
 * @class FixedInterfaceProvider
 * @ingroup udp
 * @brief InterfaceProvider that always answers with a configured index and connect mode.
 *
 * Used for the `--ipv6-interface` and `--ipv6-connect` overrides and in tests.
 */
class FixedInterfaceProvider final : public InterfaceProvider
{
  public:
    explicit FixedInterfaceProvider(const unsigned int ifindex,
                                    const Ipv6ConnectMode mode = Ipv6ConnectMode::FullTarget) noexcept
        : _ifindex(ifindex), _mode(mode)
    {
    }

    [[nodiscard]] unsigned int ipv6MulticastInterface() const override { return _ifindex; }
    [[nodiscard]] Ipv6ConnectMode ipv6ConnectMode() const noexcept override { return _mode; }

  private:
    unsigned int _ifindex;
    Ipv6ConnectMode _mode;
};

/**
 * @brief Provider for the platform this library was built for.
 * @ingroup udp
 *
 * Defined in exactly one of the `src/platform/InterfaceProvider*.cpp` sources, selected by CMake.
 */
[[nodiscard]] std::unique_ptr<InterfaceProvider> makePlatformInterfaceProvider();

#if !defined(_WIN32) && !defined(__APPLE__)
namespace internal
{

/**
 * @brief Device name of the lowest-metric default route.
 *
 * Reads tables in the format of `/proc/net/ipv6_route` and `/proc/net/route`. IPv6 routes
 * win over IPv4 ones; `lo` and rejecting routes are ignored. Empty if neither has one.
 *
 * @ingroup internal
 */
[[nodiscard]] std::string defaultRouteDevice(std::istream& ipv6Routes, std::istream& ipv4Routes);

} // namespace internal
#endif

} // namespace mproxy
