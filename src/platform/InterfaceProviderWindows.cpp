// InterfaceProvider for Windows: default interface, connect to the full group address.

#include "mproxy/InterfaceProvider.hpp"

namespace mproxy
{

namespace
{

class WindowsInterfaceProvider final : public InterfaceProvider
{
  public:
    [[nodiscard]] unsigned int ipv6MulticastInterface() const override { return 0; }

    [[nodiscard]] Ipv6ConnectMode ipv6ConnectMode() const noexcept override { return Ipv6ConnectMode::FullTarget; }
};

} // namespace

std::unique_ptr<InterfaceProvider> makePlatformInterfaceProvider()
{
    return std::make_unique<WindowsInterfaceProvider>();
}

} // namespace mproxy
