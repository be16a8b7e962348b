#include "mproxy/Target.hpp"

using namespace mproxy;

void Target::send(const std::span<const std::byte> chunk) const
{
    if (usesConnectedSend())
        _socket.send(chunk);
    else
        _socket.sendTo(chunk, _endpoint.data(), _endpoint.length());
}
