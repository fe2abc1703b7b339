#include "transport/loopback_transport.hpp"

namespace transport
{
// LoopbackTransport: a fake link to run the receive pipeline without a socket.
bool LoopbackTransport::start(const Settings &s, OnFrame on_rx)
{
    on_rx_        = std::move(on_rx);
    max_datagram_ = s.max_datagram;
    started_      = true;
    return true;
}

bool LoopbackTransport::send(const Frame &datagram)
{
    if (!started_ || !on_rx_)
        return false;
    if (max_datagram_ != 0 && datagram.size() > max_datagram_)
        return false;
    on_rx_(datagram);
    return true;
}

void LoopbackTransport::stop()
{
    started_ = false;
    on_rx_   = nullptr;
}

bool LoopbackTransport::link_ready() const
{
    return started_;
}

}  // namespace transport
