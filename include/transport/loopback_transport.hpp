#pragma once
#include <cstddef>

#include "transport/itransport.hpp"

namespace transport
{

// Delivers every sent datagram straight back to on_rx on the caller's thread.
class LoopbackTransport final : public ITransport
{
  public:
    bool        start(const Settings &s, OnFrame on_rx) override;
    bool        send(const Frame &datagram) override;
    void        stop() override;
    std::string name() const override { return "loopback"; }
    bool        link_ready() const override;

  private:
    OnFrame     on_rx_{};
    std::size_t max_datagram_{0};
    bool        started_{false};
};

}  // namespace transport
