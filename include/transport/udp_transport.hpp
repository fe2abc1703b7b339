#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <netinet/in.h>
#include <string>
#include <thread>

#include "transport/itransport.hpp"

namespace transport
{

// One POSIX UDP socket. A loop thread polls it and hands each datagram to
// on_rx; send() goes to Settings::peer_addr:peer_port.
class UdpTransport final : public ITransport
{
  public:
    UdpTransport() = default;
    ~UdpTransport() override;

    UdpTransport(const UdpTransport &)            = delete;
    UdpTransport &operator=(const UdpTransport &) = delete;

    bool        start(const Settings &s, OnFrame on_rx) override;
    bool        send(const Frame &datagram) override;
    void        stop() override;
    std::string name() const override { return "udp"; }
    bool        link_ready() const override;

    // bound port, useful after binding port 0
    std::uint16_t local_port() const { return local_port_; }

    std::uint64_t rx_datagrams() const { return rx_count_.load(std::memory_order_relaxed); }

  private:
    void rx_loop();

    Settings                   settings_{};
    OnFrame                    on_rx_{};
    int                        fd_{-1};
    std::uint16_t              local_port_{0};
    sockaddr_in                peer_{};
    bool                       have_peer_{false};
    std::thread                loop_;
    std::atomic_bool           running_{false};
    std::atomic<std::uint64_t> rx_count_{0};
    std::mutex                 tx_mu_;
};

}  // namespace transport
