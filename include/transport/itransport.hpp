#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "util/constants.hpp"

namespace transport
{

using Frame   = std::vector<std::uint8_t>;  // one datagram
using OnFrame = std::function<void(const Frame &)>;

struct Settings
{
    std::string   bind_addr = "0.0.0.0";
    std::uint16_t port      = constants::DEFAULT_PORT;  // 0: pick an ephemeral port
    std::string   peer_addr;                            // send() target, empty for receive-only
    std::uint16_t peer_port    = 0;
    std::size_t   max_datagram = constants::MAX_DATAGRAM;
};

struct ITransport
{
    // on_rx is called once per datagram, never with a partial or coalesced one
    virtual bool        start(const Settings &s, OnFrame on_rx) = 0;
    virtual bool        send(const Frame &datagram)             = 0;
    virtual void        stop()                                  = 0;
    virtual std::string name() const { return ""; }
    virtual bool        link_ready() const = 0;
    virtual ~ITransport() = default;
};

}  // namespace transport
