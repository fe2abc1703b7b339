#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "proto/myir.hpp"
#include "proto/reassembly.hpp"
#include "transport/itransport.hpp"
#include "util/constants.hpp"

namespace config
{

// Everything the daemon reads from FRAMERX_* variables
struct Config
{
    std::string               transport_name  = "udp";  // udp | loopback
    std::string               bind_addr       = "0.0.0.0";
    std::uint16_t             port            = constants::DEFAULT_PORT;
    proto::HeaderVariant      variant         = proto::HeaderVariant::Extended;
    std::size_t               chunk_payload   = proto::CHUNK_PAYLOAD;
    std::size_t               max_frames      = constants::MAX_FRAMES;
    std::chrono::milliseconds max_age         = std::chrono::milliseconds(constants::MAX_AGE_MS);
    std::size_t               max_frame_bytes = constants::MAX_FRAME_BYTES;
    std::string               out_dir;  // empty: frames are counted, not written
    std::size_t               keep = constants::SINK_KEEP;
    std::string               ctl_sock;

    proto::WireConfig        wire() const;
    proto::ReassemblerConfig reassembly() const;
    transport::Settings      settings() const;
};

// Parses a decimal in [lo, hi]. Rejects signs, junk and overflow.
bool parse_ulong(const char *s, unsigned long lo, unsigned long hi, unsigned long &out);

// Reads the environment. Bad values are logged and left at their defaults.
Config load_from_env();

}  // namespace config
