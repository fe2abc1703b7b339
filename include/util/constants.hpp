#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "proto/myir.hpp"
#include "util/log.hpp"

namespace constants
{
// Port the MYIR camera server streams to by default
inline constexpr std::uint16_t DEFAULT_PORT = 35189;

inline constexpr std::size_t MAX_DATAGRAM = proto::MAX_DATAGRAM;

// Reassembly table defaults
inline constexpr std::size_t MAX_FRAMES      = 8;
inline constexpr long        MAX_AGE_MS      = 1000;
inline constexpr std::size_t MAX_FRAME_BYTES = 32u * 1024u * 1024u;

// Files kept by the directory sink
inline constexpr std::size_t SINK_KEEP = 64;

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("FRAMERX_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    const char *home      = std::getenv("HOME");
    std::string base      = home && *home ? std::string(home) : "/tmp";
    std::string sock_path = base + "/.cache/framerx/ctl.sock";
    LOG_SYSTEM("Control socket defaults to %s", sock_path.c_str());
    return sock_path;
}

}  // namespace constants
