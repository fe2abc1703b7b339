#include <arpa/inet.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "ctl/ipc.hpp"
#include "util/config.hpp"
#include "util/log.hpp"

namespace config
{

namespace
{

bool valid_ipv4(const std::string &s)
{
    in_addr a{};
    return inet_pton(AF_INET, s.c_str(), &a) == 1;
}

// FRAMERX_<key> as an integer in [lo, hi], or the current value
template <typename T>
void env_number(const char *key, unsigned long lo, unsigned long hi, T &value)
{
    const char *e = std::getenv(key);
    if (!e)
        return;
    unsigned long v = 0;
    if (parse_ulong(e, lo, hi, v))
    {
        value = static_cast<T>(v);
        LOG_DEBUG("%s=%lu", key, v);
    }
    else
    {
        LOG_WARN("Ignoring invalid %s='%s' (expect %lu..%lu)", key, e, lo, hi);
    }
}

}  // namespace

bool parse_ulong(const char *s, unsigned long lo, unsigned long hi, unsigned long &out)
{
    if (!s || !*s || *s == '-' || *s == '+')
        return false;
    char *p = nullptr;
    errno   = 0;
    unsigned long v = std::strtoul(s, &p, 10);
    if (errno == ERANGE || !p || *p != '\0')
        return false;
    if (v < lo || v > hi)
        return false;
    out = v;
    return true;
}

Config load_from_env()
{
    Config c;

    if (const char *e = std::getenv("FRAMERX_TRANSPORT"); e && *e)
    {
        if (std::strcmp(e, "udp") == 0 || std::strcmp(e, "loopback") == 0)
            c.transport_name = e;
        else
            LOG_WARN("Ignoring invalid FRAMERX_TRANSPORT='%s' (expect udp|loopback)", e);
    }

    if (const char *e = std::getenv("FRAMERX_BIND"); e && *e)
    {
        if (valid_ipv4(e))
            c.bind_addr = e;
        else
            LOG_WARN("Ignoring invalid FRAMERX_BIND='%s' (expect IPv4 address)", e);
    }
    env_number("FRAMERX_PORT", 1, 65535, c.port);

    if (const char *e = std::getenv("FRAMERX_HEADER"); e && *e)
    {
        if (std::strcmp(e, "ext") == 0 || std::strcmp(e, "extended") == 0)
            c.variant = proto::HeaderVariant::Extended;
        else if (std::strcmp(e, "legacy") == 0)
            c.variant = proto::HeaderVariant::Legacy;
        else
            LOG_WARN("Ignoring invalid FRAMERX_HEADER='%s' (expect ext|legacy)", e);
    }

    env_number("FRAMERX_CHUNK_PAYLOAD", 1, 65535, c.chunk_payload);
    env_number("FRAMERX_MAX_FRAMES", 1, 1024, c.max_frames);
    long age_ms = static_cast<long>(c.max_age.count());
    env_number("FRAMERX_MAX_AGE_MS", 1, 600000, age_ms);
    c.max_age = std::chrono::milliseconds(age_ms);
    env_number("FRAMERX_MAX_FRAME_BYTES", 1, 1024ul * 1024ul * 1024ul, c.max_frame_bytes);

    if (const char *e = std::getenv("FRAMERX_OUT_DIR"); e && *e)
        c.out_dir = ipc::expand_user(e);
    env_number("FRAMERX_KEEP", 1, 100000, c.keep);

    c.ctl_sock = ipc::expand_user(constants::ctl_sock_path());
    return c;
}

proto::WireConfig Config::wire() const
{
    proto::WireConfig w;
    w.variant       = variant;
    w.chunk_payload = chunk_payload;
    return w;
}

proto::ReassemblerConfig Config::reassembly() const
{
    proto::ReassemblerConfig r;
    r.max_frames      = max_frames;
    r.max_age         = max_age;
    r.max_frame_bytes = max_frame_bytes;
    r.chunk_payload   = chunk_payload;
    return r;
}

transport::Settings Config::settings() const
{
    transport::Settings s;
    s.bind_addr = bind_addr;
    s.port      = port;
    return s;
}

}  // namespace config
