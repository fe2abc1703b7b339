#include <algorithm>
#include <arpa/inet.h>  // htonl, htons, ntohl, ntohs
#include <cstdint>
#include <cstring>

#include "proto/myir.hpp"
#include "util/log.hpp"

namespace proto
{

namespace
{

std::uint16_t get_u16(const std::uint8_t *p)
{
    std::uint16_t be;
    std::memcpy(&be, p, sizeof be);
    return ntohs(be);
}

std::uint32_t get_u32(const std::uint8_t *p)
{
    std::uint32_t be;
    std::memcpy(&be, p, sizeof be);
    return ntohl(be);
}

std::uint64_t get_u64(const std::uint8_t *p)
{
    return (static_cast<std::uint64_t>(get_u32(p)) << 32) | get_u32(p + 4);
}

void put_u16(std::uint8_t *p, std::uint16_t v)
{
    std::uint16_t be = htons(v);
    std::memcpy(p, &be, sizeof be);
}

void put_u32(std::uint8_t *p, std::uint32_t v)
{
    std::uint32_t be = htonl(v);
    std::memcpy(p, &be, sizeof be);
}

void put_u64(std::uint8_t *p, std::uint64_t v)
{
    put_u32(p, static_cast<std::uint32_t>(v >> 32));
    put_u32(p + 4, static_cast<std::uint32_t>(v & 0xFFFFFFFFu));
}

}  // namespace

std::optional<Datagram> HeaderParser::parse(const std::uint8_t *data, std::size_t len) const
{
    const std::size_t hdr_size = cfg_.header_size();
    if (!data || len < hdr_size)
        return std::nullopt;

    Header h{};
    h.magic = get_u32(data + 0);
    if (h.magic != cfg_.magic)
        return std::nullopt;
    h.version = data[4];
    if (h.version != cfg_.version)
        return std::nullopt;

    h.stream_id    = data[5];
    h.codec        = data[6];
    h.flags        = data[7];
    h.width        = get_u16(data + 8);
    h.height       = get_u16(data + 10);
    h.pts          = get_u64(data + 12);
    h.frame_id     = get_u32(data + 20);
    h.frame_size   = get_u32(data + 24);
    h.chunk_id     = get_u16(data + 28);
    h.chunks_total = get_u16(data + 30);

    Datagram d{};
    d.payload = data + hdr_size;
    if (cfg_.variant == HeaderVariant::Extended)
    {
        h.payload_len = get_u16(data + 32);
        // declared payload must be present; anything after it is ignored
        if (len - hdr_size < h.payload_len)
            return std::nullopt;
        d.payload_len = h.payload_len;
    }
    else
    {
        d.payload_len = len - hdr_size;
        h.payload_len = static_cast<std::uint16_t>(std::min<std::size_t>(d.payload_len, UINT16_MAX));
    }
    d.hdr = h;
    return d;
}

bool pack_header(const Header &in, const WireConfig &cfg, std::uint8_t *out)
{
    // validate fields before packing
    if (in.magic != cfg.magic || in.version != cfg.version)
        return false;
    if (in.chunks_total == 0 || in.chunk_id >= in.chunks_total)
        return false;
    if (in.frame_size == 0)
        return false;
    if (cfg.variant == HeaderVariant::Extended && in.payload_len > cfg.chunk_payload)
        return false;

    put_u32(out + 0, in.magic);
    out[4] = in.version;
    out[5] = in.stream_id;
    out[6] = in.codec;
    out[7] = in.flags;
    put_u16(out + 8, in.width);
    put_u16(out + 10, in.height);
    put_u64(out + 12, in.pts);
    put_u32(out + 20, in.frame_id);
    put_u32(out + 24, in.frame_size);
    put_u16(out + 28, in.chunk_id);
    put_u16(out + 30, in.chunks_total);
    if (cfg.variant == HeaderVariant::Extended)
    {
        put_u16(out + 32, in.payload_len);
        out[34] = 0;
        out[35] = 0;
    }
    return true;
}

std::vector<std::uint8_t> serialize(const Chunk &c, const WireConfig &cfg)
{
    if (cfg.variant == HeaderVariant::Extended && c.payload.size() != c.hdr.payload_len)
    {
        LOG_ERROR("serialize: payload size mismatch (%zu != %u)", c.payload.size(),
                  static_cast<unsigned>(c.hdr.payload_len));
        return {};
    }

    const std::size_t         hdr_size = cfg.header_size();
    std::vector<std::uint8_t> out(hdr_size + c.payload.size());
    if (!pack_header(c.hdr, cfg, out.data()))
    {
        LOG_ERROR("serialize: invalid header (frame=%u chunk=%u/%u)", c.hdr.frame_id,
                  static_cast<unsigned>(c.hdr.chunk_id), static_cast<unsigned>(c.hdr.chunks_total));
        return {};
    }
    if (!c.payload.empty())
        std::memcpy(out.data() + hdr_size, c.payload.data(), c.payload.size());
    return out;
}

std::vector<Chunk> make_chunks(std::uint32_t                    frame_id,
                               std::uint16_t                    width,
                               std::uint16_t                    height,
                               std::uint64_t                    pts,
                               const std::vector<std::uint8_t> &frame,
                               const WireConfig                &cfg)
{
    const std::size_t step = cfg.chunk_payload;
    if (step < 1 || step > cfg.max_chunk_payload())
    {
        LOG_ERROR("make_chunks: invalid chunk payload size (%zu, max %zu)", step,
                  cfg.max_chunk_payload());
        return {};
    }
    if (frame.empty() || frame.size() > UINT32_MAX)
    {
        LOG_ERROR("make_chunks: frame size %zu not representable", frame.size());
        return {};
    }

    const std::size_t num_chunks = (frame.size() + step - 1) / step;
    if (num_chunks > UINT16_MAX)
    {
        LOG_ERROR("make_chunks: frame too large (%zu bytes, needs %zu chunks)", frame.size(),
                  num_chunks);
        return {};
    }

    std::vector<Chunk> out;
    out.reserve(num_chunks);
    for (std::size_t i = 0; i < num_chunks; i++)
    {
        const std::size_t start = i * step;
        const std::size_t take  = std::min(step, frame.size() - start);
        Chunk             c;
        c.hdr.magic        = cfg.magic;
        c.hdr.version      = cfg.version;
        c.hdr.width        = width;
        c.hdr.height       = height;
        c.hdr.pts          = pts;
        c.hdr.frame_id     = frame_id;
        c.hdr.frame_size   = static_cast<std::uint32_t>(frame.size());
        c.hdr.chunk_id     = static_cast<std::uint16_t>(i);
        c.hdr.chunks_total = static_cast<std::uint16_t>(num_chunks);
        c.hdr.payload_len  = static_cast<std::uint16_t>(take);
        c.payload.assign(frame.begin() + start, frame.begin() + start + take);
        out.push_back(std::move(c));
    }
    return out;
}

}  // namespace proto
