#include <algorithm>
#include <cstring>

#include "proto/reassembly.hpp"
#include "util/log.hpp"

namespace proto
{

const char *chunk_status_name(ChunkStatus s)
{
    switch (s)
    {
        case ChunkStatus::Accepted:
            return "accepted";
        case ChunkStatus::Completed:
            return "completed";
        case ChunkStatus::OutOfRange:
            return "out-of-range";
        case ChunkStatus::Duplicate:
            return "duplicate";
        case ChunkStatus::BadOffset:
            return "bad-offset";
    }
    return "?";
}

FrameAssembler::FrameAssembler(const Header &first, std::size_t chunk_payload,
                               Clock::time_point now)
    : frame_id_(first.frame_id),
      width_(first.width),
      height_(first.height),
      chunks_total_(first.chunks_total),
      chunk_payload_(chunk_payload),
      buffer_(first.frame_size),
      have_(first.chunks_total, false),
      last_update_(now)
{
}

bool FrameAssembler::has_chunk(std::uint16_t chunk_id) const
{
    return chunk_id < chunks_total_ && have_[chunk_id];
}

bool FrameAssembler::add_chunk(std::uint16_t       chunk_id,
                               const std::uint8_t *payload,
                               std::size_t         len,
                               Clock::time_point   now)
{
    if (chunk_id >= chunks_total_)
    {
        LOG_WARN("frame %u: chunk %u >= chunks_total %u, dropped", frame_id_,
                 static_cast<unsigned>(chunk_id), static_cast<unsigned>(chunks_total_));
        last_status_ = ChunkStatus::OutOfRange;
        return false;
    }
    if (have_[chunk_id])
    {
        LOG_DEBUG("frame %u: duplicate chunk %u", frame_id_, static_cast<unsigned>(chunk_id));
        last_status_ = ChunkStatus::Duplicate;
        return false;
    }

    const std::size_t offset = static_cast<std::size_t>(chunk_id) * chunk_payload_;
    if (offset >= buffer_.size())
    {
        LOG_WARN("frame %u: chunk %u offset %zu >= frame size %zu, dropped", frame_id_,
                 static_cast<unsigned>(chunk_id), offset, buffer_.size());
        last_status_ = ChunkStatus::BadOffset;
        return false;
    }

    // the last chunk is short; an oversized claim is clipped to the buffer
    const std::size_t n = std::min(len, buffer_.size() - offset);
    if (n < len)
        LOG_DEBUG("frame %u: chunk %u copying %zu/%zu bytes", frame_id_,
                  static_cast<unsigned>(chunk_id), n, len);
    if (n)
        std::memcpy(buffer_.data() + offset, payload, n);

    have_[chunk_id] = true;
    received_++;
    last_update_ = now;

    // completion counts chunks, not bytes written
    last_status_ = complete() ? ChunkStatus::Completed : ChunkStatus::Accepted;
    return complete();
}

FrameReassembler::FrameReassembler(ReassemblerConfig cfg) : cfg_(cfg) {}

std::optional<CompletedFrame> FrameReassembler::push(const Header       &hdr,
                                                     const std::uint8_t *payload,
                                                     std::size_t         len,
                                                     Clock::time_point   now)
{
    auto it = frames_.find(hdr.frame_id);
    if (it == frames_.end())
    {
        if (hdr.frame_size == 0 || hdr.chunks_total == 0)
        {
            LOG_WARN("frame %u: refusing assembly (frame_size=%u chunks_total=%u)", hdr.frame_id,
                     hdr.frame_size, static_cast<unsigned>(hdr.chunks_total));
            stats_.refused++;
            return std::nullopt;
        }
        if (hdr.frame_size > cfg_.max_frame_bytes)
        {
            LOG_WARN("frame %u: frame_size %u above limit %zu, refusing assembly", hdr.frame_id,
                     hdr.frame_size, cfg_.max_frame_bytes);
            stats_.refused++;
            return std::nullopt;
        }
        // dimensions and sizes of this first chunk hold for the whole frame
        it = frames_.emplace(hdr.frame_id, FrameAssembler(hdr, cfg_.chunk_payload, now)).first;
        stats_.opened++;
        LOG_DEBUG("frame %u: opened (%u bytes, %u chunks, %ux%u), %zu in flight", hdr.frame_id,
                  hdr.frame_size, static_cast<unsigned>(hdr.chunks_total),
                  static_cast<unsigned>(hdr.width), static_cast<unsigned>(hdr.height),
                  frames_.size());
    }

    FrameAssembler &fa = it->second;
    if (!fa.add_chunk(hdr.chunk_id, payload, len, now))
    {
        switch (fa.last_status())
        {
            case ChunkStatus::Duplicate:
                stats_.duplicates++;
                break;
            case ChunkStatus::OutOfRange:
            case ChunkStatus::BadOffset:
                stats_.rejected++;
                break;
            default:
                break;
        }
        return std::nullopt;
    }

    CompletedFrame done;
    done.frame_id     = fa.frame_id();
    done.width        = fa.width();
    done.height       = fa.height();
    done.chunks_total = fa.chunks_total();
    done.bytes        = fa.take_bytes();
    frames_.erase(it);
    stats_.completed++;
    return done;
}

std::size_t FrameReassembler::gc(std::chrono::milliseconds max_age, Clock::time_point now)
{
    if (frames_.size() <= cfg_.max_frames)
        return 0;

    std::size_t dropped = 0;
    for (auto it = frames_.begin(); it != frames_.end();)
    {
        if (now - it->second.last_update() > max_age)
        {
            LOG_DEBUG("frame %u: evicted with %zu/%u chunks", it->first, it->second.received(),
                      static_cast<unsigned>(it->second.chunks_total()));
            it = frames_.erase(it);
            dropped++;
        }
        else
        {
            ++it;
        }
    }
    stats_.evicted += dropped;
    return dropped;
}

const FrameAssembler *FrameReassembler::find(std::uint32_t frame_id) const
{
    auto it = frames_.find(frame_id);
    return it == frames_.end() ? nullptr : &it->second;
}

}  // namespace proto
