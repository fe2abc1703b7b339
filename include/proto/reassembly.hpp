#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "proto/myir.hpp"

namespace proto
{

using Clock = std::chrono::steady_clock;

// A finished frame. bytes.size() is exactly the frame_size announced by the
// chunk that opened the assembly.
struct CompletedFrame
{
    std::uint32_t             frame_id{0};
    std::uint16_t             width{0};
    std::uint16_t             height{0};
    std::uint16_t             chunks_total{0};
    std::vector<std::uint8_t> bytes;
};

enum class ChunkStatus
{
    Accepted,
    Completed,
    OutOfRange,  // chunk_id >= chunks_total
    Duplicate,
    BadOffset    // chunk_id * chunk_payload lands past the buffer
};

const char *chunk_status_name(ChunkStatus s);

// Reconstruction state for one frame id. Buffer and received flags are sized
// once from the opening header and never resized.
class FrameAssembler
{
  public:
    FrameAssembler(const Header &first, std::size_t chunk_payload, Clock::time_point now);

    // true once every chunk index in [0, chunks_total) has been seen.
    // Rejected chunks leave the assembler untouched; last_status() says why.
    bool add_chunk(std::uint16_t       chunk_id,
                   const std::uint8_t *payload,
                   std::size_t         len,
                   Clock::time_point   now = Clock::now());
    bool add_chunk(std::uint16_t chunk_id, const std::vector<std::uint8_t> &payload,
                   Clock::time_point now = Clock::now())
    {
        return add_chunk(chunk_id, payload.data(), payload.size(), now);
    }

    bool complete() const { return received_ == chunks_total_; }

    const std::vector<std::uint8_t> &frame_bytes() const { return buffer_; }
    std::vector<std::uint8_t>        take_bytes() { return std::move(buffer_); }

    std::uint32_t     frame_id() const { return frame_id_; }
    std::uint16_t     width() const { return width_; }
    std::uint16_t     height() const { return height_; }
    std::uint16_t     chunks_total() const { return chunks_total_; }
    std::size_t       received() const { return received_; }
    bool              has_chunk(std::uint16_t chunk_id) const;
    Clock::time_point last_update() const { return last_update_; }
    ChunkStatus       last_status() const { return last_status_; }

  private:
    std::uint32_t             frame_id_{0};
    std::uint16_t             width_{0};
    std::uint16_t             height_{0};
    std::uint16_t             chunks_total_{0};
    std::size_t               chunk_payload_{CHUNK_PAYLOAD};
    std::vector<std::uint8_t> buffer_;  // size == frame_size
    std::vector<bool>         have_;    // size == chunks_total
    std::size_t               received_{0};
    Clock::time_point         last_update_{};
    ChunkStatus               last_status_{ChunkStatus::Accepted};
};

struct ReassemblerConfig
{
    std::size_t               max_frames      = 8;  // gc only scans above this
    std::chrono::milliseconds max_age         = std::chrono::milliseconds(1000);
    std::size_t               max_frame_bytes = 32u * 1024u * 1024u;
    std::size_t               chunk_payload   = CHUNK_PAYLOAD;
};

struct ReassemblerStats
{
    std::uint64_t opened     = 0;
    std::uint64_t completed  = 0;
    std::uint64_t evicted    = 0;
    std::uint64_t rejected   = 0;  // out of range or bad offset
    std::uint64_t duplicates = 0;
    std::uint64_t refused    = 0;  // opening header unusable, no assembly created
};

// Table of in-flight frames keyed by frame id. Single writer, no locking.
class FrameReassembler
{
  public:
    explicit FrameReassembler(ReassemblerConfig cfg = {});

    // Route one chunk. Returns the frame (and drops it from the table) when
    // this chunk completed it.
    std::optional<CompletedFrame> push(const Header       &hdr,
                                       const std::uint8_t *payload,
                                       std::size_t         len,
                                       Clock::time_point   now = Clock::now());
    std::optional<CompletedFrame> push(const Datagram &d, Clock::time_point now = Clock::now())
    {
        return push(d.hdr, d.payload, d.payload_len, now);
    }

    // No-op while size() <= max_frames. Above it, drops every assembly idle
    // for longer than max_age. Returns the number dropped.
    std::size_t gc(std::chrono::milliseconds max_age, Clock::time_point now = Clock::now());
    std::size_t gc(Clock::time_point now = Clock::now()) { return gc(cfg_.max_age, now); }

    void clear() { frames_.clear(); }

    std::size_t              size() const { return frames_.size(); }
    const FrameAssembler    *find(std::uint32_t frame_id) const;
    const ReassemblerConfig &config() const { return cfg_; }
    const ReassemblerStats  &stats() const { return stats_; }

  private:
    ReassemblerConfig                                 cfg_;
    std::unordered_map<std::uint32_t, FrameAssembler> frames_;
    ReassemblerStats                                  stats_{};
};

}  // namespace proto
