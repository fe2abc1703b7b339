#include <chrono>
#include <cstdint>
#include <optional>
#include <utility>

#include "app/stream_service.hpp"
#include "util/log.hpp"

namespace app
{

static std::uint64_t to_ms(proto::Clock::time_point t)
{
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count());
}

StreamService::StreamService(transport::ITransport   &t,
                             sink::FrameSink         &sink,
                             proto::WireConfig        wire,
                             proto::ReassemblerConfig reassembly)
    : tx_(t), sink_(sink), parser_(wire), rx_(reassembly)
{
}

bool StreamService::start(const transport::Settings &s)
{
    // a restart begins from an empty table
    stop();

    bool ok = tx_.start(s, [this](const transport::Frame &f) { this->on_rx(f); });
    if (!ok)
    {
        LOG_ERROR("transport %s failed to start", tx_.name().c_str());
        return false;
    }
    started_ = true;
    LOG_INFO("receiving on %s (header %zuB, chunk payload %zu, max_frames %zu, max_age %lldms)",
             tx_.name().c_str(), parser_.config().header_size(), parser_.config().chunk_payload,
             rx_.config().max_frames, static_cast<long long>(rx_.config().max_age.count()));
    return true;
}

void StreamService::stop()
{
    if (started_)
    {
        tx_.stop();
        started_ = false;
    }
    reset();
}

void StreamService::reset()
{
    std::lock_guard<std::mutex> lk(mu_);
    if (rx_.size())
        LOG_INFO("discarding %zu in-flight frames", rx_.size());
    rx_.clear();
    fps_.reset();
}

void StreamService::set_on_rate(OnRate cb)
{
    std::lock_guard<std::mutex> lk(mu_);
    on_rate_ = std::move(cb);
}

void StreamService::on_rx(const transport::Frame &datagram)
{
    const auto now = proto::Clock::now();

    std::optional<proto::CompletedFrame> done;
    bool                                 dump = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        counters_.datagrams++;

        auto d = parser_.parse(datagram);
        if (!d)
        {
            // not MYIR: opaque to us
            counters_.foreign++;
            LOG_DEBUG("ignoring non-protocol datagram (%zu bytes)", datagram.size());
            return;
        }

        done = rx_.push(*d, now);
        if (done)
        {
            counters_.frames++;
            dump = dump_enabled_.load(std::memory_order_relaxed);
        }

        const std::size_t evicted = rx_.gc(now);
        if (evicted)
            LOG_INFO("evicted %zu stale frames, %zu in flight", evicted, rx_.size());
    }

    if (done)
        deliver(*done, dump, now);
}

void StreamService::deliver(const proto::CompletedFrame &frame,
                            bool                         dump,
                            proto::Clock::time_point     now)
{
    LOG_DEBUG("[FRAME] id=%u %ux%u %zu bytes in %u chunks", frame.frame_id,
              static_cast<unsigned>(frame.width), static_cast<unsigned>(frame.height),
              frame.bytes.size(), static_cast<unsigned>(frame.chunks_total));

    if (dump && !sink_.consume(frame))
    {
        LOG_WARN("sink %s rejected frame %u", sink_.name().c_str(), frame.frame_id);
        std::lock_guard<std::mutex> lk(mu_);
        counters_.sink_errors++;
    }

    std::optional<double> rate;
    OnRate                cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        rate = fps_.record(to_ms(now));
        if (rate)
            cb = on_rate_;
    }
    if (rate)
    {
        LOG_INFO("[FPS] %.1f (%ux%u)", *rate, static_cast<unsigned>(frame.width),
                 static_cast<unsigned>(frame.height));
        if (cb)
            cb(*rate);
    }
}

StreamStats StreamService::stats() const
{
    std::lock_guard<std::mutex> lk(mu_);
    StreamStats                 s = counters_;
    const auto                 &r = rx_.stats();
    s.evicted                     = r.evicted;
    s.rejected                    = r.rejected;
    s.duplicates                  = r.duplicates;
    s.refused                     = r.refused;
    s.in_flight                   = rx_.size();
    s.fps                         = fps_.rate();
    return s;
}

}  // namespace app
