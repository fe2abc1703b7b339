#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>

#include "app/throughput.hpp"
#include "proto/myir.hpp"
#include "proto/reassembly.hpp"
#include "sink/frame_sink.hpp"
#include "transport/itransport.hpp"

namespace app
{

struct StreamStats
{
    std::uint64_t datagrams   = 0;
    std::uint64_t foreign     = 0;  // failed header parse
    std::uint64_t frames      = 0;
    std::uint64_t sink_errors = 0;
    std::uint64_t evicted     = 0;
    std::uint64_t rejected    = 0;
    std::uint64_t duplicates  = 0;
    std::uint64_t refused     = 0;
    std::size_t   in_flight   = 0;
    double        fps         = 0.0;
};

// transport -> parse -> reassemble -> sink, plus the frame rate
class StreamService
{
  public:
    using OnRate = std::function<void(double fps)>;

    StreamService(transport::ITransport    &t,
                  sink::FrameSink          &sink,
                  proto::WireConfig         wire,
                  proto::ReassemblerConfig  reassembly);
    ~StreamService() { stop(); }

    bool start(const transport::Settings &s);
    void stop();  // also drops in-flight frames and the rate window
    void on_rx(const transport::Frame &datagram);

    void        reset();
    StreamStats stats() const;

    void set_dump(bool on) { dump_enabled_.store(on, std::memory_order_relaxed); }
    bool dump() const { return dump_enabled_.load(std::memory_order_relaxed); }
    // The sink and the rate callback run on the transport thread without the
    // service lock held, so they may call stats(), reset() or set_dump().
    void set_on_rate(OnRate cb);

  private:
    // runs without mu_ held; takes it only for the counters and the tracker
    void deliver(const proto::CompletedFrame &frame, bool dump, proto::Clock::time_point now);

    transport::ITransport  &tx_;
    sink::FrameSink        &sink_;
    proto::HeaderParser     parser_;
    // guards everything below: on_rx runs on the transport thread,
    // stats/reset on the control thread
    mutable std::mutex      mu_;
    proto::FrameReassembler rx_;
    ThroughputTracker       fps_;
    StreamStats             counters_{};
    OnRate                  on_rate_{};
    std::atomic<bool>       dump_enabled_{true};
    bool                    started_{false};
};

}  // namespace app
