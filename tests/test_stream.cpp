#include <chrono>
#include <functional>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

#include "app/control.hpp"
#include "app/stream_service.hpp"
#include "proto/myir.hpp"
#include "sink/frame_sink.hpp"
#include "transport/loopback_transport.hpp"

namespace
{

// Keeps every frame it is handed
struct CapturingSink : public sink::FrameSink
{
    std::vector<proto::CompletedFrame> frames;
    bool                               fail = false;

    bool consume(const proto::CompletedFrame &f) override
    {
        if (fail)
            return false;
        frames.push_back(f);
        return true;
    }
    std::string name() const override { return "capture"; }
};

// Runs a hook for every frame, for sinks that call back into the service
struct HookSink : public sink::FrameSink
{
    std::function<void()> hook;
    int                   frames = 0;

    bool consume(const proto::CompletedFrame &) override
    {
        frames++;
        if (hook)
            hook();
        return true;
    }
};

std::vector<std::uint8_t> gen_jpeg_like(std::size_t n, std::uint8_t seed)
{
    std::vector<std::uint8_t> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>((i * 7 + seed) & 0xFF);
    if (n >= 2)
    {
        v[0] = 0xFF;
        v[1] = 0xD8;
    }
    return v;
}

transport::Settings loopback_settings()
{
    transport::Settings s{};
    s.bind_addr = "127.0.0.1";
    return s;
}

// Chunks and sends one frame in the given chunk order
void send_frame(transport::LoopbackTransport    &t,
                std::uint32_t                    frame_id,
                const std::vector<std::uint8_t> &bytes,
                const std::vector<std::size_t>  &order,
                const proto::WireConfig         &wire = {})
{
    auto chunks = proto::make_chunks(frame_id, 640, 480, 0, bytes, wire);
    ASSERT_FALSE(chunks.empty());
    for (std::size_t i : order)
    {
        ASSERT_LT(i, chunks.size());
        ASSERT_TRUE(t.send(proto::serialize(chunks[i], wire)));
    }
}

}  // namespace

TEST(StreamService, DeliversFrameOutOfOrder)
{
    transport::LoopbackTransport t;
    CapturingSink                sink;
    app::StreamService           svc(t, sink, {}, {});
    ASSERT_TRUE(svc.start(loopback_settings()));

    const auto frame = gen_jpeg_like(70000, 1);
    send_frame(t, 7, frame, {2, 0, 1});

    ASSERT_EQ(sink.frames.size(), 1u);
    EXPECT_EQ(sink.frames[0].frame_id, 7u);
    EXPECT_EQ(sink.frames[0].width, 640u);
    EXPECT_EQ(sink.frames[0].height, 480u);
    EXPECT_EQ(sink.frames[0].bytes, frame);
    EXPECT_EQ(sink::fingerprint(sink.frames[0].bytes), sink::fingerprint(frame));

    auto st = svc.stats();
    EXPECT_EQ(st.datagrams, 3u);
    EXPECT_EQ(st.frames, 1u);
    EXPECT_EQ(st.in_flight, 0u);
    svc.stop();
}

TEST(StreamService, LegacyHeaderVariant)
{
    proto::WireConfig wire{};
    wire.variant = proto::HeaderVariant::Legacy;

    transport::LoopbackTransport t;
    CapturingSink                sink;
    app::StreamService           svc(t, sink, wire, {});
    ASSERT_TRUE(svc.start(loopback_settings()));

    const auto frame = gen_jpeg_like(40000, 2);
    send_frame(t, 1, frame, {1, 0}, wire);

    ASSERT_EQ(sink.frames.size(), 1u);
    EXPECT_EQ(sink.frames[0].bytes, frame);
}

TEST(StreamService, ForeignDatagramsAreCountedAndIgnored)
{
    transport::LoopbackTransport t;
    CapturingSink                sink;
    app::StreamService           svc(t, sink, {}, {});
    ASSERT_TRUE(svc.start(loopback_settings()));

    const std::string         text = "just a text message";
    std::vector<std::uint8_t> tv(text.begin(), text.end());
    ASSERT_TRUE(t.send(tv));
    ASSERT_TRUE(t.send(std::vector<std::uint8_t>{0x4D, 0x59}));

    const auto frame = gen_jpeg_like(100, 3);
    send_frame(t, 2, frame, {0});

    auto st = svc.stats();
    EXPECT_EQ(st.datagrams, 3u);
    EXPECT_EQ(st.foreign, 2u);
    EXPECT_EQ(st.frames, 1u);
    ASSERT_EQ(sink.frames.size(), 1u);
}

TEST(StreamService, InterleavedFrames)
{
    transport::LoopbackTransport t;
    CapturingSink                sink;
    app::StreamService           svc(t, sink, {}, {});
    ASSERT_TRUE(svc.start(loopback_settings()));

    const proto::WireConfig wire{};
    const auto              f1 = gen_jpeg_like(70000, 1);
    const auto              f2 = gen_jpeg_like(33000, 2);
    auto                    c1 = proto::make_chunks(1, 640, 480, 0, f1, wire);
    auto                    c2 = proto::make_chunks(2, 640, 480, 0, f2, wire);
    ASSERT_EQ(c1.size(), 3u);
    ASSERT_EQ(c2.size(), 2u);

    ASSERT_TRUE(t.send(proto::serialize(c1[0], wire)));
    ASSERT_TRUE(t.send(proto::serialize(c2[1], wire)));
    ASSERT_TRUE(t.send(proto::serialize(c1[2], wire)));
    EXPECT_EQ(svc.stats().in_flight, 2u);
    ASSERT_TRUE(t.send(proto::serialize(c2[0], wire)));
    ASSERT_TRUE(t.send(proto::serialize(c1[1], wire)));

    ASSERT_EQ(sink.frames.size(), 2u);
    EXPECT_EQ(sink.frames[0].frame_id, 2u);
    EXPECT_EQ(sink.frames[0].bytes, f2);
    EXPECT_EQ(sink.frames[1].frame_id, 1u);
    EXPECT_EQ(sink.frames[1].bytes, f1);
}

TEST(StreamService, DuplicatesAndRejectsShowInStats)
{
    transport::LoopbackTransport t;
    CapturingSink                sink;
    app::StreamService           svc(t, sink, {}, {});
    ASSERT_TRUE(svc.start(loopback_settings()));

    const proto::WireConfig wire{};
    const auto              frame  = gen_jpeg_like(70000, 4);
    auto                    chunks = proto::make_chunks(5, 640, 480, 0, frame, wire);
    ASSERT_EQ(chunks.size(), 3u);

    // a header that claims chunk 5 of 3 cannot be packed, so patch the wire bytes
    auto bad = proto::serialize(chunks[0], wire);
    ASSERT_FALSE(bad.empty());
    bad[28] = 0x00;
    bad[29] = 0x05;
    ASSERT_TRUE(t.send(bad));

    auto first = proto::serialize(chunks[0], wire);
    ASSERT_TRUE(t.send(first));
    ASSERT_TRUE(t.send(first));
    ASSERT_TRUE(t.send(proto::serialize(chunks[1], wire)));
    ASSERT_TRUE(t.send(proto::serialize(chunks[2], wire)));

    auto st = svc.stats();
    EXPECT_EQ(st.rejected, 1u);
    EXPECT_EQ(st.duplicates, 1u);
    EXPECT_EQ(st.frames, 1u);
    ASSERT_EQ(sink.frames.size(), 1u);
    EXPECT_EQ(sink.frames[0].bytes, frame);
}

TEST(StreamService, ResetDropsInFlight)
{
    transport::LoopbackTransport t;
    CapturingSink                sink;
    app::StreamService           svc(t, sink, {}, {});
    ASSERT_TRUE(svc.start(loopback_settings()));

    const auto frame = gen_jpeg_like(70000, 5);
    send_frame(t, 9, frame, {0, 1});
    EXPECT_EQ(svc.stats().in_flight, 1u);

    svc.reset();
    EXPECT_EQ(svc.stats().in_flight, 0u);

    // the last chunk alone now opens a fresh, incomplete assembly
    send_frame(t, 9, frame, {2});
    EXPECT_TRUE(sink.frames.empty());
    EXPECT_EQ(svc.stats().in_flight, 1u);
}

TEST(StreamService, DumpOffSkipsSink)
{
    transport::LoopbackTransport t;
    CapturingSink                sink;
    app::StreamService           svc(t, sink, {}, {});
    ASSERT_TRUE(svc.start(loopback_settings()));

    svc.set_dump(false);
    EXPECT_FALSE(svc.dump());
    send_frame(t, 1, gen_jpeg_like(100, 1), {0});
    EXPECT_TRUE(sink.frames.empty());
    EXPECT_EQ(svc.stats().frames, 1u);

    svc.set_dump(true);
    send_frame(t, 2, gen_jpeg_like(100, 2), {0});
    EXPECT_EQ(sink.frames.size(), 1u);
}

TEST(StreamService, SinkFailureIsCounted)
{
    transport::LoopbackTransport t;
    CapturingSink                sink;
    sink.fail = true;
    app::StreamService svc(t, sink, {}, {});
    ASSERT_TRUE(svc.start(loopback_settings()));

    send_frame(t, 1, gen_jpeg_like(100, 1), {0});
    auto st = svc.stats();
    EXPECT_EQ(st.frames, 1u);
    EXPECT_EQ(st.sink_errors, 1u);
}

TEST(StreamService, OversizedFrameIsRefused)
{
    proto::ReassemblerConfig rc{};
    rc.max_frame_bytes = 1000;

    transport::LoopbackTransport t;
    CapturingSink                sink;
    app::StreamService           svc(t, sink, {}, rc);
    ASSERT_TRUE(svc.start(loopback_settings()));

    send_frame(t, 1, gen_jpeg_like(2000, 1), {0});
    auto st = svc.stats();
    EXPECT_EQ(st.refused, 1u);
    EXPECT_EQ(st.in_flight, 0u);
}

TEST(StreamService, StopDetachesTransport)
{
    transport::LoopbackTransport t;
    CapturingSink                sink;
    app::StreamService           svc(t, sink, {}, {});
    ASSERT_TRUE(svc.start(loopback_settings()));
    svc.stop();

    const auto chunks = proto::make_chunks(1, 1, 1, 0, gen_jpeg_like(10, 0), {});
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_FALSE(t.send(proto::serialize(chunks[0], {})));
    EXPECT_TRUE(sink.frames.empty());
}

TEST(StreamService, StaleFramesEvictedAboveCapacity)
{
    proto::ReassemblerConfig rc{};
    rc.max_frames = 1;
    rc.max_age    = std::chrono::milliseconds(1);

    transport::LoopbackTransport t;
    CapturingSink                sink;
    app::StreamService           svc(t, sink, {}, rc);
    ASSERT_TRUE(svc.start(loopback_settings()));

    // two partial frames; each stays incomplete
    send_frame(t, 1, gen_jpeg_like(70000, 1), {0});
    send_frame(t, 2, gen_jpeg_like(70000, 2), {0});
    const auto before = svc.stats().in_flight;
    EXPECT_GE(before, 1u);

    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    // any protocol datagram runs gc; frames 1 and 2 are now stale
    send_frame(t, 3, gen_jpeg_like(70000, 3), {0});
    auto st = svc.stats();
    EXPECT_GE(st.evicted, 1u);
    EXPECT_EQ(st.in_flight, 1u);
    EXPECT_TRUE(sink.frames.empty());
}

TEST(StreamService, RateReportedAfterOneSecond)
{
    transport::LoopbackTransport t;
    CapturingSink                sink;
    app::StreamService           svc(t, sink, {}, {});

    std::vector<double> rates;
    svc.set_on_rate([&](double fps) { rates.push_back(fps); });
    ASSERT_TRUE(svc.start(loopback_settings()));

    send_frame(t, 1, gen_jpeg_like(100, 1), {0});
    send_frame(t, 2, gen_jpeg_like(100, 2), {0});
    EXPECT_TRUE(rates.empty());
    EXPECT_DOUBLE_EQ(svc.stats().fps, 0.0);

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    send_frame(t, 3, gen_jpeg_like(100, 3), {0});

    ASSERT_EQ(rates.size(), 1u);
    EXPECT_GT(rates[0], 0.0);
    // three frames over a little more than one second
    EXPECT_LT(rates[0], 3.0);
    EXPECT_GT(svc.stats().fps, 0.0);
    EXPECT_DOUBLE_EQ(svc.stats().fps, rates[0]);
}

TEST(StreamService, CallbacksMayCallBackIntoService)
{
    transport::LoopbackTransport t;
    HookSink                     sink;
    app::StreamService           svc(t, sink, {}, {});

    // both run on the receive path; neither may block on the service lock
    std::uint64_t frames_seen_by_sink = 0;
    sink.hook = [&] { frames_seen_by_sink = svc.stats().frames; };

    int           rate_calls = 0;
    std::uint64_t frames_seen_by_rate = 0;
    svc.set_on_rate([&](double) {
        rate_calls++;
        frames_seen_by_rate = svc.stats().frames;
        svc.set_dump(true);
    });
    ASSERT_TRUE(svc.start(loopback_settings()));

    send_frame(t, 1, gen_jpeg_like(100, 1), {0});
    EXPECT_EQ(frames_seen_by_sink, 1u);

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    send_frame(t, 2, gen_jpeg_like(100, 2), {0});

    EXPECT_EQ(sink.frames, 2);
    EXPECT_EQ(frames_seen_by_sink, 2u);
    EXPECT_EQ(rate_calls, 1);
    EXPECT_EQ(frames_seen_by_rate, 2u);

    // the control path still answers afterwards
    EXPECT_EQ(app::handle_command(svc, "RESET"), "OK");
}

// ---------------------------------------------------------------------------
// Control commands
// ---------------------------------------------------------------------------

TEST(Control, StatsLine)
{
    transport::LoopbackTransport t;
    CapturingSink                sink;
    app::StreamService           svc(t, sink, {}, {});
    ASSERT_TRUE(svc.start(loopback_settings()));
    send_frame(t, 1, gen_jpeg_like(100, 1), {0});

    std::string reply = app::handle_command(svc, "STATS");
    EXPECT_NE(reply.find("datagrams=1 "), std::string::npos);
    EXPECT_NE(reply.find("frames=1 "), std::string::npos);
    EXPECT_NE(reply.find("in_flight=0 "), std::string::npos);
    EXPECT_NE(reply.find("fps="), std::string::npos);
}

TEST(Control, DumpResetQuitAndUnknown)
{
    transport::LoopbackTransport t;
    CapturingSink                sink;
    app::StreamService           svc(t, sink, {}, {});
    ASSERT_TRUE(svc.start(loopback_settings()));

    EXPECT_EQ(app::handle_command(svc, "DUMP off"), "OK");
    EXPECT_FALSE(svc.dump());
    EXPECT_EQ(app::handle_command(svc, "DUMP on"), "OK");
    EXPECT_TRUE(svc.dump());
    EXPECT_EQ(app::handle_command(svc, "RESET"), "OK");
    EXPECT_EQ(app::handle_command(svc, "QUIT"), "OK");
    EXPECT_EQ(app::handle_command(svc, "DUMP maybe"), "ERR unknown command");
    EXPECT_EQ(app::handle_command(svc, "bogus"), "ERR unknown command");
}

TEST(Control, FormatStats)
{
    app::StreamStats s{};
    s.datagrams = 10;
    s.frames    = 3;
    s.fps       = 29.97;
    EXPECT_EQ(app::format_stats(s),
              "datagrams=10 foreign=0 frames=3 evicted=0 rejected=0 duplicates=0 refused=0 "
              "sink_errors=0 in_flight=0 fps=30.0");
}
