#include <chrono>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <vector>

#include "app/stream_service.hpp"
#include "proto/myir.hpp"
#include "sink/frame_sink.hpp"
#include "transport/udp_transport.hpp"

using namespace std::chrono_literals;
using namespace transport;

namespace
{

Settings receiver_settings()
{
    Settings s{};
    s.bind_addr = "127.0.0.1";
    s.port      = 0;
    return s;
}

Settings sender_settings(std::uint16_t peer_port)
{
    Settings s{};
    s.bind_addr = "127.0.0.1";
    s.port      = 0;
    s.peer_addr = "127.0.0.1";
    s.peer_port = peer_port;
    return s;
}

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds limit = 2000ms)
{
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

}  // namespace

TEST(Udp, DatagramBoundariesPreserved)
{
    std::mutex         mu;
    std::vector<Frame> got;

    UdpTransport rx;
    ASSERT_TRUE(rx.start(receiver_settings(), [&](const Frame &f) {
        std::lock_guard<std::mutex> lk(mu);
        got.push_back(f);
    }));
    ASSERT_NE(rx.local_port(), 0u);
    EXPECT_TRUE(rx.link_ready());
    EXPECT_EQ(rx.name(), "udp");

    UdpTransport tx;
    ASSERT_TRUE(tx.start(sender_settings(rx.local_port()), nullptr));

    const Frame a(100, 0x11);
    const Frame b(3000, 0x22);
    ASSERT_TRUE(tx.send(a));
    ASSERT_TRUE(tx.send(b));

    ASSERT_TRUE(wait_until([&] {
        std::lock_guard<std::mutex> lk(mu);
        return got.size() == 2;
    }));
    {
        std::lock_guard<std::mutex> lk(mu);
        EXPECT_EQ(got[0], a);
        EXPECT_EQ(got[1], b);
    }
    EXPECT_EQ(rx.rx_datagrams(), 2u);

    tx.stop();
    rx.stop();
    EXPECT_FALSE(rx.link_ready());
}

TEST(Udp, SendNeedsPeer)
{
    UdpTransport t;
    ASSERT_TRUE(t.start(receiver_settings(), nullptr));
    EXPECT_FALSE(t.send(Frame{1, 2, 3}));
    t.stop();
    EXPECT_FALSE(t.send(Frame{1, 2, 3}));
}

TEST(Udp, RejectsBadAddresses)
{
    UdpTransport t;
    Settings     s = receiver_settings();
    s.bind_addr    = "localhost";
    EXPECT_FALSE(t.start(s, nullptr));

    Settings p = sender_settings(0);
    EXPECT_FALSE(t.start(p, nullptr));
    EXPECT_FALSE(t.link_ready());
}

TEST(Udp, RestartAfterStop)
{
    UdpTransport t;
    ASSERT_TRUE(t.start(receiver_settings(), nullptr));
    EXPECT_FALSE(t.start(receiver_settings(), nullptr));
    t.stop();
    ASSERT_TRUE(t.start(receiver_settings(), nullptr));
    t.stop();
}

// end to end: chunked frame over real sockets into the stream service
TEST(Udp, StreamServiceReassemblesOverSockets)
{
    struct CountingSink : sink::FrameSink
    {
        std::mutex                mu;
        std::vector<std::uint8_t> last;
        int                       frames = 0;
        bool                      consume(const proto::CompletedFrame &f) override
        {
            std::lock_guard<std::mutex> lk(mu);
            last = f.bytes;
            frames++;
            return true;
        }
    } snk;

    UdpTransport       rx;
    app::StreamService svc(rx, snk, {}, {});
    ASSERT_TRUE(svc.start(receiver_settings()));

    UdpTransport tx;
    ASSERT_TRUE(tx.start(sender_settings(rx.local_port()), nullptr));

    std::vector<std::uint8_t> frame(70000);
    for (std::size_t i = 0; i < frame.size(); ++i)
        frame[i] = static_cast<std::uint8_t>(i * 13);
    const proto::WireConfig wire{};
    auto                    chunks = proto::make_chunks(42, 320, 240, 0, frame, wire);
    ASSERT_EQ(chunks.size(), 3u);
    for (auto idx : {2, 1, 0})
        ASSERT_TRUE(tx.send(proto::serialize(chunks[idx], wire)));

    ASSERT_TRUE(wait_until([&] {
        std::lock_guard<std::mutex> lk(snk.mu);
        return snk.frames == 1;
    }));
    {
        std::lock_guard<std::mutex> lk(snk.mu);
        EXPECT_EQ(snk.last, frame);
    }
    EXPECT_EQ(svc.stats().datagrams, 3u);

    tx.stop();
    svc.stop();
}
