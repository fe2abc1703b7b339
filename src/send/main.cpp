#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "proto/myir.hpp"
#include "transport/udp_transport.hpp"
#include "util/config.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

struct Options
{
    std::string              host    = "127.0.0.1";
    std::uint16_t            port    = constants::DEFAULT_PORT;
    unsigned long            fps     = 10;
    unsigned long            loops   = 1;
    std::uint16_t            width   = 0;
    std::uint16_t            height  = 0;
    bool                     shuffle = false;
    proto::WireConfig        wire{};
    std::vector<std::string> files;
};

void print_usage()
{
    std::fprintf(stderr,
                 "Usage:\n"
                 "  framerx-send [options] <file>...\n"
                 "\n"
                 "Sends each file as one MYIR frame, one chunk per UDP datagram.\n"
                 "\n"
                 "Options:\n"
                 "  --host <ipv4>      receiver address (default 127.0.0.1)\n"
                 "  --port <n>         receiver port (default %u)\n"
                 "  --fps <n>          frames per second, 1..1000 (default 10)\n"
                 "  --loop <n>         send the file list n times (default 1)\n"
                 "  --size <W>x<H>     dimensions written into the header\n"
                 "  --chunk <n>        chunk payload bytes (default %zu, max 65471 or\n"
                 "                     65475 with --legacy)\n"
                 "  --legacy           32-byte header without payload length\n"
                 "  --shuffle          send each frame's chunks in random order\n",
                 static_cast<unsigned>(constants::DEFAULT_PORT), proto::CHUNK_PAYLOAD);
}

bool parse_size(const std::string &s, std::uint16_t &w, std::uint16_t &h)
{
    auto x = s.find('x');
    if (x == std::string::npos)
        return false;
    unsigned long wv = 0, hv = 0;
    if (!config::parse_ulong(s.substr(0, x).c_str(), 0, 65535, wv) ||
        !config::parse_ulong(s.substr(x + 1).c_str(), 0, 65535, hv))
        return false;
    w = static_cast<std::uint16_t>(wv);
    h = static_cast<std::uint16_t>(hv);
    return true;
}

// returns exitc::ok or the code to exit with
int parse_args(int argc, char **argv, Options &o)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string   a = argv[i];
        unsigned long v = 0;
        auto          next = [&]() -> const char * { return (i + 1 < argc) ? argv[++i] : nullptr; };

        if (a == "--help" || a == "-h")
        {
            print_usage();
            std::exit(exitc::ok);
        }
        else if (a == "--host")
        {
            const char *h = next();
            if (!h)
                return exitc::bad_args;
            o.host = h;
        }
        else if (a == "--port")
        {
            if (!config::parse_ulong(next(), 1, 65535, v))
                return exitc::bad_args;
            o.port = static_cast<std::uint16_t>(v);
        }
        else if (a == "--fps")
        {
            if (!config::parse_ulong(next(), 1, 1000, o.fps))
                return exitc::bad_args;
        }
        else if (a == "--loop")
        {
            if (!config::parse_ulong(next(), 1, 1000000, o.loops))
                return exitc::bad_args;
        }
        else if (a == "--size")
        {
            const char *s = next();
            if (!s || !parse_size(s, o.width, o.height))
                return exitc::bad_args;
        }
        else if (a == "--chunk")
        {
            if (!config::parse_ulong(next(), 1, proto::MAX_DATAGRAM, v))
                return exitc::bad_args;
            o.wire.chunk_payload = v;
        }
        else if (a == "--legacy")
        {
            o.wire.variant = proto::HeaderVariant::Legacy;
        }
        else if (a == "--shuffle")
        {
            o.shuffle = true;
        }
        else if (!a.empty() && a[0] == '-')
        {
            std::fprintf(stderr, "error: unknown option %s\n", a.c_str());
            return exitc::bad_args;
        }
        else
        {
            o.files.push_back(std::move(a));
        }
    }
    // checked once --legacy is known
    if (o.wire.chunk_payload > o.wire.max_chunk_payload())
    {
        std::fprintf(stderr, "error: --chunk %zu does not fit a datagram (max %zu)\n",
                     o.wire.chunk_payload, o.wire.max_chunk_payload());
        return exitc::bad_args;
    }
    return o.files.empty() ? exitc::bad_args : exitc::ok;
}

bool read_file(const std::string &path, std::vector<std::uint8_t> &out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

}  // namespace

int main(int argc, char **argv)
{
    if (const char *log_level = std::getenv("FRAMERX_LOG_LEVEL"))
        framerx::set_log_level_by_name(log_level);

    Options o;
    if (int rc = parse_args(argc, argv, o); rc != exitc::ok)
    {
        print_usage();
        return rc;
    }

    std::vector<std::vector<std::uint8_t>> frames;
    for (const auto &f : o.files)
    {
        std::vector<std::uint8_t> bytes;
        if (!read_file(f, bytes) || bytes.empty())
        {
            std::fprintf(stderr, "error: cannot read %s\n", f.c_str());
            return exitc::io_error;
        }
        frames.push_back(std::move(bytes));
    }

    transport::Settings s{};
    s.bind_addr = "0.0.0.0";
    s.port      = 0;
    s.peer_addr = o.host;
    s.peer_port = o.port;

    transport::UdpTransport tx;
    if (!tx.start(s, nullptr))
        return exitc::start_failed;

    std::mt19937  rng(std::random_device{}());
    const auto    period   = std::chrono::microseconds(1000000 / o.fps);
    auto          due      = std::chrono::steady_clock::now();
    std::uint32_t frame_id = 0;
    std::size_t   sent     = 0;

    for (unsigned long loop = 0; loop < o.loops; ++loop)
    {
        for (const auto &bytes : frames)
        {
            const auto pts = static_cast<std::uint64_t>(
                std::chrono::duration_cast<std::chrono::microseconds>(
                    std::chrono::system_clock::now().time_since_epoch())
                    .count());
            auto chunks = proto::make_chunks(frame_id, o.width, o.height, pts, bytes, o.wire);
            if (chunks.empty())
            {
                tx.stop();
                return exitc::failure;
            }
            if (o.shuffle)
                std::shuffle(chunks.begin(), chunks.end(), rng);

            for (const auto &c : chunks)
            {
                auto datagram = proto::serialize(c, o.wire);
                if (datagram.empty() || !tx.send(datagram))
                {
                    LOG_ERROR("frame %u chunk %u: send failed", frame_id,
                              static_cast<unsigned>(c.hdr.chunk_id));
                    tx.stop();
                    return exitc::io_error;
                }
            }
            LOG_DEBUG("frame %u: %zu bytes in %zu chunks", frame_id, bytes.size(), chunks.size());
            frame_id++;
            sent++;

            due += period;
            std::this_thread::sleep_until(due);
        }
    }

    tx.stop();
    LOG_INFO("sent %zu frames to %s:%u", sent, o.host.c_str(), static_cast<unsigned>(o.port));
    return exitc::ok;
}
