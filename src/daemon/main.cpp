#include <cstdlib>
#include <memory>
#include <string>

#include "app/control.hpp"
#include "app/stream_service.hpp"
#include "ctl/ipc.hpp"
#include "sink/frame_sink.hpp"
#include "transport/loopback_transport.hpp"
#include "transport/udp_transport.hpp"
#include "util/config.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

#if FRAMERX_HAVE_SYSTEMD
#include <systemd/sd-daemon.h>
#endif

static std::unique_ptr<transport::ITransport> make_transport(const config::Config &cfg)
{
    if (cfg.transport_name == "loopback")
        return std::make_unique<transport::LoopbackTransport>();
    return std::make_unique<transport::UdpTransport>();
}

static std::unique_ptr<sink::FrameSink> make_sink(const config::Config &cfg)
{
    if (cfg.out_dir.empty())
    {
        LOG_INFO("FRAMERX_OUT_DIR not set, frames are counted only");
        return std::make_unique<sink::NullSink>();
    }
    auto dir = std::make_unique<sink::DirectorySink>(cfg.out_dir, cfg.keep);
    if (!dir->open())
        return nullptr;
    return dir;
}

// systemd service notifications; no-ops outside a unit
static void notify(const char *state)
{
#if FRAMERX_HAVE_SYSTEMD
    int r = sd_notify(0, state);
    if (r < 0)
        LOG_DEBUG("sd_notify(%s) failed: %d", state, r);
#else
    (void)state;
#endif
}

static void notify_rate(double fps)
{
#if FRAMERX_HAVE_SYSTEMD
    (void)sd_notifyf(0, "STATUS=Receiving %.1f fps", fps);
#else
    (void)fps;
#endif
}

int main()
{
    // log level first so config warnings respect it
    if (const char *log_level = std::getenv("FRAMERX_LOG_LEVEL"))
        framerx::set_log_level_by_name(log_level);

    const config::Config cfg = config::load_from_env();
    LOG_SYSTEM("Config: transport=%s bind=%s:%u header=%s chunk=%zu max_frames=%zu "
               "max_age=%lldms out=%s",
               cfg.transport_name.c_str(), cfg.bind_addr.c_str(), static_cast<unsigned>(cfg.port),
               cfg.variant == proto::HeaderVariant::Extended ? "ext" : "legacy",
               cfg.chunk_payload, cfg.max_frames, static_cast<long long>(cfg.max_age.count()),
               cfg.out_dir.empty() ? "(none)" : cfg.out_dir.c_str());

    auto tx   = make_transport(cfg);
    auto sink = make_sink(cfg);
    if (!sink)
    {
        LOG_ERROR("cannot open output directory %s", cfg.out_dir.c_str());
        return exitc::io_error;
    }

    app::StreamService svc(*tx, *sink, cfg.wire(), cfg.reassembly());
    svc.set_on_rate(&notify_rate);
    if (!svc.start(cfg.settings()))
    {
        LOG_ERROR("StreamService start failed");
        return exitc::start_failed;
    }
    notify("READY=1");

    // IPC server, blocks until QUIT
    auto on_line = [&svc](const std::string &line) { return app::handle_command(svc, line); };
    bool ok      = ipc::start_server(cfg.ctl_sock, on_line);

    notify("STOPPING=1");
    svc.stop();
    if (!ok)
    {
        LOG_ERROR("start_server failed");
        return exitc::failure;
    }
    return exitc::ok;
}
