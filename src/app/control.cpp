#include <cstdio>

#include "app/control.hpp"
#include "util/log.hpp"

namespace app
{

std::string format_stats(const StreamStats &s)
{
    char buf[512];
    std::snprintf(buf, sizeof(buf),
                  "datagrams=%llu foreign=%llu frames=%llu evicted=%llu rejected=%llu "
                  "duplicates=%llu refused=%llu sink_errors=%llu in_flight=%zu fps=%.1f",
                  (unsigned long long)s.datagrams, (unsigned long long)s.foreign,
                  (unsigned long long)s.frames, (unsigned long long)s.evicted,
                  (unsigned long long)s.rejected, (unsigned long long)s.duplicates,
                  (unsigned long long)s.refused, (unsigned long long)s.sink_errors, s.in_flight,
                  s.fps);
    return buf;
}

std::string handle_command(StreamService &svc, const std::string &line)
{
    if (line == "STATS")
    {
        std::string out = format_stats(svc.stats());
        LOG_SYSTEM("[STATS] %s", out.c_str());
        return out;
    }
    if (line == "RESET")
    {
        svc.reset();
        LOG_SYSTEM("[RESET] in-flight frames dropped");
        return "OK";
    }
    if (line == "DUMP on" || line == "DUMP off")
    {
        const bool on = (line == "DUMP on");
        svc.set_dump(on);
        LOG_SYSTEM("[DUMP] %s", on ? "enabled" : "disabled");
        return "OK";
    }
    if (line == "QUIT")
    {
        LOG_INFO("Received QUIT command, exiting...");
        return "OK";
    }
    LOG_WARN("CMD: unknown command '%s'", line.c_str());
    return "ERR unknown command";
}

}  // namespace app
