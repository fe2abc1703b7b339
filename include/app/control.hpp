#pragma once
#include <string>

#include "app/stream_service.hpp"

namespace app
{

// Control socket commands:
//   STATS          counters as key=value pairs
//   RESET          drop in-flight frames and the rate window
//   DUMP on|off    hand completed frames to the sink or not
//   QUIT           acknowledged here; the IPC server stops after replying
std::string handle_command(StreamService &svc, const std::string &line);

std::string format_stats(const StreamStats &s);

}  // namespace app
