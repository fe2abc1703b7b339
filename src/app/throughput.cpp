#include "app/throughput.hpp"

namespace app
{

std::optional<double> ThroughputTracker::record(std::uint64_t now_ms)
{
    if (!started_)
    {
        started_      = true;
        window_start_ = now_ms;
    }
    count_++;

    // clock stepped backwards: keep counting into the current window
    if (now_ms < window_start_)
        return std::nullopt;

    const std::uint64_t elapsed = now_ms - window_start_;
    if (elapsed < WINDOW_MS)
        return std::nullopt;

    rate_         = static_cast<double>(count_) * 1000.0 / static_cast<double>(elapsed);
    count_        = 0;
    window_start_ = now_ms;
    return rate_;
}

void ThroughputTracker::reset()
{
    started_      = false;
    window_start_ = 0;
    count_        = 0;
    rate_         = 0.0;
}

}  // namespace app
