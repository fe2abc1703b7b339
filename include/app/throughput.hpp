#pragma once
#include <cstdint>
#include <optional>

namespace app
{

// Completed-frame rate over back-to-back windows of at least WINDOW_MS.
class ThroughputTracker
{
  public:
    static constexpr std::uint64_t WINDOW_MS = 1000;

    // Count one completion at now_ms. Returns the new rate when this event
    // closes a window; rate() keeps the previous value otherwise.
    std::optional<double> record(std::uint64_t now_ms);

    double rate() const { return rate_; }
    void   reset();

  private:
    bool          started_{false};
    std::uint64_t window_start_{0};
    std::uint64_t count_{0};
    double        rate_{0.0};
};

}  // namespace app
