#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

#include "proto/reassembly.hpp"

namespace sink
{

constexpr std::size_t FINGERPRINT_BYTES = 16;  // crypto_generichash_BYTES_MIN

// BLAKE2b-128 of the bytes as lowercase hex; empty string if libsodium fails
std::string fingerprint(const std::vector<std::uint8_t> &bytes);

// Consumer of completed frames. Bytes are handed over as received: no decode.
class FrameSink
{
  public:
    virtual ~FrameSink() = default;

    virtual bool        consume(const proto::CompletedFrame &f) = 0;
    virtual std::string name() const { return ""; }
};

class NullSink final : public FrameSink
{
  public:
    bool consume(const proto::CompletedFrame &) override
    {
        count_++;
        return true;
    }
    std::string   name() const override { return "null"; }
    std::uint64_t count() const { return count_; }

  private:
    std::uint64_t count_{0};
};

// Writes each frame to <dir>/frame_<id>_<w>x<h>.jpg and keeps only the
// newest `keep` files it wrote.
class DirectorySink final : public FrameSink
{
  public:
    DirectorySink(std::string dir, std::size_t keep);

    bool        open();  // mkdir -p, 0700
    bool        consume(const proto::CompletedFrame &f) override;
    std::string name() const override { return "dir"; }

    static std::string file_name(const proto::CompletedFrame &f);

    const std::string             &dir() const { return dir_; }
    const std::deque<std::string> &written() const { return written_; }

  private:
    std::string             dir_;
    std::size_t             keep_{1};
    bool                    opened_{false};
    std::deque<std::string> written_;  // oldest first
};

}  // namespace sink
