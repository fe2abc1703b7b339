#include <algorithm>
#include <array>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sodium.h>

#include "sink/frame_sink.hpp"
#include "util/log.hpp"

namespace sink
{
namespace fs = std::filesystem;

static_assert(FINGERPRINT_BYTES >= crypto_generichash_BYTES_MIN &&
                  FINGERPRINT_BYTES <= crypto_generichash_BYTES_MAX,
              "fingerprint size out of BLAKE2b range");

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

std::string fingerprint(const std::vector<std::uint8_t> &bytes)
{
    if (!ensure_sodium_init())
        return {};

    std::array<unsigned char, FINGERPRINT_BYTES> digest{};
    if (crypto_generichash(digest.data(), digest.size(), bytes.data(), bytes.size(), nullptr, 0) !=
        0)
        return {};

    std::array<char, FINGERPRINT_BYTES * 2 + 1> hex{};
    sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
    return std::string(hex.data());
}

DirectorySink::DirectorySink(std::string dir, std::size_t keep)
    : dir_(std::move(dir)), keep_(keep ? keep : 1)
{
}

bool DirectorySink::open()
{
    std::error_code ec;
    fs::path        p(dir_);
    if (!fs::exists(p, ec))
    {
        if (!fs::create_directories(p, ec))
        {
            LOG_ERROR("create_directories(%s) failed: %s", dir_.c_str(), ec.message().c_str());
            return false;
        }
        fs::permissions(p, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec)
            LOG_WARN("permissions(%s, 0700) failed: %s", dir_.c_str(), ec.message().c_str());
    }
    else if (!fs::is_directory(p, ec))
    {
        LOG_ERROR("%s exists and is not a directory", dir_.c_str());
        return false;
    }
    opened_ = true;
    LOG_INFO("[SINK] writing frames to %s (keep %zu)", dir_.c_str(), keep_);
    return true;
}

std::string DirectorySink::file_name(const proto::CompletedFrame &f)
{
    char name[64];
    std::snprintf(name, sizeof(name), "frame_%010u_%ux%u.jpg", f.frame_id,
                  static_cast<unsigned>(f.width), static_cast<unsigned>(f.height));
    return name;
}

bool DirectorySink::consume(const proto::CompletedFrame &f)
{
    if (!opened_ && !open())
        return false;

    const fs::path path = fs::path(dir_) / file_name(f);
    const fs::path tmp  = fs::path(path).concat(".part");
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            LOG_ERROR("[SINK] cannot open %s", tmp.c_str());
            return false;
        }
        out.write(reinterpret_cast<const char *>(f.bytes.data()),
                  static_cast<std::streamsize>(f.bytes.size()));
        if (!out)
        {
            LOG_ERROR("[SINK] short write to %s", tmp.c_str());
            return false;
        }
    }
    // readers never see a half-written frame
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec)
    {
        LOG_ERROR("[SINK] rename(%s) failed: %s", tmp.c_str(), ec.message().c_str());
        fs::remove(tmp, ec);
        return false;
    }
    // a reused frame id overwrote an older file
    auto dup = std::find(written_.begin(), written_.end(), path.string());
    if (dup != written_.end())
        written_.erase(dup);
    written_.push_back(path.string());
    if (framerx::log_enabled(framerx::Level::Debug))
        LOG_DEBUG("[SINK] %s (%zu bytes, blake2b %s)", path.c_str(), f.bytes.size(),
                  fingerprint(f.bytes).c_str());

    while (written_.size() > keep_)
    {
        fs::remove(written_.front(), ec);
        if (ec)
            LOG_WARN("[SINK] remove(%s) failed: %s", written_.front().c_str(),
                     ec.message().c_str());
        written_.pop_front();
    }
    return true;
}

}  // namespace sink
