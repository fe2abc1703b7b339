#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

/*
MYIR chunk datagram, all integers big-endian:

  0       4   5   6   7   8      10     12            20       24       28     30     32     34   36
  +-------+---+---+---+---+------+------+-------------+--------+--------+------+------+------+----+
  | magic |ver|sid|cdc|flg|width |height| pts         |frame_id|frm_size|chunk |total | plen |rsvd|
  +-------+---+---+---+---+------+------+-------------+--------+--------+------+------+------+----+
  |<------------------------------ legacy header (32B) ------------------------------>|
  |<------------------------------------ extended header (36B) ------------------------------------>|

TX:
frame bytes -> make_chunks() -> serialize() -> transport.send()

RX:
transport.on_rx(datagram)
  -> HeaderParser::parse()   // nullopt: not ours
      -> FrameReassembler::push(hdr, payload)
            -> CompletedFrame -> sink
*/

namespace proto
{

// --- Protocol constants ---
inline constexpr std::uint32_t MAGIC           = 0x4D594952;  // "MYIR"
inline constexpr std::uint8_t  VERSION         = 3;
inline constexpr std::size_t   HDR_SIZE        = 36;
inline constexpr std::size_t   LEGACY_HDR_SIZE = 32;
inline constexpr std::size_t   CHUNK_PAYLOAD   = 32768;  // fixed payload bytes per chunk
inline constexpr std::size_t   MAX_DATAGRAM    = 65507;  // largest UDP payload over IPv4

enum class HeaderVariant
{
    Extended,  // 36B, carries payload_len
    Legacy     // 32B, payload runs to end of datagram
};

// Protocol constants handed to the parser and the encoder
struct WireConfig
{
    std::uint32_t magic         = MAGIC;
    std::uint8_t  version       = VERSION;
    HeaderVariant variant       = HeaderVariant::Extended;
    std::size_t   chunk_payload = CHUNK_PAYLOAD;

    std::size_t header_size() const
    {
        return variant == HeaderVariant::Extended ? HDR_SIZE : LEGACY_HDR_SIZE;
    }
    // header + payload must fit one datagram
    std::size_t max_chunk_payload() const { return MAX_DATAGRAM - header_size(); }
};

struct Header
{
    std::uint32_t magic{MAGIC};     // 4B
    std::uint8_t  version{VERSION};  // 1B
    std::uint8_t  stream_id{0};      // 1B
    std::uint8_t  codec{0};          // 1B
    std::uint8_t  flags{0};          // 1B
    std::uint16_t width{0};          // 2B
    std::uint16_t height{0};         // 2B
    std::uint64_t pts{0};            // 8B
    std::uint32_t frame_id{0};       // 4B
    std::uint32_t frame_size{0};     // 4B, whole frame
    std::uint16_t chunk_id{0};       // 2B, zero-based
    std::uint16_t chunks_total{0};   // 2B
    std::uint16_t payload_len{0};    // 2B, extended variant only
};

// A parsed datagram. payload points into the buffer handed to parse() and is
// only valid while that buffer is.
struct Datagram
{
    Header              hdr;
    const std::uint8_t *payload{nullptr};
    std::size_t         payload_len{0};
};

struct Chunk
{
    Header                    hdr;
    std::vector<std::uint8_t> payload;
};

class HeaderParser
{
  public:
    explicit HeaderParser(WireConfig cfg = {}) : cfg_(cfg) {}

    // nullopt when the bytes are not a MYIR chunk: too short for the header
    // (or, extended variant, for the declared payload), wrong magic or wrong
    // version. Never throws.
    std::optional<Datagram> parse(const std::uint8_t *data, std::size_t len) const;
    std::optional<Datagram> parse(const std::vector<std::uint8_t> &datagram) const
    {
        return parse(datagram.data(), datagram.size());
    }

    const WireConfig &config() const { return cfg_; }

  private:
    WireConfig cfg_;
};

// TX
bool                      pack_header(const Header &in, const WireConfig &cfg, std::uint8_t *out);
std::vector<std::uint8_t> serialize(const Chunk &c, const WireConfig &cfg);
std::vector<Chunk>        make_chunks(std::uint32_t                    frame_id,
                                      std::uint16_t                    width,
                                      std::uint16_t                    height,
                                      std::uint64_t                    pts,
                                      const std::vector<std::uint8_t> &frame,
                                      const WireConfig                &cfg);

}  // namespace proto
