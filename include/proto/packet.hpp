#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "util/status.hpp"

/*
Datagram layout (big-endian):

  [flags u8][packet_number u32][payload_length u64]          13B packet header
  [stream_id u32][offset u32][data_length u64][data ...]     16B frame header + data
  [stream_id u32][offset u32][data_length u64][data ...]
  ...

TX: add_frame() appends serialized frames to Packet::payload until the
    datagram budget is reached, encode() prepends the packet header.
RX: decode() splits a datagram back into its header and ordered frames.
*/

namespace wire
{

// --- Protocol constants ---
inline constexpr std::size_t PACKET_HDR_SIZE   = 13;
inline constexpr std::size_t FRAME_HDR_SIZE    = 16;
inline constexpr std::size_t MAX_DATAGRAM_SIZE = 15000;
inline constexpr std::size_t MAX_PAYLOAD_SIZE  = MAX_DATAGRAM_SIZE - PACKET_HDR_SIZE;

enum class Flag : std::uint8_t
{
    Syn              = 1,
    AcceptConnection = 2,
    AckData          = 3,
    Data             = 4,
    StreamFirst      = 5,  // first packet of a stream, starts its timer
    StreamLast       = 6,  // last packet of a stream, stops its timer
    DataFin          = 7,  // end of a batch of streams
    Fin              = 8
};

struct PacketHeader
{
    Flag          flags{Flag::Data};
    std::uint32_t packet_number{0};
    std::uint64_t payload_length{0};
};

struct FrameHeader
{
    std::uint32_t stream_id{0};
    std::uint32_t offset{0};  // byte offset of data within the stream
    std::uint64_t data_length{0};
};

struct Frame
{
    FrameHeader               hdr;
    std::vector<std::uint8_t> data;
};

struct Packet
{
    Flag                      flags{Flag::Data};
    std::uint32_t             packet_number{0};  // stamped by the owning connection
    std::vector<std::uint8_t> payload;           // serialized frames
};

// Payload budget of one packet and the largest frame data that still fits it
constexpr std::size_t max_payload(std::size_t max_datagram)
{
    return max_datagram > PACKET_HDR_SIZE ? max_datagram - PACKET_HDR_SIZE : 0;
}
constexpr std::size_t max_frame_data(std::size_t max_datagram)
{
    return max_payload(max_datagram) > FRAME_HDR_SIZE ? max_payload(max_datagram) - FRAME_HDR_SIZE
                                                      : 0;
}

bool        is_valid_flag(std::uint8_t raw);
const char *flag_name(Flag f);

// TX
// Append one frame; CapacityExceeded (packet untouched) when it would not fit
uquic::Status             add_frame(Packet             &p,
                                    std::uint32_t       stream_id,
                                    std::uint32_t       offset,
                                    const std::uint8_t *data,
                                    std::size_t         len,
                                    std::size_t         max_datagram = MAX_DATAGRAM_SIZE);
std::vector<std::uint8_t> encode(const Packet &p);
void                      pack_header(const PacketHeader &in, std::uint8_t out[PACKET_HDR_SIZE]);
void pack_frame_header(const FrameHeader &in, std::uint8_t out[FRAME_HDR_SIZE]);

// RX
uquic::Status decode(const std::vector<std::uint8_t> &datagram,
                     PacketHeader                    &hdr,
                     std::vector<Frame>              &frames);
bool          unpack_header(const std::uint8_t in[PACKET_HDR_SIZE], PacketHeader &out);
void          unpack_frame_header(const std::uint8_t in[FRAME_HDR_SIZE], FrameHeader &out);

}  // namespace wire
