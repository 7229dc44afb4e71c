#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <random>
#include <vector>

#include "proto/packet.hpp"
#include "quic/connection.hpp"
#include "util/config.hpp"
#include "util/status.hpp"

namespace quic
{

using Bytes     = std::vector<std::uint8_t>;
using StreamMap = std::map<std::uint32_t, Bytes>;

struct SenderOptions
{
    std::size_t               frame_min   = constants::DEFAULT_FRAME_MIN;  // frame data bytes
    std::size_t               frame_max   = constants::DEFAULT_FRAME_MAX;
    std::chrono::microseconds pacing      = std::chrono::microseconds(constants::DEFAULT_PACING_US);
    std::size_t               max_workers = constants::DEFAULT_MAX_SENDERS;  // streams in flight

    static SenderOptions from(const config::Settings &s);
};

// How one stream is cut into frames and packets
struct StreamPlan
{
    std::size_t frame_data_size{0};
    std::size_t frame_count{0};
    std::size_t frames_per_packet{0};
    std::size_t packet_count{0};
};

StreamPlan plan_stream(std::size_t blob_size, std::size_t frame_data_size, std::size_t max_datagram);

// Consecutive frames of frame_data_size bytes; the last one may be shorter.
// An empty blob gives one empty frame.
std::vector<wire::Frame> partition(std::uint32_t stream_id, const Bytes &blob,
                                   std::size_t frame_data_size);

// Packet `index` of a stream: STREAM_FIRST, DATA..., STREAM_LAST, each holding
// frames_per_packet of the partitioned frames except the last. Packet numbers
// are left for the connection to stamp.
uquic::Status fill_packet(const std::vector<wire::Frame> &frames,
                          const StreamPlan               &plan,
                          std::size_t                     index,
                          std::size_t                     max_datagram,
                          wire::Packet                   &out);

// Every packet of one stream, in send order
uquic::Status build_stream_packets(std::uint32_t              stream_id,
                                   const Bytes               &blob,
                                   std::size_t                frame_data_size,
                                   std::size_t                max_datagram,
                                   std::vector<wire::Packet> &out);

std::size_t pick_frame_data_size(const SenderOptions &opt, std::mt19937 &rng);

// Sends batches of streams over an established connection, then closes the
// batch with DATA_FIN. Up to max_workers streams are in flight at once, each on
// its own thread; packets follow the connection's datagram limit. Nothing
// waits for ACK_DATA.
class StreamSender
{
  public:
    StreamSender(Connection &conn, SenderOptions opt);

    uquic::Status send(const StreamMap &streams);
    // Stream ids 1..N in list order
    uquic::Status send_files(const std::vector<Bytes> &blobs);

  private:
    uquic::Status send_stream(std::uint32_t stream_id, const Bytes &blob, std::size_t frame_data_size);

    Connection   &conn_;
    SenderOptions opt_;
    std::mt19937  rng_;
};

}  // namespace quic
