#pragma once
#include <cstddef>
#include <cstdint>

#include "quic/connection.hpp"
#include "quic/statistics.hpp"
#include "quic/stream_sender.hpp"
#include "util/status.hpp"

namespace quic
{

// Demultiplexes incoming frames into per-stream buffers. Frames of a stream
// are appended in arrival order; offsets are not used to reorder, so the
// datagram channel is assumed to keep send order and drop nothing.
class StreamReceiver
{
  public:
    explicit StreamReceiver(Connection &conn);

    // Ok: `out` holds the batch ended by DATA_FIN.
    // EndOfConnection: peer sent FIN; anything buffered is discarded.
    // MalformedPacket / IoError / NotEstablished: fatal for this call.
    uquic::Status receive(StreamMap &out);

    const Statistics &statistics() const { return stats_; }
    std::size_t       buffered_streams() const { return buffers_.size(); }
    std::uint64_t     acks_sent() const { return acks_sent_; }

  private:
    void on_data(const wire::PacketHeader       &hdr,
                 const std::vector<wire::Frame> &frames,
                 const transport::Endpoint      &from,
                 std::size_t                     wire_size);

    Connection   &conn_;
    StreamMap     buffers_;
    Statistics    stats_;
    std::uint64_t acks_sent_{0};
};

}  // namespace quic
