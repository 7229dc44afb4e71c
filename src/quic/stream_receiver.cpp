#include <utility>

#include "quic/stream_receiver.hpp"
#include "util/log.hpp"

namespace quic
{

using uquic::Status;

StreamReceiver::StreamReceiver(Connection &conn) : conn_(conn) {}

void StreamReceiver::on_data(const wire::PacketHeader       &hdr,
                             const std::vector<wire::Frame> &frames,
                             const transport::Endpoint      &from,
                             std::size_t                     wire_size)
{
    const auto now = Clock::now();

    if (!frames.empty())
    {
        // a packet carries frames of one stream; it is charged to the first
        const std::uint32_t owner = frames.front().hdr.stream_id;
        if (hdr.flags == wire::Flag::StreamFirst)
            stats_.on_stream_first(owner, now);

        for (const auto &f : frames)
        {
            Bytes &buf = buffers_[f.hdr.stream_id];
            buf.insert(buf.end(), f.data.begin(), f.data.end());
            stats_.on_frames(f.hdr.stream_id, 1, f.data.size());
        }
        stats_.on_packet(owner, wire_size);

        if (hdr.flags == wire::Flag::StreamLast)
            stats_.on_stream_last(owner, now);
    }
    else
    {
        LOG_DEBUG("%s packet #%u without frames", wire::flag_name(hdr.flags), hdr.packet_number);
    }

    if (conn_.send_ack(from) == Status::Ok)
        acks_sent_++;
    else
        LOG_WARN("ACK_DATA to %s not sent", from.to_string().c_str());
}

Status StreamReceiver::receive(StreamMap &out)
{
    if (!conn_.is_established())
    {
        LOG_ERROR("receive: connection is %s", state_name(conn_.state()));
        return Status::NotEstablished;
    }

    wire::PacketHeader       hdr;
    std::vector<wire::Frame> frames;
    transport::Endpoint      from;
    std::size_t              wire_size = 0;

    while (true)
    {
        Status st = conn_.recv_packet(hdr, frames, from, wire_size);
        if (st != Status::Ok)
            return st;

        switch (hdr.flags)
        {
            case wire::Flag::Data:
            case wire::Flag::StreamFirst:
            case wire::Flag::StreamLast:
                on_data(hdr, frames, from, wire_size);
                break;

            case wire::Flag::DataFin:
                stats_.on_data_fin(Clock::now());
                LOG_INFO("DATA_FIN: %zu streams received", buffers_.size());
                LOG_INFO("\n%s", stats_.report().c_str());
                out = std::move(buffers_);
                buffers_.clear();
                return Status::Ok;

            case wire::Flag::Fin:
                buffers_.clear();
                conn_.on_peer_fin();
                return Status::EndOfConnection;

            default:
                LOG_DEBUG("ignoring %s from %s", wire::flag_name(hdr.flags),
                          from.to_string().c_str());
                break;
        }
    }
}

}  // namespace quic
