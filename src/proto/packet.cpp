#include <arpa/inet.h>  // htonl, ntohl
#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>

#include "proto/packet.hpp"
#include "util/log.hpp"

namespace wire
{

namespace
{

void put_u32(std::uint8_t *out, std::uint32_t v)
{
    std::uint32_t be = htonl(v);
    std::memcpy(out, &be, sizeof be);
}

void put_u64(std::uint8_t *out, std::uint64_t v)
{
    put_u32(out, static_cast<std::uint32_t>(v >> 32));
    put_u32(out + 4, static_cast<std::uint32_t>(v & 0xFFFFFFFFu));
}

std::uint32_t get_u32(const std::uint8_t *in)
{
    std::uint32_t be;
    std::memcpy(&be, in, sizeof be);
    return ntohl(be);
}

std::uint64_t get_u64(const std::uint8_t *in)
{
    return (static_cast<std::uint64_t>(get_u32(in)) << 32) | get_u32(in + 4);
}

}  // namespace

bool is_valid_flag(std::uint8_t raw)
{
    return raw >= static_cast<std::uint8_t>(Flag::Syn) && raw <= static_cast<std::uint8_t>(Flag::Fin);
}

const char *flag_name(Flag f)
{
    switch (f)
    {
        case Flag::Syn:
            return "SYN";
        case Flag::AcceptConnection:
            return "ACCEPT_CONNECTION";
        case Flag::AckData:
            return "ACK_DATA";
        case Flag::Data:
            return "DATA";
        case Flag::StreamFirst:
            return "STREAM_FIRST";
        case Flag::StreamLast:
            return "STREAM_LAST";
        case Flag::DataFin:
            return "DATA_FIN";
        case Flag::Fin:
            return "FIN";
    }
    return "?";
}

uquic::Status add_frame(Packet             &p,
                        std::uint32_t       stream_id,
                        std::uint32_t       offset,
                        const std::uint8_t *data,
                        std::size_t         len,
                        std::size_t         max_datagram)
{
    const std::size_t budget = max_payload(max_datagram);
    if (p.payload.size() > budget || FRAME_HDR_SIZE + len > budget - p.payload.size())
    {
        LOG_DEBUG("add_frame: no room for %zu data bytes (payload %zu / %zu)", len,
                  p.payload.size(), budget);
        return uquic::Status::CapacityExceeded;
    }

    FrameHeader fh;
    fh.stream_id   = stream_id;
    fh.offset      = offset;
    fh.data_length = len;

    const std::size_t at = p.payload.size();
    p.payload.resize(at + FRAME_HDR_SIZE + len);
    pack_frame_header(fh, p.payload.data() + at);
    if (len)
        std::memcpy(p.payload.data() + at + FRAME_HDR_SIZE, data, len);
    return uquic::Status::Ok;
}

std::vector<std::uint8_t> encode(const Packet &p)
{
    std::vector<std::uint8_t> out(PACKET_HDR_SIZE + p.payload.size());

    PacketHeader h;
    h.flags          = p.flags;
    h.packet_number  = p.packet_number;
    h.payload_length = p.payload.size();
    pack_header(h, out.data());

    if (!p.payload.empty())
        std::memcpy(out.data() + PACKET_HDR_SIZE, p.payload.data(), p.payload.size());
    return out;
}

void pack_header(const PacketHeader &in, std::uint8_t out[PACKET_HDR_SIZE])
{
    out[0] = static_cast<std::uint8_t>(in.flags);
    put_u32(out + 1, in.packet_number);
    put_u64(out + 5, in.payload_length);
}

void pack_frame_header(const FrameHeader &in, std::uint8_t out[FRAME_HDR_SIZE])
{
    put_u32(out, in.stream_id);
    put_u32(out + 4, in.offset);
    put_u64(out + 8, in.data_length);
}

bool unpack_header(const std::uint8_t in[PACKET_HDR_SIZE], PacketHeader &out)
{
    if (!is_valid_flag(in[0]))
        return false;
    out.flags          = static_cast<Flag>(in[0]);
    out.packet_number  = get_u32(in + 1);
    out.payload_length = get_u64(in + 5);
    return true;
}

void unpack_frame_header(const std::uint8_t in[FRAME_HDR_SIZE], FrameHeader &out)
{
    out.stream_id   = get_u32(in);
    out.offset      = get_u32(in + 4);
    out.data_length = get_u64(in + 8);
}

uquic::Status decode(const std::vector<std::uint8_t> &datagram,
                     PacketHeader                    &hdr,
                     std::vector<Frame>              &frames)
{
    frames.clear();
    if (datagram.size() < PACKET_HDR_SIZE)
    {
        LOG_ERROR("decode: datagram too short (%zu)", datagram.size());
        return uquic::Status::MalformedPacket;
    }
    if (!unpack_header(datagram.data(), hdr))
    {
        LOG_ERROR("decode: unknown flags 0x%02x", static_cast<unsigned>(datagram[0]));
        return uquic::Status::MalformedPacket;
    }

    const std::size_t available = datagram.size() - PACKET_HDR_SIZE;
    if (hdr.payload_length > available)
    {
        LOG_ERROR("decode: payload length %llu exceeds datagram (%zu)",
                  static_cast<unsigned long long>(hdr.payload_length), available);
        return uquic::Status::MalformedPacket;
    }
    // bytes past payload_length are ignored
    const std::uint8_t *payload = datagram.data() + PACKET_HDR_SIZE;
    const std::size_t   end     = static_cast<std::size_t>(hdr.payload_length);

    std::size_t pos = 0;
    while (pos < end)
    {
        if (end - pos < FRAME_HDR_SIZE)
        {
            LOG_ERROR("decode: truncated frame header at %zu/%zu", pos, end);
            frames.clear();
            return uquic::Status::MalformedPacket;
        }
        Frame f;
        unpack_frame_header(payload + pos, f.hdr);
        pos += FRAME_HDR_SIZE;

        if (f.hdr.data_length > end - pos)
        {
            LOG_ERROR("decode: frame (stream %u) length %llu overruns payload (%zu left)",
                      f.hdr.stream_id, static_cast<unsigned long long>(f.hdr.data_length),
                      end - pos);
            frames.clear();
            return uquic::Status::MalformedPacket;
        }
        const std::size_t n = static_cast<std::size_t>(f.hdr.data_length);
        f.data.assign(payload + pos, payload + pos + n);
        pos += n;
        frames.push_back(std::move(f));
    }
    return uquic::Status::Ok;
}

}  // namespace wire
