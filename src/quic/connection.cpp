#include <utility>

#include "quic/connection.hpp"
#include "util/log.hpp"

namespace quic
{

using uquic::Status;

const char *state_name(State s)
{
    switch (s)
    {
        case State::Idle:
            return "idle";
        case State::Listening:
            return "listening";
        case State::Connecting:
            return "connecting";
        case State::Established:
            return "established";
        case State::Closing:
            return "closing";
        case State::Closed:
            return "closed";
    }
    return "?";
}

Connection::Connection(std::unique_ptr<transport::ITransport> tx, std::size_t max_datagram)
    : tx_(std::move(tx)), max_datagram_(max_datagram)
{
}

Connection::~Connection()
{
    // no FIN here; close() is the explicit teardown
    if (tx_)
        tx_->close();
}

void Connection::fail_handshake()
{
    tx_->close();
    state_.store(State::Closed);
}

Status Connection::listen(const transport::Endpoint &local)
{
    if (state() != State::Idle)
    {
        LOG_ERROR("listen: connection is %s", state_name(state()));
        return Status::NotEstablished;
    }
    if (!tx_->bind(local))
    {
        fail_handshake();
        return Status::IoError;
    }
    state_.store(State::Listening);
    LOG_INFO("Listening on %s", local.to_string().c_str());

    wire::PacketHeader       hdr;
    std::vector<wire::Frame> frames;
    transport::Endpoint      from;
    std::size_t              n = 0;
    Status                   st = recv_packet(hdr, frames, from, n);
    if (st == Status::IoError)
    {
        fail_handshake();
        return st;
    }
    if (st != Status::Ok || hdr.flags != wire::Flag::Syn)
    {
        LOG_ERROR("listen: first datagram from %s is not SYN (%s)", from.to_string().c_str(),
                  st == Status::Ok ? wire::flag_name(hdr.flags) : uquic::status_name(st));
        fail_handshake();
        return Status::HandshakeError;
    }
    LOG_INFO("SYN from %s", from.to_string().c_str());

    // echo the SYN back with the flag switched
    wire::Packet accept;
    accept.flags         = wire::Flag::AcceptConnection;
    accept.packet_number = hdr.packet_number;
    if (!tx_->send_to(from, wire::encode(accept)))
    {
        fail_handshake();
        return Status::IoError;
    }

    peer_ = from;
    state_.store(State::Established);
    LOG_INFO("Connection established with %s", peer_.to_string().c_str());
    return Status::Ok;
}

Status Connection::connect(const transport::Endpoint &peer)
{
    if (state() != State::Idle)
    {
        LOG_ERROR("connect: connection is %s", state_name(state()));
        return Status::NotEstablished;
    }
    peer_ = peer;
    state_.store(State::Connecting);

    wire::Packet syn;
    syn.flags         = wire::Flag::Syn;
    syn.packet_number = next_packet_number();
    if (!tx_->send_to(peer_, wire::encode(syn)))
    {
        fail_handshake();
        return Status::IoError;
    }

    wire::PacketHeader       hdr;
    std::vector<wire::Frame> frames;
    transport::Endpoint      from;
    std::size_t              n = 0;
    Status                   st = recv_packet(hdr, frames, from, n);
    if (st == Status::IoError)
    {
        fail_handshake();
        return st;
    }
    if (st != Status::Ok || hdr.flags != wire::Flag::AcceptConnection)
    {
        LOG_ERROR("connect: %s did not accept the connection (%s)", peer_.to_string().c_str(),
                  st == Status::Ok ? wire::flag_name(hdr.flags) : uquic::status_name(st));
        fail_handshake();
        return Status::HandshakeError;
    }

    state_.store(State::Established);
    LOG_INFO("Connection established with %s", from.to_string().c_str());
    return Status::Ok;
}

void Connection::close()
{
    State s = state();
    if (s == State::Closed || s == State::Closing)
        return;
    state_.store(State::Closing);

    if (s == State::Established)
    {
        // the peer is assumed to see this; nothing acknowledges it
        wire::Packet fin;
        fin.flags         = wire::Flag::Fin;
        fin.packet_number = next_packet_number();
        if (!tx_->send_to(peer_, wire::encode(fin)))
            LOG_WARN("close: FIN to %s not sent", peer_.to_string().c_str());
    }
    tx_->close();
    state_.store(State::Closed);
    LOG_INFO("Connection closed");
}

void Connection::on_peer_fin()
{
    tx_->close();
    state_.store(State::Closed);
    LOG_INFO("Connection closed by peer");
}

Status Connection::send_packet(wire::Packet &p)
{
    if (state() != State::Established)
        return Status::NotEstablished;

    p.packet_number = next_packet_number();
    auto bytes      = wire::encode(p);
    if (bytes.size() > max_datagram_)
    {
        LOG_ERROR("send_packet: %zu bytes exceeds max datagram %zu", bytes.size(), max_datagram_);
        return Status::CapacityExceeded;
    }
    if (!tx_->send_to(peer_, bytes))
        return Status::IoError;
    return Status::Ok;
}

Status Connection::send_ack(const transport::Endpoint &to)
{
    wire::Packet ack;
    ack.flags         = wire::Flag::AckData;
    ack.packet_number = next_packet_number();
    if (!tx_->send_to(to, wire::encode(ack)))
        return Status::IoError;
    return Status::Ok;
}

Status Connection::recv_packet(wire::PacketHeader       &hdr,
                               std::vector<wire::Frame> &frames,
                               transport::Endpoint      &from,
                               std::size_t              &wire_size)
{
    transport::Datagram d;
    if (!tx_->recv_from(d, from))
        return Status::IoError;
    wire_size = d.size();
    return wire::decode(d, hdr, frames);
}

}  // namespace quic
