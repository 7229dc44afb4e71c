#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "proto/packet.hpp"
#include "transport/itransport.hpp"
#include "util/status.hpp"

namespace quic
{

enum class State
{
    Idle,
    Listening,
    Connecting,
    Established,
    Closing,
    Closed
};

const char *state_name(State s);

// One logical session: one transport, one peer. Owns the packet-number
// counter; send_packet() may be called from concurrent stream senders.
class Connection
{
  public:
    explicit Connection(std::unique_ptr<transport::ITransport> tx,
                        std::size_t                            max_datagram = wire::MAX_DATAGRAM_SIZE);
    ~Connection();

    Connection(const Connection &)            = delete;
    Connection &operator=(const Connection &) = delete;

    // Receiver side: bind, wait for one SYN, answer ACCEPT_CONNECTION
    uquic::Status listen(const transport::Endpoint &local);
    // Sender side: send SYN, wait for one ACCEPT_CONNECTION
    uquic::Status connect(const transport::Endpoint &peer);
    // Send FIN and release the socket; no-op once closed
    void close();

    // Stamp the next packet number, encode and send to the peer
    uquic::Status send_packet(wire::Packet &p);
    // Empty ACK_DATA to whoever sent the data packet; the sender never reads it
    uquic::Status send_ack(const transport::Endpoint &to);
    // Block for one datagram and decode it
    uquic::Status recv_packet(wire::PacketHeader       &hdr,
                              std::vector<wire::Frame> &frames,
                              transport::Endpoint      &from,
                              std::size_t              &wire_size);
    // Peer sent FIN: release the socket without answering
    void on_peer_fin();

    State                      state() const { return state_.load(); }
    bool                       is_established() const { return state() == State::Established; }
    bool                       is_closed() const { return state() == State::Closed; }
    const transport::Endpoint &peer() const { return peer_; }
    std::size_t                max_datagram() const { return max_datagram_; }

  private:
    std::uint32_t next_packet_number() { return next_pn_.fetch_add(1) + 1; }
    void          fail_handshake();

    std::unique_ptr<transport::ITransport> tx_;
    std::size_t                            max_datagram_;
    std::atomic<State>                     state_{State::Idle};
    std::atomic<std::uint32_t>             next_pn_{0};
    transport::Endpoint                    peer_;
};

}  // namespace quic
