#pragma once
#include <atomic>
#include <cstddef>
#include <mutex>

#include "proto/packet.hpp"
#include "transport/itransport.hpp"

struct sockaddr_in;

namespace transport
{

// IPv4 UDP socket. The socket is created on first bind() or send_to().
class UdpTransport final : public ITransport
{
  public:
    explicit UdpTransport(std::size_t max_datagram = wire::MAX_DATAGRAM_SIZE);
    ~UdpTransport() override;

    UdpTransport(const UdpTransport &)            = delete;
    UdpTransport &operator=(const UdpTransport &) = delete;

    // Port 0 picks an ephemeral port. Binding again to the bound endpoint is a no-op.
    bool        bind(const Endpoint &local) override;
    bool        send_to(const Endpoint &peer, const Datagram &d) override;
    bool        recv_from(Datagram &out, Endpoint &from) override;
    void        close() override;
    bool        is_open() const override;
    std::string name() const override { return "udp"; }

    const Endpoint &local_endpoint() const { return local_; }

  private:
    bool ensure_socket();

    std::mutex       open_mu_;  // guards lazy socket creation
    std::atomic<int> fd_{-1};
    std::size_t      max_datagram_;
    bool             bound_{false};
    Endpoint         local_;
};

// Resolve host:port to an IPv4 address (numeric or by name)
bool resolve(const Endpoint &ep, sockaddr_in &out);

}  // namespace transport
