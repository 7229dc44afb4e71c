#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

#include "transport/itransport.hpp"

namespace transport
{

// In-memory datagram link between two LoopbackTransport ends. What one end
// sends is queued for the other, tagged with the sender's endpoint.
class LoopbackTransport final : public ITransport
{
  public:
    using Pair = std::pair<std::unique_ptr<LoopbackTransport>, std::unique_ptr<LoopbackTransport>>;

    // max_datagram == 0 disables the size check
    static Pair make_pair(std::size_t max_datagram = 0);

    bool        bind(const Endpoint &local) override;
    bool        send_to(const Endpoint &peer, const Datagram &d) override;
    bool        recv_from(Datagram &out, Endpoint &from) override;
    void        close() override;
    bool        is_open() const override;
    std::string name() const override { return "loopback"; }

    const Endpoint &local_endpoint() const { return self_; }
    std::size_t     pending() const;  // datagrams queued for this end
    std::size_t     sent() const;     // datagrams this end delivered

  private:
    struct Link
    {
        mutable std::mutex                               mu;
        std::condition_variable                          cv;
        std::deque<std::pair<Endpoint, Datagram>>        queue[2];
        std::size_t                                      sent[2]{0, 0};
        bool                                             closed[2]{false, false};
        std::size_t                                      max_datagram{0};
    };

    LoopbackTransport(std::shared_ptr<Link> link, int side);

    std::shared_ptr<Link> link_;
    int                   side_;
    Endpoint              self_;
};

}  // namespace transport
