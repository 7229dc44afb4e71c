#include "transport/loopback_transport.hpp"
#include "util/log.hpp"

namespace transport
{
// LoopbackTransport: a fake link to test the protocol engine without sockets.
LoopbackTransport::Pair LoopbackTransport::make_pair(std::size_t max_datagram)
{
    auto link          = std::make_shared<Link>();
    link->max_datagram = max_datagram;
    return Pair(std::unique_ptr<LoopbackTransport>(new LoopbackTransport(link, 0)),
                std::unique_ptr<LoopbackTransport>(new LoopbackTransport(link, 1)));
}

LoopbackTransport::LoopbackTransport(std::shared_ptr<Link> link, int side)
    : link_(std::move(link)), side_(side)
{
    self_.host = "loopback";
    self_.port = static_cast<std::uint16_t>(side + 1);
}

bool LoopbackTransport::bind(const Endpoint &local)
{
    std::lock_guard<std::mutex> lk(link_->mu);
    if (link_->closed[side_])
        return false;
    self_ = local;
    return true;
}

bool LoopbackTransport::send_to(const Endpoint & /*peer*/, const Datagram &d)
{
    {
        std::lock_guard<std::mutex> lk(link_->mu);
        if (link_->closed[side_])
            return false;
        if (link_->max_datagram != 0 && d.size() > link_->max_datagram)
        {
            LOG_ERROR("datagram of %zu bytes exceeds %zu", d.size(), link_->max_datagram);
            return false;
        }
        link_->sent[side_]++;
        // like UDP, a closed peer silently loses the datagram
        if (!link_->closed[1 - side_])
            link_->queue[1 - side_].emplace_back(self_, d);
    }
    link_->cv.notify_all();
    return true;
}

bool LoopbackTransport::recv_from(Datagram &out, Endpoint &from)
{
    std::unique_lock<std::mutex> lk(link_->mu);
    auto                        &q = link_->queue[side_];
    link_->cv.wait(lk, [&] { return !q.empty() || link_->closed[side_] || link_->closed[1 - side_]; });
    if (link_->closed[side_] || q.empty())
        return false;
    from = std::move(q.front().first);
    out  = std::move(q.front().second);
    q.pop_front();
    return true;
}

void LoopbackTransport::close()
{
    {
        std::lock_guard<std::mutex> lk(link_->mu);
        link_->closed[side_] = true;
    }
    link_->cv.notify_all();
}

bool LoopbackTransport::is_open() const
{
    std::lock_guard<std::mutex> lk(link_->mu);
    return !link_->closed[side_];
}

std::size_t LoopbackTransport::pending() const
{
    std::lock_guard<std::mutex> lk(link_->mu);
    return link_->queue[side_].size();
}

std::size_t LoopbackTransport::sent() const
{
    std::lock_guard<std::mutex> lk(link_->mu);
    return link_->sent[side_];
}

}  // namespace transport
