#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "transport/udp_transport.hpp"
#include "util/log.hpp"

namespace transport
{

bool resolve(const Endpoint &ep, sockaddr_in &out)
{
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port   = htons(ep.port);

    if (ep.host.empty() || ep.host == "0.0.0.0")
    {
        out.sin_addr.s_addr = htonl(INADDR_ANY);
        return true;
    }
    if (inet_pton(AF_INET, ep.host.c_str(), &out.sin_addr) == 1)
        return true;

    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo *res     = nullptr;
    int       rc      = getaddrinfo(ep.host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || !res)
    {
        LOG_ERROR("cannot resolve %s: %s", ep.host.c_str(), gai_strerror(rc));
        return false;
    }
    out.sin_addr = reinterpret_cast<sockaddr_in *>(res->ai_addr)->sin_addr;
    freeaddrinfo(res);
    return true;
}

UdpTransport::UdpTransport(std::size_t max_datagram) : max_datagram_(max_datagram) {}

UdpTransport::~UdpTransport()
{
    close();
}

bool UdpTransport::ensure_socket()
{
    std::lock_guard<std::mutex> lk(open_mu_);
    if (fd_.load() != -1)
        return true;

    int fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }
    int fd_flags = fcntl(fd, F_GETFD, 0);
    if (fd_flags != -1)
        fcntl(fd, F_SETFD, fd_flags | FD_CLOEXEC);

    fd_.store(fd);
    return true;
}

bool UdpTransport::bind(const Endpoint &local)
{
    if (bound_ && (local == local_ || (local.port == 0 && local.host == local_.host)))
        return true;
    if (bound_)
    {
        LOG_ERROR("already bound to %s", local_.to_string().c_str());
        return false;
    }

    sockaddr_in addr{};
    if (!resolve(local, addr))
        return false;
    if (!ensure_socket())
        return false;

    if (::bind(fd_.load(), reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == -1)
    {
        LOG_ERROR("bind(%s) failed: %s", local.to_string().c_str(), std::strerror(errno));
        return false;
    }

    // report the port the kernel actually picked
    sockaddr_in got{};
    socklen_t   len = sizeof(got);
    local_          = local;
    if (getsockname(fd_.load(), reinterpret_cast<sockaddr *>(&got), &len) == 0)
        local_.port = ntohs(got.sin_port);
    bound_ = true;

    LOG_DEBUG("Bound %s", local_.to_string().c_str());
    return true;
}

bool UdpTransport::send_to(const Endpoint &peer, const Datagram &d)
{
    if (d.size() > max_datagram_)
    {
        LOG_ERROR("datagram of %zu bytes exceeds %zu", d.size(), max_datagram_);
        return false;
    }
    sockaddr_in addr{};
    if (!resolve(peer, addr))
        return false;
    if (!ensure_socket())
        return false;

    while (true)
    {
        ssize_t n = sendto(fd_.load(), d.data(), d.size(), 0, reinterpret_cast<sockaddr *>(&addr),
                           sizeof(addr));
        if (n == static_cast<ssize_t>(d.size()))
            return true;
        if (n == -1 && errno == EINTR)
            continue;
        if (n == -1)
            LOG_ERROR("sendto(%s) failed: %s", peer.to_string().c_str(), std::strerror(errno));
        else
            LOG_ERROR("sendto(%s) short write (%zd of %zu)", peer.to_string().c_str(), n,
                      d.size());
        return false;
    }
}

bool UdpTransport::recv_from(Datagram &out, Endpoint &from)
{
    const int fd = fd_.load();
    if (fd == -1)
    {
        LOG_ERROR("recv on closed socket");
        return false;
    }

    // one spare byte tells an exactly-full datagram from a truncated one
    out.resize(max_datagram_ + 1);
    sockaddr_in addr{};
    socklen_t   len = sizeof(addr);
    ssize_t     n;
    while (true)
    {
        n = recvfrom(fd, out.data(), out.size(), 0, reinterpret_cast<sockaddr *>(&addr), &len);
        if (n >= 0)
            break;
        if (errno == EINTR)
            continue;
        LOG_ERROR("recvfrom() failed: %s", std::strerror(errno));
        out.clear();
        return false;
    }
    if (static_cast<std::size_t>(n) > max_datagram_)
    {
        LOG_ERROR("datagram truncated (larger than %zu bytes)", max_datagram_);
        out.clear();
        return false;
    }
    out.resize(static_cast<std::size_t>(n));

    char host[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &addr.sin_addr, host, sizeof(host));
    from.host = host;
    from.port = ntohs(addr.sin_port);
    return true;
}

void UdpTransport::close()
{
    int fd = fd_.exchange(-1);
    if (fd != -1)
        ::close(fd);
    bound_ = false;
}

bool UdpTransport::is_open() const
{
    return fd_.load() != -1;
}

}  // namespace transport
