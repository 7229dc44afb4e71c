#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace transport
{

using Datagram = std::vector<std::uint8_t>;

struct Endpoint
{
    std::string   host;
    std::uint16_t port{0};

    std::string to_string() const { return host + ":" + std::to_string(port); }
    bool operator==(const Endpoint &o) const { return host == o.host && port == o.port; }
    bool operator!=(const Endpoint &o) const { return !(*this == o); }
};

// One unreliable datagram socket. send_to() may be called from several
// threads at once; recv_from() has a single caller.
struct ITransport
{
    virtual bool        bind(const Endpoint &local)                     = 0;
    virtual bool        send_to(const Endpoint &peer, const Datagram &d) = 0;
    virtual bool        recv_from(Datagram &out, Endpoint &from)         = 0;  // blocks
    virtual void        close()                                          = 0;
    virtual bool        is_open() const                                  = 0;
    virtual std::string name() const { return ""; }
    virtual ~ITransport() = default;
};

}  // namespace transport
