#pragma once
#include <cstdint>

namespace uquic
{

enum class Status : std::uint8_t
{
    Ok = 0,
    CapacityExceeded,  // frame does not fit the packet payload budget
    MalformedPacket,   // decode hit an inconsistent length or an unknown flag
    HandshakeError,    // peer's first datagram lacked SYN / ACCEPT_CONNECTION
    NotEstablished,    // operation not allowed in the current connection state
    IoError,           // socket failure or truncated datagram
    EndOfConnection    // peer sent FIN; not a failure
};

inline const char *status_name(Status s)
{
    switch (s)
    {
        case Status::Ok:
            return "ok";
        case Status::CapacityExceeded:
            return "capacity exceeded";
        case Status::MalformedPacket:
            return "malformed packet";
        case Status::HandshakeError:
            return "handshake error";
        case Status::NotEstablished:
            return "not established";
        case Status::IoError:
            return "i/o error";
        case Status::EndOfConnection:
            return "end of connection";
    }
    return "?";
}

}  // namespace uquic
