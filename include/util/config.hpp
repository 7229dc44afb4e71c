#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "proto/packet.hpp"
#include "util/constants.hpp"

namespace config
{

struct Settings
{
    std::string               host = std::string(constants::DEFAULT_HOST);
    std::uint16_t             port = constants::DEFAULT_PORT;
    std::size_t               max_datagram = wire::MAX_DATAGRAM_SIZE;
    std::size_t               frame_min    = constants::DEFAULT_FRAME_MIN;
    std::size_t               frame_max    = constants::DEFAULT_FRAME_MAX;
    std::chrono::microseconds pacing{constants::DEFAULT_PACING_US};
    std::size_t               max_senders = constants::DEFAULT_MAX_SENDERS;
    std::string               log_level = "info";
};

// Defaults overridden by UQUIC_* environment variables; invalid values are
// ignored with a warning. The result is always normalized.
Settings load_from_env();

// Make the frame range usable with max_datagram: min <= max, and one frame of
// frame_max data bytes fits one packet.
void normalize(Settings &s);

// Strict decimal parse in [lo, hi]; false on junk or out of range
bool parse_ulong(const char *text, unsigned long lo, unsigned long hi, unsigned long &out);

}  // namespace config
