#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace constants
{
// Defaults shared by the drivers and config::Settings
inline constexpr std::string_view DEFAULT_HOST        = "127.0.0.1";
inline constexpr std::uint16_t    DEFAULT_PORT        = 4269;
inline constexpr std::size_t      DEFAULT_FRAME_MIN   = 1000;  // frame data bytes
inline constexpr std::size_t      DEFAULT_FRAME_MAX   = 2000;
inline constexpr std::uint32_t    DEFAULT_PACING_US   = 1000;  // delay after each packet of a stream
inline constexpr std::size_t      DEFAULT_MAX_SENDERS = 64;  // sender threads per batch

// Sender waits this long between DATA_FIN and FIN so the receiver can drain its socket
inline constexpr std::uint32_t CLOSE_LINGER_MS = 10;

}  // namespace constants
