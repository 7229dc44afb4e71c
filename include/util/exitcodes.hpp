#pragma once

namespace exitc
{
inline constexpr int ok               = 0;
inline constexpr int bad_args         = 2;
inline constexpr int file_error       = 3;
inline constexpr int handshake_failed = 4;
inline constexpr int protocol_error   = 5;
}  // namespace exitc
