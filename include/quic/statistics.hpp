#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace quic
{

using Clock = std::chrono::steady_clock;

struct StreamStats
{
    std::uint32_t stream_id{0};  // 0 for the connection aggregate
    std::uint64_t packets{0};
    std::uint64_t frames{0};
    std::uint64_t total_bytes{0};    // datagram bytes, headers included
    std::uint64_t payload_bytes{0};  // frame data only

    std::optional<Clock::time_point> started;  // set while a timing window is open
    std::optional<double>            elapsed;  // seconds, summed over closed windows

    // Rates are empty when no window was closed or it took no measurable time
    std::optional<double> byte_rate() const;
    std::optional<double> packet_rate() const;
};

// Counters for one connection, fed by StreamReceiver only
class Statistics
{
  public:
    void on_stream_first(std::uint32_t stream_id, Clock::time_point now);
    void on_stream_last(std::uint32_t stream_id, Clock::time_point now);
    void on_data_fin(Clock::time_point now);
    void on_frames(std::uint32_t stream_id, std::size_t frames, std::size_t payload_bytes);
    void on_packet(std::uint32_t stream_id, std::size_t wire_bytes);

    const StreamStats                          &total() const { return total_; }
    const std::map<std::uint32_t, StreamStats> &streams() const { return streams_; }
    const StreamStats                          *stream(std::uint32_t stream_id) const;

    std::string report() const;

  private:
    StreamStats &entry(std::uint32_t stream_id);

    StreamStats                          total_;
    std::map<std::uint32_t, StreamStats> streams_;
};

}  // namespace quic
