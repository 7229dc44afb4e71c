#include <cstdio>

#include "quic/statistics.hpp"

namespace quic
{

namespace
{

void close_window(StreamStats &s, Clock::time_point now)
{
    if (!s.started)
        return;
    const double secs = std::chrono::duration<double>(now - *s.started).count();
    s.elapsed         = s.elapsed.value_or(0.0) + secs;
    s.started.reset();
}

std::optional<double> per_second(std::uint64_t count, const std::optional<double> &elapsed)
{
    if (!elapsed || *elapsed <= 0.0)
        return std::nullopt;
    return static_cast<double>(count) / *elapsed;
}

void append(std::string &out, const char *fmt, const char *label, const std::string &value)
{
    char line[160];
    std::snprintf(line, sizeof(line), fmt, label, value.c_str());
    out += line;
}

std::string num(std::uint64_t v)
{
    return std::to_string(v);
}

std::string fixed(const std::optional<double> &v, const char *unit)
{
    if (!v)
        return "undefined";
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.3f %s", *v, unit);
    return buf;
}

}  // namespace

std::optional<double> StreamStats::byte_rate() const
{
    return per_second(total_bytes, elapsed);
}

std::optional<double> StreamStats::packet_rate() const
{
    return per_second(packets, elapsed);
}

StreamStats &Statistics::entry(std::uint32_t stream_id)
{
    auto it = streams_.find(stream_id);
    if (it == streams_.end())
    {
        it                   = streams_.emplace(stream_id, StreamStats{}).first;
        it->second.stream_id = stream_id;
    }
    return it->second;
}

const StreamStats *Statistics::stream(std::uint32_t stream_id) const
{
    auto it = streams_.find(stream_id);
    return it == streams_.end() ? nullptr : &it->second;
}

void Statistics::on_stream_first(std::uint32_t stream_id, Clock::time_point now)
{
    entry(stream_id).started = now;
    // aggregate window opens with the first stream of a batch
    if (!total_.started)
        total_.started = now;
}

void Statistics::on_stream_last(std::uint32_t stream_id, Clock::time_point now)
{
    close_window(entry(stream_id), now);
}

void Statistics::on_data_fin(Clock::time_point now)
{
    close_window(total_, now);
    // single-packet streams never see STREAM_LAST; drop their open windows
    for (auto &kv : streams_)
        kv.second.started.reset();
}

void Statistics::on_frames(std::uint32_t stream_id, std::size_t frames, std::size_t payload_bytes)
{
    StreamStats &s = entry(stream_id);
    s.frames += frames;
    s.payload_bytes += payload_bytes;
    total_.frames += frames;
    total_.payload_bytes += payload_bytes;
}

void Statistics::on_packet(std::uint32_t stream_id, std::size_t wire_bytes)
{
    StreamStats &s = entry(stream_id);
    s.packets++;
    s.total_bytes += wire_bytes;
    total_.packets++;
    total_.total_bytes += wire_bytes;
}

std::string Statistics::report() const
{
    std::string out;
    out += "Connection statistics:\n";
    append(out, "  %-22s: %s\n", "Number of streams", num(streams_.size()));
    append(out, "  %-22s: %s\n", "Total packets", num(total_.packets));
    append(out, "  %-22s: %s\n", "Total frames", num(total_.frames));
    append(out, "  %-22s: %s\n", "Total bytes", num(total_.total_bytes));
    append(out, "  %-22s: %s\n", "Total payload bytes", num(total_.payload_bytes));
    append(out, "  %-22s: %s\n", "Total time", fixed(total_.elapsed, "s"));
    append(out, "  %-22s: %s\n", "Average data rate", fixed(total_.byte_rate(), "B/s"));
    append(out, "  %-22s: %s\n", "Average packet rate", fixed(total_.packet_rate(), "pkt/s"));

    for (const auto &kv : streams_)
    {
        const StreamStats &s = kv.second;
        out += "  Stream " + std::to_string(s.stream_id) + ":\n";
        append(out, "    %-20s: %s\n", "Packets", num(s.packets));
        append(out, "    %-20s: %s\n", "Frames", num(s.frames));
        append(out, "    %-20s: %s\n", "Bytes", num(s.total_bytes));
        append(out, "    %-20s: %s\n", "Payload bytes", num(s.payload_bytes));
        append(out, "    %-20s: %s\n", "Time", fixed(s.elapsed, "s"));
        append(out, "    %-20s: %s\n", "Average data rate", fixed(s.byte_rate(), "B/s"));
        append(out, "    %-20s: %s\n", "Average packet rate", fixed(s.packet_rate(), "pkt/s"));
    }
    return out;
}

}  // namespace quic
