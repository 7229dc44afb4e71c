#include <cerrno>
#include <cstdlib>
#include <utility>

#include "util/config.hpp"
#include "util/log.hpp"

namespace config
{

bool parse_ulong(const char *text, unsigned long lo, unsigned long hi, unsigned long &out)
{
    if (!text || !*text)
        return false;
    char *end = nullptr;
    errno     = 0;
    unsigned long v = std::strtoul(text, &end, 10);
    if (errno != 0 || !end || *end != '\0' || text[0] == '-')
        return false;
    if (v < lo || v > hi)
        return false;
    out = v;
    return true;
}

namespace
{

// Read one numeric env var; keep `dst` on absence or bad input
template <typename T>
void env_number(const char *key, unsigned long lo, unsigned long hi, T &dst)
{
    const char *e = std::getenv(key);
    if (!e)
        return;
    unsigned long v = 0;
    if (parse_ulong(e, lo, hi, v))
    {
        dst = static_cast<T>(v);
        LOG_DEBUG("Using %s=%lu", key, v);
    }
    else
    {
        LOG_WARN("Ignoring invalid %s='%s' (expect %lu..%lu)", key, e, lo, hi);
    }
}

}  // namespace

void normalize(Settings &s)
{
    if (s.max_datagram <= wire::PACKET_HDR_SIZE + wire::FRAME_HDR_SIZE)
    {
        LOG_WARN("max_datagram %zu too small, using %zu", s.max_datagram, wire::MAX_DATAGRAM_SIZE);
        s.max_datagram = wire::MAX_DATAGRAM_SIZE;
    }
    if (s.frame_min == 0)
        s.frame_min = 1;
    if (s.frame_max == 0)
        s.frame_max = 1;
    if (s.frame_min > s.frame_max)
    {
        LOG_WARN("frame range [%zu, %zu] reversed, swapping", s.frame_min, s.frame_max);
        std::swap(s.frame_min, s.frame_max);
    }

    const std::size_t budget = wire::max_frame_data(s.max_datagram);
    if (s.frame_max > budget)
    {
        LOG_WARN("frame_max %zu exceeds packet budget, clamping to %zu", s.frame_max, budget);
        s.frame_max = budget;
    }
    if (s.frame_min > s.frame_max)
        s.frame_min = s.frame_max;
}

Settings load_from_env()
{
    Settings s;

    if (const char *h = std::getenv("UQUIC_HOST"); h && *h)
        s.host = h;
    env_number("UQUIC_PORT", 1, 65535, s.port);
    env_number("UQUIC_MAX_DATAGRAM", 64, 65507, s.max_datagram);
    env_number("UQUIC_FRAME_MIN", 1, 65507, s.frame_min);
    env_number("UQUIC_FRAME_MAX", 1, 65507, s.frame_max);

    unsigned long pacing = static_cast<unsigned long>(s.pacing.count());
    env_number("UQUIC_PACING_US", 0, 1000000, pacing);
    s.pacing = std::chrono::microseconds(pacing);
    env_number("UQUIC_MAX_SENDERS", 1, 1024, s.max_senders);

    if (const char *l = std::getenv("UQUIC_LOG_LEVEL"); l && *l)
        s.log_level = l;

    normalize(s);
    return s;
}

}  // namespace config
