#include <algorithm>
#include <atomic>
#include <limits>
#include <system_error>
#include <thread>
#include <utility>

#include "quic/stream_sender.hpp"
#include "util/log.hpp"

namespace quic
{

using uquic::Status;

SenderOptions SenderOptions::from(const config::Settings &s)
{
    SenderOptions o;
    o.frame_min   = s.frame_min;
    o.frame_max   = s.frame_max;
    o.pacing      = s.pacing;
    o.max_workers = s.max_senders;
    return o;
}

StreamPlan plan_stream(std::size_t blob_size, std::size_t frame_data_size, std::size_t max_datagram)
{
    StreamPlan p;
    // a frame never outgrows one packet
    p.frame_data_size = std::max<std::size_t>(
        1, std::min(frame_data_size, wire::max_frame_data(max_datagram)));
    p.frame_count = blob_size == 0 ? 1 : (blob_size + p.frame_data_size - 1) / p.frame_data_size;
    p.frames_per_packet =
        std::max<std::size_t>(1, wire::max_payload(max_datagram) /
                                     (wire::FRAME_HDR_SIZE + p.frame_data_size));
    p.packet_count = (p.frame_count + p.frames_per_packet - 1) / p.frames_per_packet;
    return p;
}

std::vector<wire::Frame> partition(std::uint32_t stream_id, const Bytes &blob,
                                   std::size_t frame_data_size)
{
    std::vector<wire::Frame> out;
    if (frame_data_size == 0)
        return out;

    std::size_t start = 0;
    do
    {
        const std::size_t take = std::min(frame_data_size, blob.size() - start);
        wire::Frame       f;
        f.hdr.stream_id   = stream_id;
        f.hdr.offset      = static_cast<std::uint32_t>(start);
        f.hdr.data_length = take;
        f.data.assign(blob.begin() + start, blob.begin() + start + take);
        out.push_back(std::move(f));
        start += take;
    } while (start < blob.size());
    return out;
}

Status fill_packet(const std::vector<wire::Frame> &frames,
                   const StreamPlan               &plan,
                   std::size_t                     index,
                   std::size_t                     max_datagram,
                   wire::Packet                   &out)
{
    out = wire::Packet{};
    if (index == 0)
        out.flags = wire::Flag::StreamFirst;
    else if (index + 1 == plan.packet_count)
        out.flags = wire::Flag::StreamLast;
    else
        out.flags = wire::Flag::Data;

    const std::size_t first = index * plan.frames_per_packet;
    const std::size_t last  = std::min(first + plan.frames_per_packet, frames.size());
    for (std::size_t i = first; i < last; ++i)
    {
        const wire::Frame &f  = frames[i];
        Status             st = wire::add_frame(out, f.hdr.stream_id, f.hdr.offset, f.data.data(),
                                                f.data.size(), max_datagram);
        if (st != Status::Ok)
        {
            LOG_ERROR("stream %u: frame %zu does not fit packet %zu", f.hdr.stream_id, i, index);
            return st;
        }
    }
    return Status::Ok;
}

Status build_stream_packets(std::uint32_t              stream_id,
                            const Bytes               &blob,
                            std::size_t                frame_data_size,
                            std::size_t                max_datagram,
                            std::vector<wire::Packet> &out)
{
    out.clear();
    const StreamPlan plan   = plan_stream(blob.size(), frame_data_size, max_datagram);
    const auto       frames = partition(stream_id, blob, plan.frame_data_size);
    out.reserve(plan.packet_count);
    for (std::size_t i = 0; i < plan.packet_count; ++i)
    {
        wire::Packet p;
        Status       st = fill_packet(frames, plan, i, max_datagram, p);
        if (st != Status::Ok)
        {
            out.clear();
            return st;
        }
        out.push_back(std::move(p));
    }
    return Status::Ok;
}

std::size_t pick_frame_data_size(const SenderOptions &opt, std::mt19937 &rng)
{
    const std::size_t lo = std::min(opt.frame_min, opt.frame_max);
    const std::size_t hi = std::max(opt.frame_min, opt.frame_max);
    std::uniform_int_distribution<std::size_t> dist(lo, hi);
    return dist(rng);
}

StreamSender::StreamSender(Connection &conn, SenderOptions opt)
    : conn_(conn), opt_(opt), rng_(std::random_device{}())
{
}

Status StreamSender::send_stream(std::uint32_t stream_id, const Bytes &blob,
                                 std::size_t frame_data_size)
{
    const std::size_t max_datagram = conn_.max_datagram();
    const StreamPlan  plan         = plan_stream(blob.size(), frame_data_size, max_datagram);
    const auto        frames       = partition(stream_id, blob, plan.frame_data_size);
    LOG_DEBUG("stream %u: %zu bytes, frame=%zu, frames=%zu, per_packet=%zu, packets=%zu",
              stream_id, blob.size(), plan.frame_data_size, plan.frame_count,
              plan.frames_per_packet, plan.packet_count);

    for (std::size_t i = 0; i < plan.packet_count; ++i)
    {
        wire::Packet p;
        Status       st = fill_packet(frames, plan, i, max_datagram, p);
        if (st == Status::Ok)
            st = conn_.send_packet(p);
        if (st != Status::Ok)
        {
            LOG_ERROR("stream %u: packet %zu/%zu failed: %s", stream_id, i + 1, plan.packet_count,
                      uquic::status_name(st));
            return st;
        }
        // let the other streams interleave
        std::this_thread::sleep_for(opt_.pacing);
    }
    return Status::Ok;
}

Status StreamSender::send(const StreamMap &streams)
{
    if (!conn_.is_established())
    {
        LOG_ERROR("send: connection is %s", state_name(conn_.state()));
        return Status::NotEstablished;
    }

    struct Job
    {
        std::uint32_t stream_id;
        const Bytes  *blob;
        std::size_t   frame_size;
    };
    std::vector<Job> jobs;
    jobs.reserve(streams.size());
    for (const auto &kv : streams)
    {
        if (kv.first == 0 || kv.second.size() > std::numeric_limits<std::uint32_t>::max())
        {
            LOG_ERROR("send: stream %u refused (%zu bytes)", kv.first, kv.second.size());
            return Status::CapacityExceeded;
        }
        jobs.push_back(Job{kv.first, &kv.second, pick_frame_data_size(opt_, rng_)});
    }

    // Workers pull streams from a shared index until none are left or one fails
    std::vector<Status>      results(jobs.size(), Status::Ok);
    std::atomic<std::size_t> next{0};
    std::atomic<bool>        failed{false};
    auto worker = [&] {
        while (!failed.load())
        {
            const std::size_t i = next.fetch_add(1);
            if (i >= jobs.size())
                return;
            results[i] = send_stream(jobs[i].stream_id, *jobs[i].blob, jobs[i].frame_size);
            if (results[i] != Status::Ok)
                failed.store(true);
        }
    };

    const std::size_t wanted = std::min(jobs.size(), std::max<std::size_t>(1, opt_.max_workers));
    std::vector<std::thread> workers;
    workers.reserve(wanted);
    for (std::size_t w = 0; w < wanted; ++w)
    {
        try
        {
            workers.emplace_back(worker);
        }
        catch (const std::system_error &e)
        {
            // the workers already running drain the remaining streams
            LOG_WARN("send: started %zu of %zu sender threads: %s", workers.size(), wanted,
                     e.what());
            break;
        }
    }
    if (workers.empty() && !jobs.empty())
    {
        LOG_ERROR("send: no sender thread could be started");
        return Status::IoError;
    }
    for (auto &t : workers)
        t.join();

    for (Status st : results)
    {
        if (st != Status::Ok)
            return st;
    }

    LOG_INFO("Sending DATA_FIN after %zu streams", streams.size());
    wire::Packet fin;
    fin.flags = wire::Flag::DataFin;
    return conn_.send_packet(fin);
}

Status StreamSender::send_files(const std::vector<Bytes> &blobs)
{
    StreamMap streams;
    for (std::size_t i = 0; i < blobs.size(); ++i)
        streams.emplace(static_cast<std::uint32_t>(i + 1), blobs[i]);
    return send(streams);
}

}  // namespace quic
