#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

#include "quic/connection.hpp"
#include "quic/stream_receiver.hpp"
#include "transport/udp_transport.hpp"
#include "util/config.hpp"
#include "util/exitcodes.hpp"
#include "util/files.hpp"
#include "util/log.hpp"

namespace
{

static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  uquic-recv [--host <addr>] [--port <n>] [--out <dir>]\n"
                         "\n"
                         "Accepts one connection and writes stream <id> of batch <k> to\n"
                         "<dir>/batch<k>_stream<id>.bin until the sender closes.\n");
}

static std::string stream_path(const std::string &dir, unsigned batch, std::uint32_t stream_id)
{
    return dir + "/batch" + std::to_string(batch) + "_stream" + std::to_string(stream_id) +
           ".bin";
}

}  // namespace

int main(int argc, char **argv)
{
    config::Settings cfg = config::load_from_env();
    uquic::set_log_level_by_name(cfg.log_level.c_str());

    // listen on all interfaces unless told otherwise
    std::string host    = std::getenv("UQUIC_HOST") ? cfg.host : std::string("0.0.0.0");
    std::string out_dir = ".";
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--host" && i + 1 < argc)
        {
            host = argv[++i];
        }
        else if (a == "--port" && i + 1 < argc)
        {
            unsigned long port = 0;
            if (!config::parse_ulong(argv[++i], 1, 65535, port))
            {
                std::fprintf(stderr, "error: invalid port: %s\n", argv[i]);
                return exitc::bad_args;
            }
            cfg.port = static_cast<std::uint16_t>(port);
        }
        else if (a == "--out" && i + 1 < argc)
        {
            out_dir = files::expand_user(argv[++i]);
        }
        else
        {
            std::fprintf(stderr, "Unknown argument: %s\n", a.c_str());
            print_usage();
            return exitc::bad_args;
        }
    }

    quic::Connection conn(std::make_unique<transport::UdpTransport>(cfg.max_datagram),
                          cfg.max_datagram);
    uquic::Status    st = conn.listen(transport::Endpoint{host, cfg.port});
    if (st != uquic::Status::Ok)
    {
        LOG_ERROR("listen on %s:%u failed: %s", host.c_str(), (unsigned)cfg.port,
                  uquic::status_name(st));
        return st == uquic::Status::HandshakeError ? exitc::handshake_failed
                                                   : exitc::protocol_error;
    }

    quic::StreamReceiver rx(conn);
    unsigned             batch = 0;
    while (true)
    {
        quic::StreamMap streams;
        st = rx.receive(streams);
        if (st == uquic::Status::EndOfConnection)
            break;
        if (st != uquic::Status::Ok)
        {
            LOG_ERROR("receive failed: %s", uquic::status_name(st));
            conn.close();
            return exitc::protocol_error;
        }

        ++batch;
        for (const auto &kv : streams)
        {
            const std::string path = stream_path(out_dir, batch, kv.first);
            if (!files::write_file(path, kv.second))
            {
                conn.close();
                return exitc::file_error;
            }
            LOG_INFO("Wrote %s (%zu bytes)", path.c_str(), kv.second.size());
        }
    }

    conn.close();
    return exitc::ok;
}
