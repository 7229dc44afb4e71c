#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "quic/connection.hpp"
#include "quic/stream_sender.hpp"
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
                         "  uquic-send [--host <addr>] [--port <n>] [--repeat <n>] <file>...\n"
                         "\n"
                         "Sends every file as its own stream in one batch, then closes.\n"
                         "Environment: UQUIC_HOST UQUIC_PORT UQUIC_MAX_DATAGRAM UQUIC_FRAME_MIN\n"
                         "             UQUIC_FRAME_MAX UQUIC_PACING_US UQUIC_MAX_SENDERS UQUIC_LOG_LEVEL\n");
}

}  // namespace

int main(int argc, char **argv)
{
    config::Settings cfg = config::load_from_env();
    uquic::set_log_level_by_name(cfg.log_level.c_str());

    unsigned long            repeat = 1;
    std::vector<std::string> paths;
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
            cfg.host = argv[++i];
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
        else if (a == "--repeat" && i + 1 < argc)
        {
            if (!config::parse_ulong(argv[++i], 1, 1000, repeat))
            {
                std::fprintf(stderr, "error: invalid repeat count: %s\n", argv[i]);
                return exitc::bad_args;
            }
        }
        else if (!a.empty() && a[0] == '-')
        {
            std::fprintf(stderr, "Unknown option: %s\n", a.c_str());
            print_usage();
            return exitc::bad_args;
        }
        else
        {
            paths.push_back(files::expand_user(a));
        }
    }
    if (paths.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    std::vector<quic::Bytes> blobs;
    for (const auto &p : paths)
    {
        quic::Bytes data;
        if (!files::read_file(p, data))
            return exitc::file_error;
        LOG_INFO("Loaded %s (%zu bytes)", p.c_str(), data.size());
        for (unsigned long r = 0; r < repeat; ++r)
            blobs.push_back(data);
    }

    quic::Connection conn(std::make_unique<transport::UdpTransport>(cfg.max_datagram),
                          cfg.max_datagram);
    uquic::Status    st = conn.connect(transport::Endpoint{cfg.host, cfg.port});
    if (st != uquic::Status::Ok)
    {
        LOG_ERROR("connect to %s:%u failed: %s", cfg.host.c_str(), (unsigned)cfg.port,
                  uquic::status_name(st));
        return st == uquic::Status::HandshakeError ? exitc::handshake_failed
                                                   : exitc::protocol_error;
    }

    quic::StreamSender sender(conn, quic::SenderOptions::from(cfg));
    st = sender.send_files(blobs);
    if (st != uquic::Status::Ok)
    {
        LOG_ERROR("send failed: %s", uquic::status_name(st));
        conn.close();
        return exitc::protocol_error;
    }

    // give the receiver a moment to drain DATA_FIN before FIN
    std::this_thread::sleep_for(std::chrono::milliseconds(constants::CLOSE_LINGER_MS));
    conn.close();
    return exitc::ok;
}
