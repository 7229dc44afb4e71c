#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <netinet/in.h>
#include <thread>

#include "quic/connection.hpp"
#include "quic/stream_receiver.hpp"
#include "quic/stream_sender.hpp"
#include "transport/udp_transport.hpp"

using namespace quic;
using transport::Datagram;
using transport::Endpoint;
using transport::UdpTransport;
using uquic::Status;

TEST(Udp, ResolveNumericAndAny)
{
    sockaddr_in sa{};
    ASSERT_TRUE(transport::resolve(Endpoint{"127.0.0.1", 4269}, sa));
    EXPECT_EQ(sa.sin_family, AF_INET);
    EXPECT_EQ(ntohs(sa.sin_port), 4269);
    EXPECT_EQ(ntohl(sa.sin_addr.s_addr), 0x7F000001u);

    ASSERT_TRUE(transport::resolve(Endpoint{"0.0.0.0", 1}, sa));
    EXPECT_EQ(sa.sin_addr.s_addr, htonl(INADDR_ANY));
    ASSERT_TRUE(transport::resolve(Endpoint{"", 1}, sa));
    EXPECT_EQ(sa.sin_addr.s_addr, htonl(INADDR_ANY));
}

TEST(Udp, BindEphemeralAndExchange)
{
    UdpTransport a, b;
    ASSERT_TRUE(a.bind(Endpoint{"127.0.0.1", 0}));
    ASSERT_NE(a.local_endpoint().port, 0);
    // rebinding to the bound endpoint is a no-op
    EXPECT_TRUE(a.bind(a.local_endpoint()));

    Datagram d = {9, 8, 7};
    ASSERT_TRUE(b.send_to(a.local_endpoint(), d));

    Datagram got;
    Endpoint from;
    ASSERT_TRUE(a.recv_from(got, from));
    EXPECT_EQ(got, d);
    EXPECT_EQ(from.host, "127.0.0.1");
    EXPECT_NE(from.port, 0);
}

TEST(Udp, RejectsOversizedSend)
{
    UdpTransport a(64), b;
    ASSERT_TRUE(b.bind(Endpoint{"127.0.0.1", 0}));
    EXPECT_FALSE(a.send_to(b.local_endpoint(), Datagram(65, 0)));
}

TEST(Udp, RecvAfterCloseFails)
{
    UdpTransport a;
    ASSERT_TRUE(a.bind(Endpoint{"127.0.0.1", 0}));
    a.close();
    EXPECT_FALSE(a.is_open());

    Datagram got;
    Endpoint from;
    EXPECT_FALSE(a.recv_from(got, from));
}

TEST(Udp, EndToEnd)
{
    // bind first so the SYN cannot arrive before the listener exists
    auto server_tx = std::make_unique<UdpTransport>();
    ASSERT_TRUE(server_tx->bind(Endpoint{"127.0.0.1", 0}));
    const Endpoint addr = server_tx->local_endpoint();

    Connection server(std::move(server_tx));
    Connection client(std::make_unique<UdpTransport>());

    Status      listen_st = Status::IoError;
    std::thread th([&] { listen_st = server.listen(addr); });
    ASSERT_EQ(client.connect(addr), Status::Ok);
    th.join();
    ASSERT_EQ(listen_st, Status::Ok);

    SenderOptions opt;
    opt.frame_min = 1000;
    opt.frame_max = 1000;
    opt.pacing    = std::chrono::microseconds(100);

    StreamMap sent{{1, Bytes(2500, 'A')}, {2, Bytes(900, 'B')}};
    Bytes     big(200000);
    for (std::size_t i = 0; i < big.size(); ++i)
        big[i] = static_cast<std::uint8_t>(i % 253);
    sent[3] = big;

    StreamReceiver rx(server);
    StreamMap      got;
    Status         rx_st = Status::IoError;
    std::thread    reader([&] { rx_st = rx.receive(got); });

    StreamSender tx(client, opt);
    ASSERT_EQ(tx.send(sent), Status::Ok);
    reader.join();

    ASSERT_EQ(rx_st, Status::Ok);
    EXPECT_EQ(got, sent);

    client.close();
    StreamMap rest;
    EXPECT_EQ(rx.receive(rest), Status::EndOfConnection);
    EXPECT_TRUE(server.is_closed());
}
