#include <chrono>
#include <gtest/gtest.h>
#include <string>

#include "quic/statistics.hpp"

using namespace quic;
using std::chrono::milliseconds;

TEST(Statistics, CountsFramesAndPackets)
{
    Statistics st;
    st.on_frames(1, 3, 2500);
    st.on_packet(1, 2561);
    st.on_frames(2, 1, 900);
    st.on_packet(2, 929);

    EXPECT_EQ(st.total().packets, 2u);
    EXPECT_EQ(st.total().frames, 4u);
    EXPECT_EQ(st.total().payload_bytes, 3400u);
    EXPECT_EQ(st.total().total_bytes, 2561u + 929u);
    EXPECT_EQ(st.streams().size(), 2u);

    ASSERT_NE(st.stream(1), nullptr);
    EXPECT_EQ(st.stream(1)->stream_id, 1u);
    EXPECT_EQ(st.stream(1)->frames, 3u);
    EXPECT_EQ(st.stream(3), nullptr);
}

TEST(Statistics, RatesFromClosedWindow)
{
    Statistics        st;
    Clock::time_point t0 = Clock::now();

    st.on_stream_first(1, t0);
    st.on_frames(1, 10, 10000);
    st.on_packet(1, 5000);
    st.on_packet(1, 5000);
    st.on_stream_last(1, t0 + milliseconds(500));
    st.on_data_fin(t0 + milliseconds(1000));

    const StreamStats *s = st.stream(1);
    ASSERT_NE(s, nullptr);
    ASSERT_TRUE(s->elapsed.has_value());
    EXPECT_NEAR(*s->elapsed, 0.5, 1e-9);
    EXPECT_NEAR(*s->byte_rate(), 20000.0, 1e-6);
    EXPECT_NEAR(*s->packet_rate(), 4.0, 1e-9);

    ASSERT_TRUE(st.total().elapsed.has_value());
    EXPECT_NEAR(*st.total().elapsed, 1.0, 1e-9);
    EXPECT_NEAR(*st.total().byte_rate(), 10000.0, 1e-6);
}

TEST(Statistics, AggregateStartsAtFirstStream)
{
    Statistics        st;
    Clock::time_point t0 = Clock::now();

    st.on_stream_first(1, t0);
    st.on_stream_first(2, t0 + milliseconds(300));  // does not restart
    st.on_data_fin(t0 + milliseconds(400));

    ASSERT_TRUE(st.total().elapsed.has_value());
    EXPECT_NEAR(*st.total().elapsed, 0.4, 1e-9);
}

TEST(Statistics, UnclosedStreamStaysUndefined)
{
    Statistics        st;
    Clock::time_point t0 = Clock::now();

    st.on_stream_first(1, t0);
    st.on_packet(1, 100);
    st.on_data_fin(t0 + milliseconds(10));

    EXPECT_FALSE(st.stream(1)->elapsed.has_value());
    EXPECT_FALSE(st.stream(1)->started.has_value());
    EXPECT_FALSE(st.stream(1)->byte_rate().has_value());
}

TEST(Statistics, ZeroElapsedHasNoRate)
{
    Statistics        st;
    Clock::time_point t0 = Clock::now();

    st.on_stream_first(1, t0);
    st.on_packet(1, 100);
    st.on_stream_last(1, t0);

    ASSERT_TRUE(st.stream(1)->elapsed.has_value());
    EXPECT_EQ(*st.stream(1)->elapsed, 0.0);
    EXPECT_FALSE(st.stream(1)->byte_rate().has_value());
    EXPECT_FALSE(st.stream(1)->packet_rate().has_value());
}

TEST(Statistics, ElapsedAddsUpAcrossBatches)
{
    Statistics        st;
    Clock::time_point t0 = Clock::now();

    st.on_stream_first(1, t0);
    st.on_data_fin(t0 + milliseconds(200));
    st.on_stream_first(1, t0 + milliseconds(1000));
    st.on_data_fin(t0 + milliseconds(1300));

    EXPECT_NEAR(*st.total().elapsed, 0.5, 1e-9);
}

TEST(Statistics, ReportMarksUndefined)
{
    Statistics st;
    st.on_frames(7, 1, 10);
    st.on_packet(7, 39);

    std::string r = st.report();
    EXPECT_NE(r.find("Connection statistics:"), std::string::npos);
    EXPECT_NE(r.find("  Stream 7:"), std::string::npos);
    EXPECT_NE(r.find("undefined"), std::string::npos);
    EXPECT_NE(r.find("39"), std::string::npos);
}

TEST(Statistics, ReportShowsRates)
{
    Statistics        st;
    Clock::time_point t0 = Clock::now();
    st.on_stream_first(1, t0);
    st.on_packet(1, 1000);
    st.on_stream_last(1, t0 + milliseconds(1000));
    st.on_data_fin(t0 + milliseconds(1000));

    std::string r = st.report();
    EXPECT_NE(r.find("1000.000 B/s"), std::string::npos);
    EXPECT_NE(r.find("1.000 pkt/s"), std::string::npos);
}
