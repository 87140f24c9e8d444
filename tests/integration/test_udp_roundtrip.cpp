/**
 * @file test_udp_roundtrip.cpp
 * @brief Integration tests: BufferedClient → AggregationBuffer → UdpTransport → socket.
 * @author Dimitris Kafetzis
 */

#include "client/buffered_client.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "event/event.hpp"
#include "telemetry/json_sink.hpp"
#include "transport/transport.hpp"
#include "../common/recording_transport.hpp"
#include "../common/udp_receiver.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace buffered_statsd;
using buffered_statsd::testing::CaptureSink;
using buffered_statsd::testing::UdpReceiver;

namespace {

bool contains(const std::vector<std::string>& lines, const std::string& line) {
    return std::find(lines.begin(), lines.end(), line) != lines.end();
}

}  // namespace

// ═══════════════════════════════════════════════
// Loopback Pipeline Tests
// ═══════════════════════════════════════════════

class UdpRoundtripTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = default_config();
        config_.buffer.flush_interval_ms = 3'600'000;
        config_.buffer.send_workers = 4;
        config_.statsd.prefix = "it.";

        transport_ = std::make_shared<UdpTransport>(config_.statsd.prefix,
                                                    config_.statsd.max_packet_size);
        ASSERT_TRUE(transport_->connect("127.0.0.1", receiver_.port()));
    }

    UdpReceiver receiver_;
    Config config_;
    std::shared_ptr<UdpTransport> transport_;
    Logger logger_{std::make_unique<NullSink>(), LogLevel::Error};
};

TEST_F(UdpRoundtripTest, OneAggregatePerKey) {
    BufferedClient client(config_.buffer, transport_, logger_);
    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(client.increment("requests"));
    }
    ASSERT_TRUE(client.gauge("queue.depth", 12));
    ASSERT_TRUE(client.gauge("queue.depth", 3));
    ASSERT_TRUE(client.total("disk.reads", 4096));
    ASSERT_TRUE(client.flush());

    auto lines = receiver_.receive_lines(3);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_TRUE(contains(lines, "it.requests:100|c"));
    EXPECT_TRUE(contains(lines, "it.queue.depth:3|g"));
    EXPECT_TRUE(contains(lines, "it.disk.reads:4096|t"));

    // Nothing more until new events arrive.
    EXPECT_FALSE(receiver_.receive(std::chrono::milliseconds(50)).has_value());
}

TEST_F(UdpRoundtripTest, ConcurrentProducersFoldIntoOneLine) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 2000;

    BufferedClient client(config_.buffer, transport_, logger_);
    {
        std::vector<std::jthread> producers;
        for (int t = 0; t < kThreads; ++t) {
            producers.emplace_back([&client] {
                for (int i = 0; i < kPerThread; ++i) {
                    if (!client.increment("fanin")) return;
                }
            });
        }
    }
    ASSERT_TRUE(client.close());

    auto lines = receiver_.receive_lines(1);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "it.fanin:" + std::to_string(kThreads * kPerThread) + "|c");
    EXPECT_FALSE(transport_->is_connected());
}

TEST_F(UdpRoundtripTest, PeriodicFlushWithoutExplicitCall) {
    config_.buffer.flush_interval_ms = 30;
    BufferedClient client(config_.buffer, transport_, logger_);
    ASSERT_TRUE(client.timing("render", std::chrono::milliseconds(5)));

    auto lines = receiver_.receive_lines(5);
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_TRUE(contains(lines, "it.render.count:1|c"));
    EXPECT_TRUE(contains(lines, "it.render.p90:5|ms"));
}

TEST_F(UdpRoundtripTest, RelayedLinesAggregate) {
    BufferedClient client(config_.buffer, transport_, logger_);
    for (const auto* text : {"conns:+4|g", "conns:-1|g", "latency:2.5|ms", "latency:7.5|ms"}) {
        auto event = parse_line(text);
        ASSERT_TRUE(event) << text;
        ASSERT_TRUE(client.record(std::move(*event)));
    }
    ASSERT_TRUE(client.close());

    auto lines = receiver_.receive_lines(6);
    ASSERT_EQ(lines.size(), 6u);
    EXPECT_TRUE(contains(lines, "it.conns:+3|g"));
    EXPECT_TRUE(contains(lines, "it.latency.count:2|c"));
    EXPECT_TRUE(contains(lines, "it.latency.avg:5|ms"));
    EXPECT_TRUE(contains(lines, "it.latency.max:7.5|ms"));
}

TEST_F(UdpRoundtripTest, DryRunLogsInsteadOfSending) {
    auto lines = std::make_shared<std::vector<std::string>>();
    Logger capture(std::make_unique<CaptureSink>(lines), LogLevel::Info, "dry_run");
    auto dry = std::make_shared<LogTransport>(capture, "it.");
    {
        BufferedClient client(config_.buffer, dry, logger_);
        ASSERT_TRUE(client.increment("dry", 2));
        ASSERT_TRUE(client.close());
    }

    ASSERT_EQ(lines->size(), 1u);
    EXPECT_NE(lines->front().find("it.dry:2|c"), std::string::npos);
    EXPECT_FALSE(receiver_.receive(std::chrono::milliseconds(50)).has_value());
}
