#include <gtest/gtest.h>
#include "transport/PipeTransport.hpp"
#include "protocol/Messages.hpp"
#include "support/TestPaths.hpp"
#include <thread>
#include <vector>

using namespace mcp_host;
using namespace std::chrono_literals;

class PipeTransportTest : public ::testing::Test {
protected:
    PipeTransportTest() : logs_("pipe-logs") {
        options_.logs_dir = logs_.path();
        options_.poll_interval = 50ms;
        options_.min_stable_time = 200ms;
        options_.max_stabilization = 1000ms;
        options_.graceful_timeout = 2000ms;
        options_.kill_timeout = 2000ms;
    }

    void start_stub(ProcessSupervisor& supervisor, ServerId id, std::vector<std::string> extra = {}) {
        std::vector<std::string> args = {"--script", test::fixture("stub_script.json").string(),
                                         "--trace", trace_file().string()};
        args.insert(args.end(), extra.begin(), extra.end());
        auto started = supervisor.start(id, "stub", test::stub_agent_path(), args);
        ASSERT_TRUE(started) << started.error().describe();
    }

    std::filesystem::path trace_file() const { return logs_.path() / "trace.txt"; }

    test::TempDir logs_;
    SupervisorOptions options_;
};

TEST_F(PipeTransportTest, RequestResponseRoundTrip) {
    ProcessSupervisor supervisor(options_);
    start_stub(supervisor, 1);
    PipeTransport transport(supervisor);

    json request = make_request("initialize", make_initialize_params());
    auto response = transport.send(1, request);

    ASSERT_TRUE(response) << response.error().describe();
    EXPECT_EQ(response.value()["id"], request["id"]);
    EXPECT_EQ(response.value()["result"]["protocolVersion"], "2025-06-18");
}

TEST_F(PipeTransportTest, JsonRpcErrorIsReturnedAsResponse) {
    ProcessSupervisor supervisor(options_);
    start_stub(supervisor, 1);
    PipeTransport transport(supervisor);

    auto response = transport.send(1, make_request("resources/list"));

    ASSERT_TRUE(response);
    EXPECT_EQ(response.value()["error"]["code"], -32601);
}

TEST_F(PipeTransportTest, UnknownServerIsNotRunning) {
    ProcessSupervisor supervisor(options_);
    PipeTransport transport(supervisor);

    auto response = transport.send(42, make_request("tools/list"));

    ASSERT_FALSE(response);
    EXPECT_EQ(response.error().code, ErrorCode::NotRunning);
    EXPECT_EQ(transport.notify(42, make_notification("ping")).error().code, ErrorCode::NotRunning);
}

TEST_F(PipeTransportTest, SilentAgentTimesOut) {
    ProcessSupervisor supervisor(options_);
    start_stub(supervisor, 1, {"--silent", "tools/list"});
    PipeTransport transport(supervisor, PipeOptions{300ms});

    auto begin = std::chrono::steady_clock::now();
    auto response = transport.send(1, make_request("tools/list"));
    auto elapsed = std::chrono::steady_clock::now() - begin;

    ASSERT_FALSE(response);
    EXPECT_EQ(response.error().code, ErrorCode::TransportTimeout);
    EXPECT_GE(elapsed, 300ms);
    EXPECT_LT(elapsed, 5s);
    EXPECT_TRUE(supervisor.is_running(1));
}

TEST_F(PipeTransportTest, PerCallTimeoutOverridesDefault) {
    ProcessSupervisor supervisor(options_);
    start_stub(supervisor, 1, {"--silent", "tools/list"});
    PipeTransport transport(supervisor, PipeOptions{60000ms});

    auto begin = std::chrono::steady_clock::now();
    auto response = transport.send(1, make_request("tools/list"), 200ms);

    ASSERT_FALSE(response);
    EXPECT_EQ(response.error().code, ErrorCode::TransportTimeout);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
}

TEST_F(PipeTransportTest, BlankLineIsProtocolError) {
    ProcessSupervisor supervisor(options_);
    start_stub(supervisor, 1, {"--blank", "tools/list"});
    PipeTransport transport(supervisor);

    auto response = transport.send(1, make_request("tools/list"));

    ASSERT_FALSE(response);
    EXPECT_EQ(response.error().code, ErrorCode::ProtocolError);
}

TEST_F(PipeTransportTest, GarbageLineIsTransportError) {
    ProcessSupervisor supervisor(options_);
    start_stub(supervisor, 1, {"--garbage", "tools/list"});
    PipeTransport transport(supervisor);

    auto response = transport.send(1, make_request("tools/list"));

    ASSERT_FALSE(response);
    EXPECT_EQ(response.error().code, ErrorCode::TransportError);
    EXPECT_NE(response.error().message.find("Invalid JSON"), std::string::npos);
}

TEST_F(PipeTransportTest, AgentClosingOutputIsTransportError) {
    ProcessSupervisor supervisor(options_);
    ASSERT_TRUE(supervisor.start(1, "oneshot", "sh", {"-c", "read line"}));
    PipeTransport transport(supervisor);

    auto response = transport.send(1, make_request("tools/list"));

    ASSERT_FALSE(response);
    EXPECT_EQ(response.error().code, ErrorCode::TransportError);
}

TEST_F(PipeTransportTest, NotificationIsDeliveredWithoutReply) {
    ProcessSupervisor supervisor(options_);
    start_stub(supervisor, 1);
    PipeTransport transport(supervisor);

    ASSERT_TRUE(transport.notify(1, make_notification("notifications/initialized")));

    // The next request still pairs with its own response
    auto response = transport.send(1, make_request("tools/list"));
    ASSERT_TRUE(response);
    EXPECT_EQ(parse_tool_list(response.value()).size(), 2u);

    std::string trace = test::read_file(trace_file());
    EXPECT_EQ(trace, "notifications/initialized\ntools/list\n");
}

TEST_F(PipeTransportTest, ConcurrentRequestsAreSerialized) {
    ProcessSupervisor supervisor(options_);
    start_stub(supervisor, 1);
    PipeTransport transport(supervisor);

    constexpr int kThreads = 4;
    constexpr int kRequests = 10;
    std::vector<std::thread> threads;
    std::vector<int> matched(kThreads, 0);

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < kRequests; ++i) {
                json request = make_request("tools/list");
                auto response = transport.send(1, request);
                if (response && response.value()["id"] == request["id"]) {
                    ++matched[t];
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int t = 0; t < kThreads; ++t) {
        EXPECT_EQ(matched[t], kRequests);
    }
}
