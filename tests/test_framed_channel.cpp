#include <gtest/gtest.h>

#include "framed_channel.hpp"

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace mcpgw;
using namespace std::chrono_literals;

namespace {

// Reads one newline-terminated line from fd; returns false on EOF.
bool ReadLine(int fd, std::string* line) {
    line->clear();
    char c = 0;
    while (true) {
        const ssize_t n = ::read(fd, &c, 1);
        if (n <= 0) return false;
        if (c == '\n') return true;
        line->push_back(c);
    }
}

void WriteLine(int fd, const std::string& line) {
    const std::string data = line + "\n";
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n <= 0) return;
        off += static_cast<size_t>(n);
    }
}

}  // namespace

// The test plays the backend: it reads what the channel writes and answers on the other pipe.
class FramedChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(::pipe(to_channel_), 0);
        ASSERT_EQ(::pipe(from_channel_), 0);
        channel_ = std::make_unique<FramedChannel>("test", to_channel_[0], from_channel_[1]);
        channel_->Start();
    }

    void TearDown() override {
        channel_->Close();
        channel_.reset();
        for (int fd : {to_channel_[0], to_channel_[1], from_channel_[0], from_channel_[1]}) {
            if (fd >= 0) ::close(fd);
        }
    }

    nlohmann::json ReadRequest() {
        std::string line;
        EXPECT_TRUE(ReadLine(from_channel_[0], &line));
        return nlohmann::json::parse(line, nullptr, false);
    }

    void Reply(const nlohmann::json& msg) { WriteLine(to_channel_[1], msg.dump()); }

    void CloseBackendOutput() {
        ::close(to_channel_[1]);
        to_channel_[1] = -1;
    }

    int to_channel_[2] = {-1, -1};
    int from_channel_[2] = {-1, -1};
    std::unique_ptr<FramedChannel> channel_;
};

TEST_F(FramedChannelTest, ResolvesCallById) {
    auto fut = channel_->Send("tools/list", nlohmann::json::object(), 2s);
    auto req = ReadRequest();
    EXPECT_EQ(req["jsonrpc"], "2.0");
    EXPECT_EQ(req["method"], "tools/list");
    Reply({{"jsonrpc", "2.0"}, {"id", req["id"]}, {"result", {{"tools", nlohmann::json::array()}}}});

    auto outcome = fut.get();
    ASSERT_TRUE(outcome.ok) << outcome.error.ToString();
    EXPECT_TRUE(outcome.result["tools"].is_array());
    EXPECT_EQ(channel_->PendingCount(), 0u);
}

TEST_F(FramedChannelTest, OutOfOrderRepliesMatchTheirCalls) {
    auto first = channel_->Send("first", nlohmann::json::object(), 2s);
    auto second = channel_->Send("second", nlohmann::json::object(), 2s);
    auto r1 = ReadRequest();
    auto r2 = ReadRequest();
    Reply({{"jsonrpc", "2.0"}, {"id", r2["id"]}, {"result", {{"which", r2["method"]}}}});
    Reply({{"jsonrpc", "2.0"}, {"id", r1["id"]}, {"result", {{"which", r1["method"]}}}});

    auto o1 = first.get();
    auto o2 = second.get();
    ASSERT_TRUE(o1.ok);
    ASSERT_TRUE(o2.ok);
    EXPECT_EQ(o1.result["which"], "first");
    EXPECT_EQ(o2.result["which"], "second");
}

TEST_F(FramedChannelTest, UpstreamErrorIsKeptVerbatim) {
    auto fut = channel_->Send("tools/call", {{"name", "nope"}}, 2s);
    auto req = ReadRequest();
    Reply({{"jsonrpc", "2.0"}, {"id", req["id"]}, {"error", {{"code", -32602}, {"message", "unknown tool"}}}});

    auto outcome = fut.get();
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.error.code, ErrorCode::kUpstreamError);
    EXPECT_EQ(outcome.rpc_error["code"], -32602);
    EXPECT_FALSE(channel_->IsClosed());
}

TEST_F(FramedChannelTest, UnansweredCallTimesOutWithoutClosing) {
    auto start = std::chrono::steady_clock::now();
    auto fut = channel_->Send("slow", nlohmann::json::object(), 150ms);
    ReadRequest();
    auto outcome = fut.get();
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.error.code, ErrorCode::kTimeout);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 150ms);
    EXPECT_FALSE(channel_->IsClosed());
    EXPECT_EQ(channel_->PendingCount(), 0u);
}

TEST_F(FramedChannelTest, EofFailsPendingCallsAndNotifiesOnce) {
    std::atomic<int> closes{0};
    channel_->OnClose([&](const GatewayError& reason) {
        EXPECT_EQ(reason.code, ErrorCode::kChannelClosed);
        closes++;
    });
    auto a = channel_->Send("a", nlohmann::json::object(), 5s);
    auto b = channel_->Send("b", nlohmann::json::object(), 5s);
    ReadRequest();
    ReadRequest();
    CloseBackendOutput();

    EXPECT_EQ(a.get().error.code, ErrorCode::kChannelClosed);
    EXPECT_EQ(b.get().error.code, ErrorCode::kChannelClosed);
    EXPECT_TRUE(channel_->IsClosed());

    auto late = channel_->Send("late", nlohmann::json::object(), 1s);
    EXPECT_EQ(late.get().error.code, ErrorCode::kChannelClosed);
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(closes.load(), 1);
}

TEST_F(FramedChannelTest, GarbageLineIsProtocolError) {
    auto fut = channel_->Send("x", nlohmann::json::object(), 5s);
    ReadRequest();
    WriteLine(to_channel_[1], "this is not json");
    auto outcome = fut.get();
    EXPECT_EQ(outcome.error.code, ErrorCode::kProtocolError);
    EXPECT_EQ(channel_->CloseReason().code, ErrorCode::kProtocolError);
}

TEST_F(FramedChannelTest, NotificationsReachHandler) {
    std::promise<std::string> got;
    auto fut = got.get_future();
    channel_->OnNotification([&](const std::string& method, const nlohmann::json& params) {
        got.set_value(method + ":" + params.value("level", ""));
    });
    Reply({{"jsonrpc", "2.0"}, {"method", "notifications/message"}, {"params", {{"level", "info"}}}});
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), "notifications/message:info");
}

TEST_F(FramedChannelTest, AnswersServerPingAndRejectsOtherRequests) {
    Reply({{"jsonrpc", "2.0"}, {"id", 41}, {"method", "ping"}});
    auto pong = ReadRequest();
    EXPECT_EQ(pong["id"], 41);
    EXPECT_TRUE(pong["result"].is_object());

    Reply({{"jsonrpc", "2.0"}, {"id", "s-1"}, {"method", "sampling/createMessage"}});
    auto rejected = ReadRequest();
    EXPECT_EQ(rejected["id"], "s-1");
    EXPECT_EQ(rejected["error"]["code"], -32601);
}

TEST_F(FramedChannelTest, NotifyWritesMessageWithoutId) {
    GatewayError err;
    ASSERT_TRUE(channel_->Notify("notifications/initialized", nlohmann::json::object(), &err)) << err.ToString();
    auto msg = ReadRequest();
    EXPECT_EQ(msg["method"], "notifications/initialized");
    EXPECT_FALSE(msg.contains("id"));
}

TEST_F(FramedChannelTest, ConcurrentSendersNeverInterleave) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 20;
    std::vector<std::thread> senders;
    std::vector<std::future<RpcOutcome>> futures[kThreads];
    for (int t = 0; t < kThreads; t++) {
        senders.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; i++) {
                futures[t].push_back(channel_->Send("m", {{"pad", std::string(512, 'x')}}, 5s));
            }
        });
    }
    std::thread peer([&] {
        for (int i = 0; i < kThreads * kPerThread; i++) {
            std::string line;
            if (!ReadLine(from_channel_[0], &line)) return;
            auto req = nlohmann::json::parse(line, nullptr, false);
            ASSERT_FALSE(req.is_discarded()) << line.substr(0, 80);
            Reply({{"jsonrpc", "2.0"}, {"id", req["id"]}, {"result", nlohmann::json::object()}});
        }
    });
    for (auto& s : senders) s.join();
    peer.join();
    for (auto& per : futures) {
        for (auto& f : per) EXPECT_TRUE(f.get().ok);
    }
}
