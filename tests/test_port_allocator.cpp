#include <gtest/gtest.h>

#include "port_allocator.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace mcpgw;

namespace {

// Holds a listening socket on 127.0.0.1:port for the lifetime of the object.
class PortSquatter {
public:
    explicit PortSquatter(int port) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        ok_ = ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 && ::listen(fd_, 1) == 0;
    }
    ~PortSquatter() {
        if (fd_ >= 0) ::close(fd_);
    }
    bool ok() const { return ok_; }

private:
    int fd_ = -1;
    bool ok_ = false;
};

}  // namespace

class PortAllocatorTest : public ::testing::Test {
protected:
    PortAllocator ports{PortRange{18600, 18603}};
};

TEST_F(PortAllocatorTest, HandsOutDistinctPortsUntilExhausted) {
    std::set<int> seen;
    for (int i = 0; i < 4; i++) {
        GatewayError err;
        auto p = ports.Reserve("svc" + std::to_string(i), std::nullopt, &err);
        ASSERT_TRUE(p.has_value()) << err.ToString();
        EXPECT_GE(*p, 18600);
        EXPECT_LE(*p, 18603);
        EXPECT_TRUE(seen.insert(*p).second);
    }
    GatewayError err;
    EXPECT_FALSE(ports.Reserve("extra", std::nullopt, &err).has_value());
    EXPECT_EQ(err.code, ErrorCode::kNoPortsAvailable);
}

TEST_F(PortAllocatorTest, ReleasedPortCanBeReservedAgain) {
    GatewayError err;
    std::vector<int> held;
    for (int i = 0; i < 4; i++) held.push_back(*ports.Reserve("svc", std::nullopt, &err));
    EXPECT_TRUE(ports.Release(held[2]));
    EXPECT_FALSE(ports.Release(held[2]));
    auto again = ports.Reserve("late", std::nullopt, &err);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, held[2]);
    EXPECT_EQ(ports.OwnerOf(held[2]), "late");
}

TEST_F(PortAllocatorTest, HintIsHonouredWhenFree) {
    GatewayError err;
    auto p = ports.Reserve("svc", 18602, &err);
    ASSERT_TRUE(p.has_value()) << err.ToString();
    EXPECT_EQ(*p, 18602);
    EXPECT_TRUE(ports.IsReserved(18602));
}

TEST_F(PortAllocatorTest, HintHeldInProcessIsConflict) {
    GatewayError err;
    ASSERT_TRUE(ports.Reserve("first", 18601, &err).has_value());
    EXPECT_FALSE(ports.Reserve("second", 18601, &err).has_value());
    EXPECT_EQ(err.code, ErrorCode::kPortConflict);
    EXPECT_EQ(ports.OwnerOf(18601), "first");
}

TEST_F(PortAllocatorTest, HintBusyElsewhereFallsBackToScan) {
    PortSquatter squatter(18600);
    ASSERT_TRUE(squatter.ok());
    GatewayError err;
    auto p = ports.Reserve("svc", 18600, &err);
    ASSERT_TRUE(p.has_value()) << err.ToString();
    EXPECT_NE(*p, 18600);
}

TEST_F(PortAllocatorTest, SkipsPortsBoundByOtherProcesses) {
    PortSquatter a(18600);
    PortSquatter b(18601);
    ASSERT_TRUE(a.ok() && b.ok());
    EXPECT_FALSE(PortAllocator::ProbeBindable("127.0.0.1", 18600));
    GatewayError err;
    auto p1 = ports.Reserve("x", std::nullopt, &err);
    auto p2 = ports.Reserve("y", std::nullopt, &err);
    ASSERT_TRUE(p1 && p2);
    EXPECT_EQ(std::set<int>({*p1, *p2}), std::set<int>({18602, 18603}));
    EXPECT_FALSE(ports.Reserve("z", std::nullopt, &err).has_value());
}

TEST(PortAllocatorConcurrencyTest, ConcurrentReservationsNeverCollide) {
    PortAllocator ports(PortRange{18620, 18659});
    std::mutex mu;
    std::vector<int> got;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 5; i++) {
                GatewayError err;
                if (auto p = ports.Reserve("t" + std::to_string(t), std::nullopt, &err)) {
                    std::lock_guard<std::mutex> lock(mu);
                    got.push_back(*p);
                }
            }
        });
    }
    for (auto& th : threads) th.join();
    std::set<int> unique(got.begin(), got.end());
    EXPECT_EQ(unique.size(), got.size());
    EXPECT_EQ(ports.Reserved().size(), got.size());
}
