#include <gtest/gtest.h>

#include <algorithm>
#include <boost/asio.hpp>
#include <set>
#include <vector>

#include "Virtualization/Utils/VmException.hpp"
#include "resources/allocation/PortAllocator.hpp"

namespace {

// Hands out a fixed sequence of kernel answers, repeating the last one.
class ScriptedPortAllocator : public PortAllocator {
public:
    ScriptedPortAllocator(std::vector<int> answers, int maxAttempts)
        : PortAllocator(maxAttempts, std::chrono::milliseconds(0)), answers(std::move(answers)) {}

    int binds{0};

protected:
    int bindEphemeral() override {
        const auto index = std::min<std::size_t>(static_cast<std::size_t>(binds), answers.size() - 1);
        ++binds;
        return answers[index];
    }

private:
    std::vector<int> answers;
};

} // namespace

TEST(PortAllocatorTest, ReturnsBindableLoopbackPort) {
    PortAllocator allocator;
    const int port = allocator.allocate();
    ASSERT_GT(port, 0);
    ASSERT_LE(port, 65535);

    // the lease is released, so the port can be bound again
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor(io);
    boost::system::error_code ec;
    acceptor.open(boost::asio::ip::tcp::v4(), ec);
    acceptor.set_option(boost::asio::socket_base::reuse_address(true), ec);
    acceptor.bind({boost::asio::ip::address_v4::loopback(), static_cast<unsigned short>(port)}, ec);
    EXPECT_FALSE(ec) << ec.message();
}

TEST(PortAllocatorTest, DistinctLeasesNeverRepeat) {
    PortAllocator allocator;
    for (int round = 0; round < 20; ++round) {
        const auto ports = allocator.allocateDistinct(2);
        ASSERT_EQ(ports.size(), 2u);
        EXPECT_NE(ports[0], ports[1]);
    }
}

TEST(PortAllocatorTest, ManyDistinctLeases) {
    PortAllocator allocator;
    const auto ports = allocator.allocateDistinct(8);
    EXPECT_EQ(std::set<int>(ports.begin(), ports.end()).size(), 8u);
}

TEST(PortAllocatorTest, ZeroCountIsEmpty) {
    PortAllocator allocator;
    EXPECT_TRUE(allocator.allocateDistinct(0).empty());
}

TEST(PortAllocatorTest, RetriesWhenKernelReportsPortZero) {
    ScriptedPortAllocator allocator({0, 0, 40123}, 5);
    EXPECT_EQ(allocator.allocate(), 40123);
    EXPECT_EQ(allocator.binds, 3);
}

TEST(PortAllocatorTest, PortZeroPastRetryBoundIsExhausted) {
    ScriptedPortAllocator allocator({0}, 4);
    EXPECT_THROW((void)allocator.allocate(), AllocationExhausted);
    EXPECT_EQ(allocator.binds, 4);
}

TEST(PortAllocatorTest, DuplicateDrawsAreRedrawn) {
    ScriptedPortAllocator allocator({5000, 5000, 5001}, 5);
    EXPECT_EQ(allocator.allocateDistinct(2), (std::vector<int>{5000, 5001}));
}

TEST(PortAllocatorTest, EndlessDuplicatesAreExhausted) {
    ScriptedPortAllocator allocator({5000}, 3);
    EXPECT_THROW((void)allocator.allocateDistinct(2), AllocationExhausted);
    // one accepted draw plus maxAttempts rejected ones
    EXPECT_EQ(allocator.binds, 4);
}
