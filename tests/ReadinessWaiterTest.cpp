#include <gtest/gtest.h>

#include <atomic>
#include <boost/asio.hpp>
#include <thread>

#include "Virtualization/Utils/VmException.hpp"
#include "Virtualization/vmm/ReadinessWaiter.hpp"
#include "resources/allocation/PortAllocator.hpp"

using namespace std::chrono_literals;
using boost::asio::ip::tcp;

namespace {

// Loopback listener that drops the first `silentAccepts` connections, then greets like sshd.
class BannerServer {
public:
    explicit BannerServer(int silentAccepts, bool sendBanner = true)
        : acceptor(io, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)),
          silentLeft(silentAccepts), sendBanner(sendBanner) {
        worker = std::thread([this] { serve(); });
    }

    ~BannerServer() {
        stopping = true;
        boost::asio::io_context wakeIo;
        tcp::socket wake(wakeIo);
        boost::system::error_code ec;
        wake.connect(tcp::endpoint(boost::asio::ip::address_v4::loopback(), port()), ec);
        worker.join();
    }

    [[nodiscard]] int port() const { return acceptor.local_endpoint().port(); }
    [[nodiscard]] int accepted() const { return accepts.load(); }

private:
    void serve() {
        std::vector<tcp::socket> held;
        while (!stopping) {
            tcp::socket socket(io);
            boost::system::error_code ec;
            acceptor.accept(socket, ec);
            if (ec || stopping) return;
            ++accepts;
            if (silentLeft > 0) {
                --silentLeft;
                socket.close(ec);
                continue;
            }
            if (sendBanner) {
                boost::asio::write(socket, boost::asio::buffer(std::string("SSH-2.0-OpenSSH_9.0\r\n")), ec);
            }
            // keep the connection open so the client sees data or silence, not EOF
            held.push_back(std::move(socket));
        }
    }

    boost::asio::io_context io;
    tcp::acceptor acceptor;
    int silentLeft;
    bool sendBanner;
    std::atomic<bool> stopping{false};
    std::atomic<int> accepts{0};
    std::thread worker;
};

ReadinessWaiter::Settings fastSettings(std::chrono::milliseconds timeout) {
    ReadinessWaiter::Settings settings;
    settings.timeout = timeout;
    settings.readRetryDelay = 20ms;
    settings.pollInterval = 10ms;
    return settings;
}

} // namespace

TEST(ReadinessWaiterTest, ReturnsOnFirstByte) {
    BannerServer server(0);
    ReadinessWaiter waiter(fastSettings(5s));
    EXPECT_NO_THROW(waiter.waitReady("127.0.0.1", server.port(), CONCURRENCY::CancellationToken()));
    EXPECT_EQ(server.accepted(), 1);
}

TEST(ReadinessWaiterTest, RetriesWhenConnectionClosesWithoutData) {
    BannerServer server(3);
    ReadinessWaiter waiter(fastSettings(5s));
    EXPECT_NO_THROW(waiter.waitReady("127.0.0.1", server.port(), CONCURRENCY::CancellationToken()));
    EXPECT_EQ(server.accepted(), 4);
}

TEST(ReadinessWaiterTest, HonoursDeadlineWhenNothingListens) {
    PortAllocator ports;
    const int port = ports.allocate();
    ReadinessWaiter waiter(fastSettings(300ms));

    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(waiter.waitReady("127.0.0.1", port, CONCURRENCY::CancellationToken()), ReadinessTimeout);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(ReadinessWaiterTest, HonoursDeadlineWhenPeerStaysSilent) {
    BannerServer server(0, false);
    ReadinessWaiter waiter(fastSettings(300ms));
    EXPECT_THROW(waiter.waitReady("127.0.0.1", server.port(), CONCURRENCY::CancellationToken()), ReadinessTimeout);
}

TEST(ReadinessWaiterTest, CancellationFromAnotherThread) {
    BannerServer server(0, false);
    ReadinessWaiter waiter(fastSettings(30s));
    CONCURRENCY::CancellationToken token;

    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(100ms);
        token.cancel();
    });
    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(waiter.waitReady("127.0.0.1", server.port(), token), OperationCancelled);
    canceller.join();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(ReadinessWaiterTest, AlreadyCancelledTokenReturnsAtOnce) {
    CONCURRENCY::CancellationToken token;
    token.cancel();
    ReadinessWaiter waiter(fastSettings(30s));
    EXPECT_THROW(waiter.waitReady("127.0.0.1", 1, token), OperationCancelled);
}
