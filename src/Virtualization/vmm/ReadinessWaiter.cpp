#include "Virtualization/vmm/ReadinessWaiter.hpp"
#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"

#include <algorithm>
#include <array>
#include <boost/asio.hpp>
#include <thread>

namespace asio = boost::asio;
using asio::ip::tcp;
using Clock = std::chrono::steady_clock;

namespace {

void throwIfAborted(const CONCURRENCY::CancellationToken& token, Clock::time_point deadline,
                    const std::string& target) {
    if (token.isCancelled()) {
        throw OperationCancelled("wait for " + target + " cancelled");
    }
    if (Clock::now() >= deadline) {
        throw ReadinessTimeout("no response from " + target + " before deadline");
    }
}

// Runs pending handlers until they finish; aborts the socket on cancellation or deadline.
void drive(asio::io_context& io, tcp::socket& socket, std::chrono::milliseconds poll,
           const CONCURRENCY::CancellationToken& token, Clock::time_point deadline, const std::string& target) {
    io.restart();
    for (;;) {
        io.run_for(poll);
        if (io.stopped()) return;
        if (token.isCancelled() || Clock::now() >= deadline) {
            boost::system::error_code ignored;
            socket.close(ignored);
            io.run();
            throwIfAborted(token, deadline, target);
        }
    }
}

void pause(std::chrono::milliseconds delay, std::chrono::milliseconds poll,
           const CONCURRENCY::CancellationToken& token, Clock::time_point deadline, const std::string& target) {
    const auto wakeAt = std::min(Clock::now() + delay, deadline);
    while (Clock::now() < wakeAt) {
        throwIfAborted(token, deadline, target);
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(wakeAt - Clock::now());
        std::this_thread::sleep_for(std::min(poll, std::max(left, std::chrono::milliseconds(1))));
    }
}

} // namespace

ReadinessWaiter::ReadinessWaiter() : ReadinessWaiter(Settings{}) {}

ReadinessWaiter::ReadinessWaiter(Settings settings) : settings(settings) {}

void ReadinessWaiter::waitReady(const std::string& host, int port, const CONCURRENCY::CancellationToken& token) {
    const std::string target = host + ":" + std::to_string(port);
    const auto deadline = Clock::now() + settings.timeout;

    asio::io_context io;
    tcp::resolver resolver(io);
    std::size_t attempts = 0;

    for (;;) {
        throwIfAborted(token, deadline, target);
        ++attempts;

        boost::system::error_code ec;
        const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (ec || endpoints.empty()) {
            continue;
        }

        tcp::socket socket(io);
        boost::system::error_code connectResult = asio::error::would_block;
        asio::async_connect(socket, endpoints,
                            [&](const boost::system::error_code& e, const tcp::endpoint&) { connectResult = e; });
        drive(io, socket, settings.pollInterval, token, deadline, target);
        if (connectResult) {
            continue;
        }

        std::array<char, 1> byte{};
        boost::system::error_code readResult = asio::error::would_block;
        std::size_t received = 0;
        socket.async_read_some(asio::buffer(byte), [&](const boost::system::error_code& e, std::size_t n) {
            readResult = e;
            received = n;
        });
        drive(io, socket, settings.pollInterval, token, deadline, target);
        if (readResult || received == 0) {
            boost::system::error_code ignored;
            socket.close(ignored);
            pause(settings.readRetryDelay, settings.pollInterval, token, deadline, target);
            continue;
        }

        QHLOG_INFO("{} is reachable after {} attempt(s)", target, attempts);
        return;
    }
}
