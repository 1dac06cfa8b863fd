#include "resources/allocation/PortAllocator.hpp"
#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"

#include <algorithm>
#include <boost/asio.hpp>
#include <thread>

PortAllocator::PortAllocator(int maxAttempts, std::chrono::milliseconds retryDelay)
    : maxAttempts(maxAttempts < 1 ? 1 : maxAttempts), retryDelay(retryDelay) {}

int PortAllocator::bindEphemeral() {
    using boost::asio::ip::tcp;
    boost::asio::io_context io_context;
    tcp::acceptor acceptor(io_context);
    boost::system::error_code ec;

    acceptor.open(tcp::v4(), ec);
    if (!ec) acceptor.bind(tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0), ec);
    if (!ec) acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        throw AllocationExhausted("cannot bind loopback listener: " + ec.message());
    }

    const auto endpoint = acceptor.local_endpoint(ec);
    boost::system::error_code closeEc;
    acceptor.close(closeEc);
    if (ec) {
        throw AllocationExhausted("cannot read listener address: " + ec.message());
    }
    return endpoint.port();
}

int PortAllocator::allocate() {
    for (int attempt = 0; attempt < maxAttempts; ++attempt) {
        const int port = bindEphemeral();
        if (port != 0) {
            QHLOG_TRACE("leased tcp port {}", port);
            return port;
        }
        std::this_thread::sleep_for(retryDelay);
    }
    throw AllocationExhausted("unable to allocate tcp port after " + std::to_string(maxAttempts) + " attempts");
}

std::vector<int> PortAllocator::allocateDistinct(std::size_t count) {
    std::vector<int> ports;
    ports.reserve(count);
    int redraws = 0;
    while (ports.size() < count) {
        const int port = allocate();
        if (std::find(ports.begin(), ports.end(), port) != ports.end()) {
            if (++redraws >= maxAttempts) {
                throw AllocationExhausted("kernel keeps returning already leased port " + std::to_string(port));
            }
            continue;
        }
        ports.push_back(port);
    }
    return ports;
}
