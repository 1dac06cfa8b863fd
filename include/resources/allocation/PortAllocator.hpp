#pragma once
#include <chrono>
#include <cstddef>
#include <vector>

/**
 * @brief Finds free loopback TCP ports by binding an ephemeral listener
 *
 * The returned number is only a lease: the listener is closed before the
 * port is handed out, so another process may take it before the
 * hypervisor binds it.
 */
class PortAllocator {
public:
    explicit PortAllocator(int maxAttempts = 10,
                           std::chrono::milliseconds retryDelay = std::chrono::milliseconds(1));

    /**
     * @brief Leases one free port
     * @throws AllocationExhausted if the listener cannot be bound, or the
     *         OS keeps reporting port 0 past the retry bound
     */
    [[nodiscard]] int allocate();

    /**
     * @brief Leases count ports that are pairwise distinct
     * @throws AllocationExhausted after maxAttempts duplicate draws
     */
    [[nodiscard]] std::vector<int> allocateDistinct(std::size_t count);

    virtual ~PortAllocator() = default;

protected:
    // Binds 127.0.0.1:0 and returns the port the kernel picked.
    [[nodiscard]] virtual int bindEphemeral();

private:
    int maxAttempts;
    std::chrono::milliseconds retryDelay;
};
