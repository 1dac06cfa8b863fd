#pragma once
#include <chrono>
#include <string>
#include "Core/interfaces/IReadinessCheck.hpp"

/**
 * @brief Waits for the guest SSH service behind a forwarded port
 *
 * A connect failure is retried at once. A connection that yields no data
 * (the user-mode network stack accepts before the guest listens) is closed
 * and retried after readRetryDelay. The first byte received ends the wait.
 */
class ReadinessWaiter : public IReadinessCheck {
public:
    struct Settings {
        std::chrono::milliseconds timeout{std::chrono::minutes(10)};
        std::chrono::milliseconds readRetryDelay{1000};
        // granularity at which cancellation and the deadline are observed
        std::chrono::milliseconds pollInterval{50};
    };

    ReadinessWaiter();
    explicit ReadinessWaiter(Settings settings);
    ~ReadinessWaiter() override = default;

    /**
     * @throws ReadinessTimeout when the deadline passes first
     * @throws OperationCancelled when token is cancelled
     */
    void waitReady(const std::string& host, int port, const CONCURRENCY::CancellationToken& token) override;

private:
    Settings settings;
};
