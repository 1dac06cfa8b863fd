#pragma once
#include <atomic>
#include <memory>

namespace CONCURRENCY {

// Copies share one flag, so a copy handed to a blocking call can be cancelled from another thread.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true); }
    [[nodiscard]] bool isCancelled() const noexcept { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace CONCURRENCY
