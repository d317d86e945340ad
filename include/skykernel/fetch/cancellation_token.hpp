#pragma once
#include <atomic>
#include <memory>
namespace skykernel::fetch {
/// Copies share one flag, so a fetch can be cancelled from another thread.
class CancellationToken {
public:
    CancellationToken()
        : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() noexcept {
        flag_->store(true, std::memory_order_release);
    }

    [[nodiscard]] bool IsCancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }
private:
    std::shared_ptr<std::atomic<bool>> flag_;
};
}
