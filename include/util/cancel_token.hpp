#pragma once

#include <atomic>
#include <memory>

namespace canister {

// Shared cancel flag. Copies observe the same flag.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic_bool>(false)) {}

    void Cancel() const { flag_->store(true, std::memory_order_relaxed); }
    bool IsCancelled() const { return flag_->load(std::memory_order_relaxed); }

private:
    std::shared_ptr<std::atomic_bool> flag_;
};

} // namespace canister
