#pragma once

#include <atomic>
#include <memory>
#include <utility>

namespace rdm {

class StopToken {
public:
    StopToken() = default;

    [[nodiscard]] bool stopRequested() const noexcept {
        return state_ && state_->load(std::memory_order_acquire);
    }

private:
    friend class StopSource;
    explicit StopToken(std::shared_ptr<std::atomic<bool>> state) : state_(std::move(state)) {}

    std::shared_ptr<std::atomic<bool>> state_;
};

// One source per transfer task. A fresh source is made for every task start.
class StopSource {
public:
    StopSource() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    void requestStop() noexcept { state_->store(true, std::memory_order_release); }
    [[nodiscard]] bool stopRequested() const noexcept { return state_->load(std::memory_order_acquire); }
    [[nodiscard]] StopToken token() const { return StopToken{state_}; }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

} // namespace rdm
