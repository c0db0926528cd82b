#include "CompletionBridge.hpp"

namespace XHCD::Reactor {

bool CompletionState::Resolve(CompletionResult result) {
    CompletionCallback continuation;
    {
        std::lock_guard guard(lock_);
        if (result_.has_value()) {
            return false;
        }
        result_.emplace(std::move(result));
        continuation = std::move(continuation_);
        continuation_ = nullptr;
    }
    cv_.notify_all();

    if (continuation) {
        continuation(*result_);
    }
    return true;
}

CompletionResult CompletionState::Wait() {
    std::unique_lock guard(lock_);
    cv_.wait(guard, [this] { return result_.has_value(); });
    return *result_;
}

std::optional<CompletionResult> CompletionState::WaitFor(std::chrono::nanoseconds timeout) {
    std::unique_lock guard(lock_);
    if (!cv_.wait_for(guard, timeout, [this] { return result_.has_value(); })) {
        return std::nullopt;
    }
    return *result_;
}

bool CompletionState::IsReady() const {
    std::lock_guard guard(lock_);
    return result_.has_value();
}

void CompletionState::OnComplete(CompletionCallback callback) {
    if (!callback) {
        return;
    }
    {
        std::lock_guard guard(lock_);
        if (!result_.has_value()) {
            if (!continuation_) {
                continuation_ = std::move(callback);
            } else {
                // Earlier callbacks run first
                continuation_ = [first = std::move(continuation_), next = std::move(callback)](
                                    const CompletionResult& result) {
                    first(result);
                    next(result);
                };
            }
            return;
        }
    }
    // result_ never changes once set
    callback(*result_);
}

CompletionResult CompletionFuture::Wait() const {
    if (!state_) {
        return XHCD_ERROR_NOT_READY("CompletionFuture: empty future");
    }
    return state_->Wait();
}

bool CompletionFuture::IsReady() const {
    return state_ && state_->IsReady();
}

void CompletionFuture::OnComplete(CompletionCallback callback) const {
    if (state_) {
        state_->OnComplete(std::move(callback));
    }
}

std::pair<PendingCompletion, CompletionFuture> PendingCompletion::Make(StateKind kind, bool isIsochOrVf) {
    auto state = std::make_shared<CompletionState>();
    PendingCompletion record{kind, state, isIsochOrVf, 0};
    return {std::move(record), CompletionFuture(std::move(state))};
}

} // namespace XHCD::Reactor
