#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "../Core/Error.hpp"
#include "CompletionTypes.hpp"

namespace XHCD::Reactor {

using CompletionResult = Result<NextEventTrb>;
using CompletionCallback = std::function<void(const CompletionResult&)>;

/**
 * Shared slot between one waiting caller and the reactor.
 *
 * Resolved exactly once; later Resolve() calls are ignored and return false.
 * The continuation, if any, runs on the resolving thread after the lock is
 * released.
 */
class CompletionState {
public:
    bool Resolve(CompletionResult result);

    [[nodiscard]] CompletionResult Wait();
    [[nodiscard]] std::optional<CompletionResult> WaitFor(std::chrono::nanoseconds timeout);
    [[nodiscard]] bool IsReady() const;

    /// Run @p callback on resolution, or immediately if already resolved.
    /// Several callbacks registered before resolution all run, in registration order.
    void OnComplete(CompletionCallback callback);

private:
    mutable std::mutex lock_;
    std::condition_variable cv_;
    std::optional<CompletionResult> result_;
    CompletionCallback continuation_;
};

/// Caller side of a pending completion
class CompletionFuture {
public:
    CompletionFuture() = default;
    explicit CompletionFuture(std::shared_ptr<CompletionState> state) noexcept : state_(std::move(state)) {}

    [[nodiscard]] bool Valid() const noexcept { return state_ != nullptr; }

    /// Block until the reactor resolves the record (no built-in timeout)
    [[nodiscard]] CompletionResult Wait() const;

    /// nullopt on timeout; the record stays pending until matched or its ring is torn down
    template <typename Rep, typename Period>
    [[nodiscard]] std::optional<CompletionResult> WaitFor(std::chrono::duration<Rep, Period> timeout) const {
        if (!state_) {
            return CompletionResult{XHCD_ERROR_NOT_READY("CompletionFuture: empty future")};
        }
        return state_->WaitFor(std::chrono::duration_cast<std::chrono::nanoseconds>(timeout));
    }

    [[nodiscard]] bool IsReady() const;
    void OnComplete(CompletionCallback callback) const;

private:
    std::shared_ptr<CompletionState> state_;
};

/// Registration record owned by the reactor once submitted
struct PendingCompletion {
    StateKind kind;
    std::shared_ptr<CompletionState> state;
    bool isIsochOrVf{false};     ///< may be resolved by a pointer-less Transfer event
    uint64_t sequence{0};        ///< assigned on submission; lower is older

    [[nodiscard]] static std::pair<PendingCompletion, CompletionFuture> Make(StateKind kind,
                                                                             bool isIsochOrVf = false);
};

} // namespace XHCD::Reactor
