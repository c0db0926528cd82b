#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "CompletionBridge.hpp"

namespace XHCD::Reactor {

/// Inbound queue of registrations, drained by the reactor at the start of each pass
class PendingChannel {
public:
    /// Stamps the record with the next sequence number and queues it.
    /// A closed channel leaves @p record untouched and returns nullopt.
    [[nodiscard]] std::optional<uint64_t> Push(PendingCompletion&& record) {
        std::lock_guard guard(lock_);
        if (closed_) {
            return std::nullopt;
        }
        record.sequence = nextSequence_++;
        queue_.push_back(std::move(record));
        return queue_.back().sequence;
    }

    /// Everything queued so far, in submission order
    [[nodiscard]] std::vector<PendingCompletion> Drain() {
        std::lock_guard guard(lock_);
        std::vector<PendingCompletion> out;
        out.swap(queue_);
        return out;
    }

    /// Refuse further pushes and hand back whatever is still queued
    [[nodiscard]] std::vector<PendingCompletion> Close() {
        std::lock_guard guard(lock_);
        closed_ = true;
        std::vector<PendingCompletion> out;
        out.swap(queue_);
        return out;
    }

    void Reopen() {
        std::lock_guard guard(lock_);
        closed_ = false;
    }

    [[nodiscard]] bool IsClosed() const {
        std::lock_guard guard(lock_);
        return closed_;
    }

    [[nodiscard]] size_t Size() const {
        std::lock_guard guard(lock_);
        return queue_.size();
    }

private:
    mutable std::mutex lock_;
    std::vector<PendingCompletion> queue_;
    uint64_t nextSequence_{1};
    bool closed_{false};
};

} // namespace XHCD::Reactor
