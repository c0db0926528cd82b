#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include "../Core/ControllerConfig.hpp"
#include "../Core/Error.hpp"
#include "../Hardware/RegisterMap.hpp"
#include "../Rings/EventRing.hpp"
#include "../Rings/TransferRingRegistry.hpp"
#include "../Rings/TrbRing.hpp"
#include "CompletionBridge.hpp"
#include "PendingChannel.hpp"

namespace XHCD::Driver {
class HardwareInterface;
class InterruptManager;
} // namespace XHCD::Driver

namespace XHCD::Reactor {

struct ReactorStatistics {
    uint64_t passes{0};
    uint64_t eventsHandled{0};
    uint64_t eventsLost{0};
    uint64_t eventRingFull{0};
    uint64_t ringGrowths{0};
    uint64_t growthFailures{0};
    uint64_t cancellations{0};
    uint64_t pointerlessResolutions{0};
    uint64_t malformedEvents{0};
    uint64_t portStatusChanges{0};
};

/**
 * Single consumer of the primary event ring.
 *
 * One pass: drain new registrations, cancel records whose transfer ring is
 * gone, then for each valid event: match it against the pending records,
 * consume it and advance ERDP. A pass that handled anything ends with one
 * EHB clear. Passes are serialized; RunOnce() may be called directly when
 * the reactor thread is not running.
 *
 * Resolved callers are resumed after the pass lock is dropped, so a
 * continuation may submit new work.
 */
class IrqReactor {
public:
    /// Device-enumeration hook, called with the 1-based root hub port
    using PortStatusHandler = std::function<void(uint8_t port)>;

    struct Dependencies {
        Driver::HardwareInterface& hw;
        Driver::RegisterLayout layout;
        Driver::InterruptManager& irq;
        Rings::EventRing& eventRing;
        Rings::LockedTrbRing& commandRing;
        Rings::TransferRingRegistry& transferRings;
        uint8_t maxPorts{0};
    };

    IrqReactor(Dependencies deps, Driver::InterruptMode mode, std::chrono::milliseconds pollInterval);
    ~IrqReactor();

    /// Queue a registration. Must happen before the matching doorbell write.
    /// After Stop() the record is resolved with Aborted on the spot and 0 is returned.
    uint64_t Submit(PendingCompletion record);

    /// Withdraw a registration whose doorbell was never rung; it resolves with Aborted
    bool Cancel(uint64_t sequence);

    void SetPortStatusHandler(PortStatusHandler handler);

    /// One synchronous pass. @return number of event TRBs consumed.
    size_t RunOnce();

    [[nodiscard]] Result<void> Start();

    /// Stop and join the reactor thread, then resolve everything still pending with Aborted
    void Stop();

    /// Interrupt the current wait so teardowns are noticed without an event
    void Wake() noexcept;

    [[nodiscard]] bool IsRunning() const noexcept { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] ReactorStatistics Statistics() const;
    /// Records matched-or-cancelled not yet (includes queued registrations)
    [[nodiscard]] size_t PendingCount() const;

    IrqReactor(const IrqReactor&) = delete;
    IrqReactor& operator=(const IrqReactor&) = delete;

private:
    using Resolution = std::pair<std::shared_ptr<CompletionState>, CompletionResult>;

    void ThreadMain();
    void PollingLoop();
    void InterruptLoop();

    void DrainRegistrations();
    void CancelDeadRings(std::vector<Resolution>& out);
    bool Acknowledge(const HW::Trb& event, std::vector<Resolution>& out);
    bool AcknowledgeCommand(const HW::Trb& event, std::vector<Resolution>& out);
    bool AcknowledgeTransfer(const HW::Trb& event, std::vector<Resolution>& out);
    bool AcknowledgePointerless(const HW::Trb& event, std::vector<Resolution>& out);
    bool AcknowledgeOther(const HW::Trb& event, std::vector<Resolution>& out);
    void HandleEventRingFull();
    /// Clears CSC; @return the port to hand to the enumeration hook
    std::optional<uint8_t> HandlePortStatusChange(const HW::Trb& event);
    /// Move the ring's dequeue past the last TRB of a finished TD
    void RetireTd(Rings::TransferRing& ring, const TransferCompletion& transfer);
    void LogLostEvent(const HW::Trb& event);

    /// Move pending_[index] out and queue its resolution
    void Take(size_t index, CompletionResult result, std::vector<Resolution>& out);

    Dependencies deps_;
    Driver::InterruptMode mode_;
    std::chrono::milliseconds pollInterval_;

    PendingChannel channel_;

    mutable std::mutex passLock_;
    std::vector<PendingCompletion> pending_;   ///< guarded by passLock_

    std::mutex handlerLock_;
    PortStatusHandler portHandler_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    struct Counters {
        std::atomic<uint64_t> passes{0};
        std::atomic<uint64_t> eventsHandled{0};
        std::atomic<uint64_t> eventsLost{0};
        std::atomic<uint64_t> eventRingFull{0};
        std::atomic<uint64_t> ringGrowths{0};
        std::atomic<uint64_t> growthFailures{0};
        std::atomic<uint64_t> cancellations{0};
        std::atomic<uint64_t> pointerlessResolutions{0};
        std::atomic<uint64_t> malformedEvents{0};
        std::atomic<uint64_t> portStatusChanges{0};
    } stats_;
};

} // namespace XHCD::Reactor
