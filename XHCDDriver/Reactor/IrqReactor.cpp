#include "IrqReactor.hpp"

#include <system_error>

#include "../Hardware/HardwareInterface.hpp"
#include "../Hardware/InterruptManager.hpp"
#include "../Logging/Logging.hpp"

namespace XHCD::Reactor {

IrqReactor::IrqReactor(Dependencies deps, Driver::InterruptMode mode, std::chrono::milliseconds pollInterval)
    : deps_(deps), mode_(mode), pollInterval_(pollInterval) {}

IrqReactor::~IrqReactor() {
    Stop();
}

uint64_t IrqReactor::Submit(PendingCompletion record) {
    const auto seq = channel_.Push(std::move(record));
    if (!seq) {
        // Stopped: nothing would ever drain this record
        XHCD_LOG_V1(Reactor, "IrqReactor: registration after stop, aborted");
        stats_.cancellations.fetch_add(1, std::memory_order_relaxed);
        record.state->Resolve(XHCD_ERROR_ABORTED("IrqReactor: reactor stopped"));
        return 0;
    }
    XHCD_LOG_V4(Reactor, "IrqReactor: registration seq=%llu queued", static_cast<unsigned long long>(*seq));
    return *seq;
}

bool IrqReactor::Cancel(uint64_t sequence) {
    std::vector<Resolution> aborted;
    {
        std::lock_guard pass(passLock_);
        DrainRegistrations();
        for (size_t i = 0; i < pending_.size(); ++i) {
            if (pending_[i].sequence == sequence) {
                stats_.cancellations.fetch_add(1, std::memory_order_relaxed);
                Take(i, XHCD_ERROR_ABORTED("IrqReactor: registration withdrawn"), aborted);
                break;
            }
        }
    }
    for (auto& [state, result] : aborted) {
        state->Resolve(std::move(result));
    }
    return !aborted.empty();
}

void IrqReactor::SetPortStatusHandler(PortStatusHandler handler) {
    std::lock_guard guard(handlerLock_);
    portHandler_ = std::move(handler);
}

// ============================================================================
// Pass
// ============================================================================

size_t IrqReactor::RunOnce() {
    std::vector<Resolution> resolved;
    std::vector<uint8_t> changedPorts;
    size_t count = 0;

    {
        std::lock_guard pass(passLock_);
        stats_.passes.fetch_add(1, std::memory_order_relaxed);

        DrainRegistrations();
        CancelDeadRings(resolved);

        while (auto event = deps_.eventRing.Peek()) {
            XHCD_LOG_V3(Reactor, "IrqReactor: event idx=%zu type=%s code=%s data=0x%llx",
                        deps_.eventRing.NextIndex(), HW::ToString(event->Type()),
                        HW::ToString(event->Code()), static_cast<unsigned long long>(event->Data()));

            if (event->Type() == HW::TrbType::HostController &&
                event->Code() == HW::CompletionCode::EventRingFull) {
                HandleEventRingFull();
            } else {
                // Registrations submitted while this pass runs may own this event
                DrainRegistrations();
                bool dispatched = false;
                if (event->Type() == HW::TrbType::PortStatusChange) {
                    if (auto port = HandlePortStatusChange(*event)) {
                        changedPorts.push_back(*port);
                        dispatched = true;
                    }
                }
                // A PSC already handed to the port handler needs no waiter
                if (!Acknowledge(*event, resolved) && !dispatched) {
                    LogLostEvent(*event);
                }
            }

            deps_.eventRing.Consume();
            deps_.irq.WriteErdp(deps_.eventRing.Erdp());
            count++;
        }

        if (count > 0) {
            deps_.irq.EventHandlerFinished();
            stats_.eventsHandled.fetch_add(count, std::memory_order_relaxed);
        }
    }

    if (!changedPorts.empty()) {
        PortStatusHandler handler;
        {
            std::lock_guard guard(handlerLock_);
            handler = portHandler_;
        }
        if (handler) {
            for (uint8_t port : changedPorts) {
                handler(port);
            }
        }
    }

    for (auto& [state, result] : resolved) {
        state->Resolve(std::move(result));
    }
    return count;
}

void IrqReactor::DrainRegistrations() {
    auto incoming = channel_.Drain();
    if (incoming.empty()) {
        return;
    }
    for (auto& record : incoming) {
        pending_.push_back(std::move(record));
    }
    XHCD_LOG_V4(Reactor, "IrqReactor: %zu registrations drained, %zu pending", incoming.size(), pending_.size());
}

void IrqReactor::CancelDeadRings(std::vector<Resolution>& out) {
    size_t i = 0;
    while (i < pending_.size()) {
        const auto* transfer = std::get_if<TransferCompletion>(&pending_[i].kind);
        if (transfer == nullptr || deps_.transferRings.Contains(transfer->ringId)) {
            ++i;
            continue;
        }
        XHCD_LOG_V1(Reactor, "IrqReactor: cancel seq=%llu, ring port=%u ep=%u stream=%u is gone",
                    static_cast<unsigned long long>(pending_[i].sequence), transfer->ringId.port,
                    transfer->ringId.endpointNum, transfer->ringId.streamId);
        stats_.cancellations.fetch_add(1, std::memory_order_relaxed);
        Take(i, XHCD_ERROR_ABORTED("IrqReactor: transfer ring torn down"), out);
    }
}

void IrqReactor::Take(size_t index, CompletionResult result, std::vector<Resolution>& out) {
    out.emplace_back(std::move(pending_[index].state), std::move(result));
    pending_.erase(pending_.begin() + static_cast<std::ptrdiff_t>(index));
}

// ============================================================================
// Matching
// ============================================================================

bool IrqReactor::Acknowledge(const HW::Trb& event, std::vector<Resolution>& out) {
    switch (event.Type()) {
        case HW::TrbType::CommandCompletion:
            return AcknowledgeCommand(event, out);
        case HW::TrbType::Transfer:
            return AcknowledgeTransfer(event, out);
        default:
            return AcknowledgeOther(event, out);
    }
}

bool IrqReactor::AcknowledgeCommand(const HW::Trb& event, std::vector<Resolution>& out) {
    const auto pointer = HW::CommandTrbPointer(event);
    if (!pointer) {
        XHCD_LOG_V1(Reactor, "IrqReactor: command completion %s carries no TRB pointer",
                    HW::ToString(event.Code()));
        return false;
    }

    for (size_t i = 0; i < pending_.size(); ++i) {
        const auto* command = std::get_if<CommandCompletion>(&pending_[i].kind);
        if (command == nullptr || command->physPtr != *pointer) {
            continue;
        }

        std::optional<HW::Trb> source;
        {
            std::lock_guard guard(deps_.commandRing.lock);
            auto& ring = deps_.commandRing.ring;
            source = ring.EntryAtPhys(*pointer);
            if (auto index = ring.PhysToIndex(*pointer)) {
                ring.ReleaseSlot(*index);
            }
            ring.AdvanceDequeue(*pointer);
        }

        XHCD_LOG_V2(Reactor, "IrqReactor: cmd 0x%llx %s -> %s slot=%u",
                    static_cast<unsigned long long>(*pointer),
                    source ? HW::ToString(source->Type()) : "?", HW::ToString(event.Code()), event.SlotId());
        Take(i, NextEventTrb{event, source}, out);
        return true;
    }
    return false;
}

bool IrqReactor::AcknowledgeTransfer(const HW::Trb& event, std::vector<Resolution>& out) {
    if (!HW::HasSourcePointer(event.Code())) {
        return AcknowledgePointerless(event, out);
    }

    if (event.EventDataFlag()) {
        // Event Data TRB: the pointer field is caller data, match by endpoint
        auto ring = deps_.transferRings.FindBySlot(event.SlotId(), event.EndpointId());
        if (!ring) {
            return false;
        }
        for (size_t i = 0; i < pending_.size(); ++i) {
            const auto* transfer = std::get_if<TransferCompletion>(&pending_[i].kind);
            if (transfer != nullptr && transfer->ringId == ring->id) {
                RetireTd(*ring, *transfer);
                Take(i, NextEventTrb{event, std::nullopt}, out);
                return true;
            }
        }
        return false;
    }

    const uint64_t pointer = event.Data();
    std::shared_ptr<Rings::TransferRing> owner;
    for (const auto& ring : deps_.transferRings.Snapshot()) {
        std::lock_guard guard(ring->lock);
        if (ring->ring.Contains(pointer)) {
            owner = ring;
            break;
        }
    }

    if (!owner) {
        stats_.malformedEvents.fetch_add(1, std::memory_order_relaxed);
        XHCD_LOG_RL(Reactor, "reactor/malformed", 1000, LOG_ERR,
                    "transfer event ptr=0x%llx slot=%u dci=%u is outside every transfer ring",
                    static_cast<unsigned long long>(pointer), event.SlotId(), event.EndpointId());
        auto ring = deps_.transferRings.FindBySlot(event.SlotId(), event.EndpointId());
        if (!ring) {
            return false;
        }
        for (size_t i = 0; i < pending_.size(); ++i) {
            const auto* transfer = std::get_if<TransferCompletion>(&pending_[i].kind);
            if (transfer != nullptr && transfer->ringId == ring->id) {
                Take(i, XHCD_ERROR_IO("IrqReactor: transfer event pointer outside the ring"), out);
                return true;
            }
        }
        return false;
    }

    for (size_t i = 0; i < pending_.size(); ++i) {
        const auto* transfer = std::get_if<TransferCompletion>(&pending_[i].kind);
        if (transfer == nullptr || transfer->ringId != owner->id ||
            !InCircularRange(transfer->firstPtr, transfer->lastPtr, pointer)) {
            continue;
        }

        std::optional<HW::Trb> source;
        {
            std::lock_guard guard(owner->lock);
            source = owner->ring.EntryAtPhys(pointer);
        }
        // A short packet or error mid-TD still ends the whole TD
        RetireTd(*owner, *transfer);

        XHCD_LOG_V2(Reactor, "IrqReactor: xfer slot=%u dci=%u 0x%llx %s residue=%u",
                    owner->slotId, owner->dci, static_cast<unsigned long long>(pointer),
                    HW::ToString(event.Code()), event.TransferLength());
        Take(i, NextEventTrb{event, source}, out);
        return true;
    }
    return false;
}

bool IrqReactor::AcknowledgePointerless(const HW::Trb& event, std::vector<Resolution>& out) {
    // No pointer to compare: the oldest isochronous/VF record takes it
    std::optional<size_t> oldest;
    for (size_t i = 0; i < pending_.size(); ++i) {
        if (!pending_[i].isIsochOrVf || !std::holds_alternative<TransferCompletion>(pending_[i].kind)) {
            continue;
        }
        if (!oldest || pending_[i].sequence < pending_[*oldest].sequence) {
            oldest = i;
        }
    }
    if (!oldest) {
        return false;
    }

    XHCD_LOG_V1(Reactor, "IrqReactor: %s without pointer resolves isoch seq=%llu",
                HW::ToString(event.Code()), static_cast<unsigned long long>(pending_[*oldest].sequence));
    stats_.pointerlessResolutions.fetch_add(1, std::memory_order_relaxed);
    const auto& transfer = std::get<TransferCompletion>(pending_[*oldest].kind);
    if (auto ring = deps_.transferRings.Find(transfer.ringId)) {
        RetireTd(*ring, transfer);
    }
    Take(*oldest, NextEventTrb{event, std::nullopt}, out);
    return true;
}

void IrqReactor::RetireTd(Rings::TransferRing& ring, const TransferCompletion& transfer) {
    std::lock_guard guard(ring.lock);
    if (!ring.ring.AdvanceDequeue(transfer.lastPtr)) {
        XHCD_LOG_V2(Reactor, "IrqReactor: TD end 0x%llx already retired on slot=%u dci=%u",
                    static_cast<unsigned long long>(transfer.lastPtr), ring.slotId, ring.dci);
    }
}

bool IrqReactor::AcknowledgeOther(const HW::Trb& event, std::vector<Resolution>& out) {
    for (size_t i = 0; i < pending_.size(); ++i) {
        const auto* other = std::get_if<OtherEvent>(&pending_[i].kind);
        if (other != nullptr && other->type == event.Type()) {
            Take(i, NextEventTrb{event, std::nullopt}, out);
            return true;
        }
    }
    return false;
}

void IrqReactor::LogLostEvent(const HW::Trb& event) {
    stats_.eventsLost.fetch_add(1, std::memory_order_relaxed);
    XHCD_LOG_RL(Reactor, "reactor/lost", 1000, LOG_WARNING,
                "lost event type=%s code=%s data=0x%llx slot=%u ep=%u (no pending record)",
                HW::ToString(event.Type()), HW::ToString(event.Code()),
                static_cast<unsigned long long>(event.Data()), event.SlotId(), event.EndpointId());
}

void IrqReactor::HandleEventRingFull() {
    stats_.eventRingFull.fetch_add(1, std::memory_order_relaxed);

    auto grown = deps_.eventRing.Grow();
    if (!grown) {
        stats_.growthFailures.fetch_add(1, std::memory_order_relaxed);
        XHCD_LOG_ERROR(Reactor, "IrqReactor: Event Ring Full and the ring cannot grow (%s), "
                       "controller may drop events", ReturnCodeName(grown.error().kr));
        grown.error().Log();
        return;
    }

    deps_.irq.WriteErstSize(*grown);
    stats_.ringGrowths.fetch_add(1, std::memory_order_relaxed);
    XHCD_LOG_WARNING(Reactor, "IrqReactor: Event Ring Full, ERSTSZ now %u", *grown);
}

std::optional<uint8_t> IrqReactor::HandlePortStatusChange(const HW::Trb& event) {
    stats_.portStatusChanges.fetch_add(1, std::memory_order_relaxed);

    const auto port = HW::PortStatusChangePortId(event);
    if (!port || *port == 0 || *port > deps_.maxPorts) {
        XHCD_LOG_WARNING(Reactor, "IrqReactor: port status change for port %u out of range (maxPorts=%u)",
                         port.value_or(0), deps_.maxPorts);
        return std::nullopt;
    }

    const uint32_t offset = deps_.layout.PortSc(*port);
    const uint32_t portsc = deps_.hw.Read(offset);
    // Write back only preserved bits plus CSC; a stray 1 in PED would disable the port
    deps_.hw.Write(offset, Driver::Portsc::Neutral(portsc) | Driver::Portsc::kConnectStatusChange);
    XHCD_LOG_V1(Reactor, "IrqReactor: port %u status change PORTSC=0x%08x", *port, portsc);
    return port;
}

// ============================================================================
// Thread
// ============================================================================

Result<void> IrqReactor::Start() {
    if (running_.load(std::memory_order_acquire)) {
        return XHCD_ERROR_RECOVERABLE(kXHCDReturnBusy, "IrqReactor: already running");
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    stopping_.store(false, std::memory_order_release);
    channel_.Reopen();
    running_.store(true, std::memory_order_release);
    try {
        thread_ = std::thread(&IrqReactor::ThreadMain, this);
    } catch (const std::system_error& e) {
        running_.store(false, std::memory_order_release);
        XHCD_LOG_ERROR(Reactor, "IrqReactor: thread creation failed: %s", e.what());
        return XHCD_ERROR_FATAL(kXHCDReturnNoMemory, "IrqReactor: cannot start reactor thread");
    }
    XHCD_LOG_V1(Reactor, "IrqReactor: started (%s, poll=%lldms)", Driver::ToString(mode_),
                static_cast<long long>(pollInterval_.count()));
    return {};
}

void IrqReactor::Stop() {
    stopping_.store(true, std::memory_order_release);
    Wake();
    if (thread_.joinable()) {
        thread_.join();
    }

    std::vector<Resolution> aborted;
    {
        std::lock_guard pass(passLock_);
        for (auto& record : channel_.Close()) {
            pending_.push_back(std::move(record));
        }
        while (!pending_.empty()) {
            stats_.cancellations.fetch_add(1, std::memory_order_relaxed);
            Take(0, XHCD_ERROR_ABORTED("IrqReactor: reactor stopped"), aborted);
        }
    }
    for (auto& [state, result] : aborted) {
        state->Resolve(std::move(result));
    }

    if (!aborted.empty()) {
        XHCD_LOG_V1(Reactor, "IrqReactor: %zu pending records aborted on stop", aborted.size());
    }
    if (LogConfig::Shared().IsStatisticsEnabled()) {
        const auto s = Statistics();
        XHCD_LOG_V1(Reactor, "IrqReactor stats: passes=%llu events=%llu lost=%llu erf=%llu grown=%llu "
                    "growFail=%llu cancel=%llu pointerless=%llu malformed=%llu psc=%llu",
                    static_cast<unsigned long long>(s.passes),
                    static_cast<unsigned long long>(s.eventsHandled),
                    static_cast<unsigned long long>(s.eventsLost),
                    static_cast<unsigned long long>(s.eventRingFull),
                    static_cast<unsigned long long>(s.ringGrowths),
                    static_cast<unsigned long long>(s.growthFailures),
                    static_cast<unsigned long long>(s.cancellations),
                    static_cast<unsigned long long>(s.pointerlessResolutions),
                    static_cast<unsigned long long>(s.malformedEvents),
                    static_cast<unsigned long long>(s.portStatusChanges));
    }
}

void IrqReactor::Wake() noexcept {
    deps_.irq.Wake();
}

void IrqReactor::ThreadMain() {
    if (mode_ == Driver::InterruptMode::Polling) {
        PollingLoop();
    } else {
        InterruptLoop();
    }
    running_.store(false, std::memory_order_release);
}

void IrqReactor::PollingLoop() {
    while (!stopping_.load(std::memory_order_acquire)) {
        if (RunOnce() == 0) {
            (void)deps_.irq.WaitForWake(pollInterval_);
        }
    }
}

void IrqReactor::InterruptLoop() {
    auto& irq = deps_.irq;
    while (!stopping_.load(std::memory_order_acquire)) {
        if (!irq.IsUnmasked()) {
            irq.Unmask();
        }

        auto wait = irq.WaitForInterrupt();
        if (!wait) {
            wait.error().Log();
            XHCD_LOG_FAULT(Reactor, "IrqReactor: interrupt wait failed, reactor exiting");
            return;
        }

        if (*wait == Driver::IrqWait::Woken) {
            if (stopping_.load(std::memory_order_acquire)) {
                return;
            }
            RunOnce();
            continue;
        }

        irq.Mask();
        const bool ours = irq.ReceivedIrq();
        if (auto ack = irq.AcknowledgeIrqFile(); !ack) {
            ack.error().Log();
        }
        if (!ours) {
            XHCD_LOG_V3(Reactor, "IrqReactor: shared line fired for another device");
            continue;
        }

        if (RunOnce() == 0) {
            XHCD_LOG_RL(Reactor, "reactor/empty-irq", 1000, LOG_WARNING,
                        "interrupt with an empty event ring");
        }
    }
}

// ============================================================================
// Introspection
// ============================================================================

ReactorStatistics IrqReactor::Statistics() const {
    ReactorStatistics s;
    s.passes = stats_.passes.load(std::memory_order_relaxed);
    s.eventsHandled = stats_.eventsHandled.load(std::memory_order_relaxed);
    s.eventsLost = stats_.eventsLost.load(std::memory_order_relaxed);
    s.eventRingFull = stats_.eventRingFull.load(std::memory_order_relaxed);
    s.ringGrowths = stats_.ringGrowths.load(std::memory_order_relaxed);
    s.growthFailures = stats_.growthFailures.load(std::memory_order_relaxed);
    s.cancellations = stats_.cancellations.load(std::memory_order_relaxed);
    s.pointerlessResolutions = stats_.pointerlessResolutions.load(std::memory_order_relaxed);
    s.malformedEvents = stats_.malformedEvents.load(std::memory_order_relaxed);
    s.portStatusChanges = stats_.portStatusChanges.load(std::memory_order_relaxed);
    return s;
}

size_t IrqReactor::PendingCount() const {
    std::lock_guard pass(passLock_);
    return pending_.size() + channel_.Size();
}

} // namespace XHCD::Reactor
