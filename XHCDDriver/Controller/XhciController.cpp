#include "XhciController.hpp"

#include <algorithm>

#include "../Hardware/HardwareInterface.hpp"
#include "../Logging/LogConfig.hpp"
#include "../Logging/Logging.hpp"

namespace XHCD::Driver {

namespace {
constexpr size_t kDcbaaAlignment = 64;
constexpr size_t kScratchpadArrayAlignment = 64;
constexpr uint32_t kDefaultPageSize = 4096;

[[nodiscard]] constexpr uint32_t MaxScratchpadBuffers(uint32_t hcsParams2) noexcept {
    const uint32_t hi = (hcsParams2 >> 21) & 0x1F;
    const uint32_t lo = (hcsParams2 >> 27) & 0x1F;
    return (hi << 5) | lo;
}

[[nodiscard]] uint32_t PageSizeBytes(uint32_t pageSizeReg) noexcept {
    for (uint32_t bit = 0; bit < 16; ++bit) {
        if (pageSizeReg & (1u << bit)) {
            return 1u << (bit + 12);
        }
    }
    return kDefaultPageSize;
}
} // namespace

XhciController::XhciController(HardwareInterface& hw, Shared::IDMAMemory& dma, ControllerConfig config)
    : hw_(hw), dma_(dma), config_(config) {}

XhciController::~XhciController() {
    Shutdown();
    reactor_.reset();
    ReleaseContextMemory();
}

// ============================================================================
// Bring-up
// ============================================================================

Result<void> XhciController::Initialize(int irqFd, IrqFileKind kind) {
    if (initialized_) {
        return XHCD_ERROR_INVALID("XhciController: already initialized");
    }
    if (!LogConfig::Shared().IsInitialized()) {
        LogConfig::Shared().Initialize();
    }

    XHCD_TRY_LOG(ReadCapabilities());
    XHCD_TRY_LOG(ResetController());

    enabledSlots_ = caps_.maxSlots;
    if (config_.maxSlots != 0) {
        enabledSlots_ = std::min(config_.maxSlots, caps_.maxSlots);
    }
    hw_.Write(layout_.Op(OpReg::kConfig), enabledSlots_);
    XHCD_TRY_LOG(SetupDeviceContextArray());

    XHCD_TRY_LOG(commandRing_.ring.Initialize(dma_, config_.commandRingSize, caps_.ac64));
    hw_.Write64(layout_.Op(OpReg::kCrcrLo), commandRing_.ring.Register() & kCrcrMask);

    const size_t maxSegments = std::min<size_t>(config_.maxEventRingSegments, caps_.MaxErstEntries());
    XHCD_TRY_LOG(eventRing_.Initialize(dma_, config_.eventRingSegmentSize, maxSegments));

    irq_ = std::make_unique<InterruptManager>(hw_, layout_, config_.interruptMode);
    XHCD_TRY_LOG(irq_->Initialise(irqFd, kind));
    irq_->ProgramEventRing(eventRing_.ErstSize(), eventRing_.Erdp(), eventRing_.ErstBase());

    doorbells_ = std::make_unique<DoorbellArray>(hw_, layout_, enabledSlots_);

    Reactor::IrqReactor::Dependencies deps{
        hw_, layout_, *irq_, eventRing_, commandRing_, transferRings_, caps_.maxPorts,
    };
    reactor_ = std::make_unique<Reactor::IrqReactor>(deps, config_.interruptMode, config_.pollInterval);
    reactor_->SetPortStatusHandler([this](uint8_t port) {
        std::function<void(uint8_t)> enumerator;
        {
            std::lock_guard guard(enumeratorLock_);
            enumerator = enumerator_;
        }
        if (enumerator) {
            enumerator(port);
        }
    });

    XHCD_TRY_LOG(RunController());
    initialized_ = true;

    // Host controller doorbell: nothing queued yet, kicks the command ring state machine
    doorbells_->RingCommand();

    if (config_.startReactorThread) {
        XHCD_TRY_LOG(reactor_->Start());
    }

    XHCD_LOG_V0(Controller, "XhciController: running v%x.%02x slots=%u/%u ports=%u erst<=%zu mode=%s",
                caps_.hciVersion >> 8, caps_.hciVersion & 0xFF, enabledSlots_, caps_.maxSlots,
                caps_.maxPorts, maxSegments, ToString(config_.interruptMode));
    return {};
}

Result<void> XhciController::ReadCapabilities() {
    const uint32_t capLengthVersion = hw_.Read(static_cast<uint32_t>(CapReg::kCapLengthVersion));
    if (capLengthVersion == 0xFFFFFFFFu) {
        XHCD_LOG_ERROR(Controller, "XhciController: capability registers read all ones");
        return XHCD_ERROR_FATAL(kXHCDReturnIOError, "XhciController: BAR not mapped or device gone");
    }

    caps_ = Capabilities::Decode(capLengthVersion,
                                 hw_.Read(static_cast<uint32_t>(CapReg::kHcsParams1)),
                                 hw_.Read(static_cast<uint32_t>(CapReg::kHcsParams2)),
                                 hw_.Read(static_cast<uint32_t>(CapReg::kHccParams1)),
                                 hw_.Read(static_cast<uint32_t>(CapReg::kDbOff)),
                                 hw_.Read(static_cast<uint32_t>(CapReg::kRtsOff)));
    if (caps_.capLength == 0 || caps_.maxSlots == 0) {
        XHCD_LOG_ERROR(Controller, "XhciController: implausible capabilities caplen=%u slots=%u",
                       caps_.capLength, caps_.maxSlots);
        return XHCD_ERROR_FATAL(kXHCDReturnIOError, "XhciController: bad capability registers");
    }
    layout_ = RegisterLayout::From(caps_);

    XHCD_LOG_V1(Controller, "XhciController: caplen=0x%x rts=0x%x db=0x%x ac64=%d csz=%d erstMax=%u",
                caps_.capLength, caps_.runtimeOffset, caps_.doorbellOffset, caps_.ac64,
                caps_.contextSize64, caps_.erstMax);
    return {};
}

Result<void> XhciController::ResetController() {
    const uint32_t usbcmd = layout_.Op(OpReg::kUsbCmd);
    const uint32_t usbsts = layout_.Op(OpReg::kUsbSts);

    hw_.ClearBits(usbcmd, UsbCmd::kRunStop);
    if (!hw_.WaitBits(usbsts, UsbSts::kHcHalted, true, config_.haltTimeoutUsec, 100, "USBSTS.HCH")) {
        return XHCD_ERROR_TIMEOUT("XhciController: controller did not halt");
    }

    hw_.SetBits(usbcmd, UsbCmd::kHcReset);
    if (!hw_.WaitBits(usbcmd, UsbCmd::kHcReset, false, config_.resetTimeoutUsec, 100, "USBCMD.HCRST")) {
        return XHCD_ERROR_TIMEOUT("XhciController: HCRST did not clear");
    }
    if (!hw_.WaitBits(usbsts, UsbSts::kControllerNotReady, false, config_.resetTimeoutUsec, 100, "USBSTS.CNR")) {
        return XHCD_ERROR_TIMEOUT("XhciController: controller not ready after reset");
    }
    XHCD_LOG_V2(Controller, "XhciController: reset complete");
    return {};
}

Result<void> XhciController::SetupDeviceContextArray() {
    const uint32_t pageSize = PageSizeBytes(hw_.Read(layout_.Op(OpReg::kPageSize)));
    const size_t dcbaaBytes = (static_cast<size_t>(enabledSlots_) + 1) * sizeof(uint64_t);

    auto dcbaa = dma_.AllocateRegion(dcbaaBytes, kDcbaaAlignment, pageSize);
    if (!dcbaa) {
        return XHCD_ERROR_NO_MEMORY("XhciController: DCBAA allocation failed");
    }
    dcbaa_ = *dcbaa;
    auto* entries = reinterpret_cast<volatile uint64_t*>(dcbaa_.virtualBase);

    const uint32_t scratchpads = MaxScratchpadBuffers(hw_.Read(static_cast<uint32_t>(CapReg::kHcsParams2)));
    if (scratchpads > 0) {
        auto array = dma_.AllocateRegion(scratchpads * sizeof(uint64_t), kScratchpadArrayAlignment, pageSize);
        if (!array) {
            return XHCD_ERROR_NO_MEMORY("XhciController: scratchpad array allocation failed");
        }
        scratchpadArray_ = *array;
        auto* pointers = reinterpret_cast<volatile uint64_t*>(scratchpadArray_.virtualBase);
        for (uint32_t i = 0; i < scratchpads; ++i) {
            auto page = dma_.AllocateRegion(pageSize, pageSize, pageSize);
            if (!page) {
                return XHCD_ERROR_NO_MEMORY("XhciController: scratchpad page allocation failed");
            }
            scratchpadPages_.push_back(*page);
            pointers[i] = page->deviceBase;
        }
        dma_.PublishToDevice(scratchpadArray_.virtualBase, scratchpadArray_.size);
        entries[0] = scratchpadArray_.deviceBase;
    }
    dma_.PublishToDevice(dcbaa_.virtualBase, dcbaa_.size);

    hw_.Write64(layout_.Op(OpReg::kDcbaapLo), dcbaa_.deviceBase);
    XHCD_LOG_V2(Controller, "XhciController: DCBAA=0x%llx slots=%u scratchpads=%u page=%u",
                static_cast<unsigned long long>(dcbaa_.deviceBase), enabledSlots_, scratchpads, pageSize);
    return {};
}

Result<void> XhciController::RunController() {
    const uint32_t usbcmd = layout_.Op(OpReg::kUsbCmd);
    if (config_.interruptMode != InterruptMode::Polling) {
        hw_.SetBits(usbcmd, UsbCmd::kInterrupterEnable);
    }
    hw_.SetBits(usbcmd, UsbCmd::kRunStop);
    if (!hw_.WaitBits(layout_.Op(OpReg::kUsbSts), UsbSts::kHcHalted, false, config_.haltTimeoutUsec, 100,
                      "USBSTS.HCH")) {
        return XHCD_ERROR_TIMEOUT("XhciController: controller did not start");
    }
    return {};
}

void XhciController::Shutdown() {
    // Cleared first so no submitter starts a registration the reactor would never see
    const bool wasRunning = initialized_.exchange(false);
    if (reactor_) {
        reactor_->Stop();
    }
    if (!wasRunning) {
        return;
    }

    hw_.ClearBits(layout_.Op(OpReg::kUsbCmd), UsbCmd::kRunStop | UsbCmd::kInterrupterEnable);
    if (!hw_.WaitBits(layout_.Op(OpReg::kUsbSts), UsbSts::kHcHalted, true, config_.haltTimeoutUsec, 100,
                      "USBSTS.HCH")) {
        XHCD_LOG_WARNING(Controller, "XhciController: controller did not halt on shutdown");
    }
    if (irq_ && irq_->IsUnmasked()) {
        irq_->Mask();
    }
    XHCD_LOG_V1(Controller, "XhciController: stopped");
}

void XhciController::ReleaseContextMemory() noexcept {
    for (const auto& page : scratchpadPages_) {
        dma_.ReleaseRegion(page);
    }
    scratchpadPages_.clear();
    if (scratchpadArray_.virtualBase != nullptr) {
        dma_.ReleaseRegion(scratchpadArray_);
        scratchpadArray_ = {};
    }
    if (dcbaa_.virtualBase != nullptr) {
        dma_.ReleaseRegion(dcbaa_);
        dcbaa_ = {};
    }
}

// ============================================================================
// Commands
// ============================================================================

Result<Reactor::CompletionFuture> XhciController::SubmitCommand(const TrbBuilder& build) {
    if (!initialized_) {
        return XHCD_ERROR_NOT_READY("XhciController: controller not running");
    }
    if (!build || !HW::IsCommandTrb(build(false))) {
        return XHCD_ERROR_INVALID("XhciController: builder does not produce a command TRB");
    }

    Reactor::CompletionFuture future;
    bool accepted = false;
    {
        std::lock_guard guard(commandRing_.lock);
        auto slot = commandRing_.ring.Enqueue(build);
        if (!slot) {
            XHCD_LOG_RL(Controller, "cmd/full", 1000, LOG_WARNING, "command ring full (%zu in flight)",
                        commandRing_.ring.InFlight());
            return std::unexpected(slot.error());
        }
        auto [record, pending] = Reactor::PendingCompletion::Make(Reactor::CommandCompletion{slot->physAddr});
        accepted = reactor_->Submit(std::move(record)) != 0;
        future = std::move(pending);
    }

    // A stopped reactor already resolved the future with Aborted
    if (accepted) {
        doorbells_->RingCommand();
    }
    return future;
}

Result<Reactor::NextEventTrb> XhciController::ExecuteCommand(const TrbBuilder& build) {
    auto future = XHCD_TRY(SubmitCommand(build));
    return CheckCommandCompletion(future.Wait());
}

Result<Reactor::NextEventTrb> XhciController::CheckCommandCompletion(Reactor::CompletionResult result) {
    if (!result) {
        return result;
    }
    if (result->event.Code() != HW::CompletionCode::Success) {
        XHCD_LOG_WARNING(Controller, "command %s failed: %s (param=0x%06x slot=%u)",
                         result->source ? HW::ToString(result->source->Type()) : "?",
                         HW::ToString(result->event.Code()), result->event.CompletionParam(),
                         result->event.SlotId());
        return XHCD_ERROR_IO("XhciController: command completion code is not Success");
    }
    return result;
}

// ============================================================================
// Transfers
// ============================================================================

Result<Reactor::CompletionFuture> XhciController::SubmitTransfer(Rings::RingId id,
                                                                 std::span<const TrbBuilder> builders) {
    if (!initialized_) {
        return XHCD_ERROR_NOT_READY("XhciController: controller not running");
    }
    if (builders.empty()) {
        return XHCD_ERROR_INVALID("XhciController: empty transfer");
    }

    auto ring = transferRings_.Find(id);
    if (!ring) {
        XHCD_LOG_WARNING(Controller, "XhciController: no ring port=%u ep=%u stream=%u",
                         id.port, id.endpointNum, id.streamId);
        return XHCD_ERROR_RECOVERABLE(kXHCDReturnNotFound, "XhciController: transfer ring not found");
    }

    if (!doorbells_->Accepts(ring->slotId, ring->dci)) {
        return XHCD_ERROR_INVALID("XhciController: ring has no valid doorbell target");
    }

    Reactor::CompletionFuture future;
    uint64_t sequence = 0;
    {
        std::lock_guard guard(ring->lock);
        if (ring->tornDown) {
            return XHCD_ERROR_ABORTED("XhciController: transfer ring is being torn down");
        }
        if (ring->ring.FreeSlots() < builders.size()) {
            return XHCD_ERROR_NO_SPACE("XhciController: transfer ring cannot hold the whole TD");
        }

        uint64_t first = 0;
        uint64_t last = 0;
        for (size_t i = 0; i < builders.size(); ++i) {
            auto slot = ring->ring.Enqueue(builders[i]);
            if (!slot) {
                return std::unexpected(slot.error());
            }
            if (i == 0) {
                first = slot->physAddr;
            }
            last = slot->physAddr;
        }

        auto [record, pending] = Reactor::PendingCompletion::Make(
            Reactor::TransferCompletion{first, last, id}, ring->isochronous);
        sequence = reactor_->Submit(std::move(record));
        future = std::move(pending);
    }

    if (sequence == 0) {
        return future;
    }
    if (!doorbells_->Ring(ring->slotId, ring->dci, id.streamId)) {
        // The controller was never told about this TD; nobody may wait on it
        (void)reactor_->Cancel(sequence);
        return XHCD_ERROR_INVALID("XhciController: ring has no valid doorbell target");
    }
    return future;
}

Result<Reactor::CompletionFuture> XhciController::SubmitControlTransfer(Rings::RingId id,
                                                                        const HW::UsbSetup& setup,
                                                                        std::optional<DataBuffer> data) {
    if (data && data->length == 0) {
        return XHCD_ERROR_INVALID("XhciController: zero-length data stage");
    }
    if (data && data->length != setup.length) {
        XHCD_LOG_V1(Controller, "XhciController: data stage %u bytes, wLength %u", data->length, setup.length);
    }

    const bool in = setup.IsDeviceToHost();
    const HW::TransferKind kind = !data ? HW::TransferKind::NoData
                                        : (in ? HW::TransferKind::In : HW::TransferKind::Out);
    // Status stage runs opposite to the data stage; IN when there is none
    const bool statusIn = !(data && in);

    std::vector<TrbBuilder> stages;
    stages.reserve(3);
    stages.emplace_back([setup, kind](bool cycle) { return HW::MakeSetupStage(setup, kind, cycle); });
    if (data) {
        const DataBuffer buffer = *data;
        stages.emplace_back([buffer, in](bool cycle) {
            return HW::MakeDataStage(buffer.iova, buffer.length, in, cycle);
        });
    }
    stages.emplace_back([statusIn](bool cycle) {
        return HW::MakeStatusStage(0, statusIn, true, false, false, cycle);
    });

    return SubmitTransfer(id, stages);
}

Result<Reactor::NextEventTrb> XhciController::ExecuteTransfer(Rings::RingId id,
                                                              std::span<const TrbBuilder> builders) {
    auto future = XHCD_TRY(SubmitTransfer(id, builders));
    return CheckTransferCompletion(future.Wait());
}

Result<Reactor::NextEventTrb> XhciController::ExecuteControlTransfer(Rings::RingId id,
                                                                     const HW::UsbSetup& setup,
                                                                     std::optional<DataBuffer> data) {
    auto future = XHCD_TRY(SubmitControlTransfer(id, setup, data));
    return CheckTransferCompletion(future.Wait());
}

Result<Reactor::NextEventTrb> XhciController::CheckTransferCompletion(Reactor::CompletionResult result) {
    if (!result) {
        return result;
    }
    const HW::CompletionCode code = result->event.Code();
    if (code != HW::CompletionCode::Success && code != HW::CompletionCode::ShortPacket) {
        XHCD_LOG_WARNING(Controller, "transfer slot=%u dci=%u failed: %s residue=%u",
                         result->event.SlotId(), result->event.EndpointId(), HW::ToString(code),
                         result->event.TransferLength());
        return XHCD_ERROR_IO("XhciController: transfer completion code is not Success");
    }
    return result;
}

Result<Reactor::CompletionFuture> XhciController::NextMiscEvent(HW::TrbType type) {
    if (!initialized_) {
        return XHCD_ERROR_NOT_READY("XhciController: controller not running");
    }
    if (!HW::IsMiscEventType(type)) {
        XHCD_LOG_ERROR(Controller, "XhciController: %s is not a standalone event type", HW::ToString(type));
        return XHCD_ERROR_INVALID("XhciController: event type has a source TRB");
    }
    auto [record, future] = Reactor::PendingCompletion::Make(Reactor::OtherEvent{type});
    reactor_->Submit(std::move(record));
    return future;
}

// ============================================================================
// Transfer rings
// ============================================================================

Result<uint64_t> XhciController::CreateTransferRing(Rings::RingId id, uint8_t slotId, uint8_t dci,
                                                    bool isochronous) {
    if (slotId > enabledSlots_) {
        return XHCD_ERROR_INVALID("XhciController: slot id above MaxSlotsEn");
    }
    if (id.IsDefaultControlPipe() && dci != DoorbellTarget::kDefaultControl) {
        XHCD_LOG_ERROR(Controller, "XhciController: default control pipe of port %u given dci=%u", id.port, dci);
        return XHCD_ERROR_INVALID("XhciController: default control pipe must use DCI 1");
    }
    auto ring = XHCD_TRY(transferRings_.Create(dma_, id, slotId, dci, isochronous,
                                               config_.transferRingSize, caps_.ac64));
    std::lock_guard guard(ring->lock);
    return ring->ring.Register();
}

Result<void> XhciController::TearDownRing(Rings::RingId id) {
    auto ring = transferRings_.Find(id);
    if (!ring) {
        return XHCD_ERROR_RECOVERABLE(kXHCDReturnNotFound, "XhciController: transfer ring not found");
    }

    {
        std::lock_guard guard(ring->lock);
        ring->tornDown = true;
        (void)transferRings_.Remove(id);
    }

    // Let the reactor cancel what is still pending on this ring
    if (reactor_) {
        reactor_->Wake();
    }

    std::lock_guard guard(ring->lock);
    if (!ring->ring.Release()) {
        XHCD_LOG_WARNING(Controller, "XhciController: ring port=%u ep=%u stream=%u torn down while busy",
                         id.port, id.endpointNum, id.streamId);
    }
    return {};
}

// ============================================================================
// Interrupter
// ============================================================================

bool XhciController::InterruptIsPending() const {
    return irq_ && irq_->InterruptIsPending();
}

void XhciController::ForceClearInterrupt() {
    if (irq_) {
        irq_->ForceClearInterrupt();
    }
}

bool XhciController::ReceivedIrq() {
    return irq_ && irq_->ReceivedIrq();
}

void XhciController::EventHandlerFinished() {
    if (irq_) {
        irq_->EventHandlerFinished();
    }
}

void XhciController::SetDeviceEnumerator(std::function<void(uint8_t port)> enumerator) {
    std::lock_guard guard(enumeratorLock_);
    enumerator_ = std::move(enumerator);
}

} // namespace XHCD::Driver
