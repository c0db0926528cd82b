#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

#include "../Core/ControllerConfig.hpp"
#include "../Core/Error.hpp"
#include "../Doorbell/Doorbell.hpp"
#include "../Hardware/InterruptManager.hpp"
#include "../Hardware/RegisterMap.hpp"
#include "../Hardware/XHCITrb.hpp"
#include "../Reactor/CompletionBridge.hpp"
#include "../Reactor/IrqReactor.hpp"
#include "../Rings/EventRing.hpp"
#include "../Rings/RingId.hpp"
#include "../Rings/TransferRingRegistry.hpp"
#include "../Rings/TrbRing.hpp"
#include "../Shared/Memory/IDMAMemory.hpp"

namespace XHCD::Driver {

class HardwareInterface;

/// Builds one TRB for the given producer cycle bit
using TrbBuilder = std::function<HW::Trb(bool cycle)>;

/// Data stage buffer of a control transfer (device-visible address)
struct DataBuffer {
    uint64_t iova{0};
    uint16_t length{0};
};

/**
 * Controller-level coordinator.
 *
 * Owns the command ring, the primary event ring, the doorbell array, the
 * transfer ring registry and the reactor. Submissions follow one rule: the
 * pending record is handed to the reactor while the ring lock is held, and
 * the doorbell is rung only after that.
 *
 * @p hw and @p dma must outlive the controller.
 */
class XhciController {
public:
    XhciController(HardwareInterface& hw, Shared::IDMAMemory& dma,
                   ControllerConfig config = ControllerConfig::MakeDefault());
    ~XhciController();

    /**
     * Reset and start the controller. @p irqFd is the interrupt file for
     * Msi/Intx mode (not owned), -1 when polling.
     */
    [[nodiscard]] Result<void> Initialize(int irqFd = -1, IrqFileKind kind = IrqFileKind::EventFd);

    /// Stop the reactor (aborting pending records) and halt the controller
    void Shutdown();

    // ----- Commands -----

    [[nodiscard]] Result<Reactor::CompletionFuture> SubmitCommand(const TrbBuilder& build);
    /// Blocks; completion code must be Success
    [[nodiscard]] Result<Reactor::NextEventTrb> ExecuteCommand(const TrbBuilder& build);

    // ----- Transfers -----

    /// Enqueue one TD (all or nothing) and ring (slot, DCI, stream)
    [[nodiscard]] Result<Reactor::CompletionFuture> SubmitTransfer(Rings::RingId id,
                                                                   std::span<const TrbBuilder> builders);
    [[nodiscard]] Result<Reactor::CompletionFuture> SubmitControlTransfer(Rings::RingId id,
                                                                          const HW::UsbSetup& setup,
                                                                          std::optional<DataBuffer> data = std::nullopt);
    /// Blocks; completion code must be Success or ShortPacket
    [[nodiscard]] Result<Reactor::NextEventTrb> ExecuteTransfer(Rings::RingId id,
                                                                std::span<const TrbBuilder> builders);
    [[nodiscard]] Result<Reactor::NextEventTrb> ExecuteControlTransfer(Rings::RingId id,
                                                                       const HW::UsbSetup& setup,
                                                                       std::optional<DataBuffer> data = std::nullopt);

    /// Wait for the next event of a type that has no source TRB
    [[nodiscard]] Result<Reactor::CompletionFuture> NextMiscEvent(HW::TrbType type);

    // ----- Transfer rings -----

    /// @return TR Dequeue Pointer (with DCS) for the endpoint context
    [[nodiscard]] Result<uint64_t> CreateTransferRing(Rings::RingId id, uint8_t slotId, uint8_t dci,
                                                      bool isochronous = false);
    /// Remove the ring; records still pending on it resolve with Aborted
    [[nodiscard]] Result<void> TearDownRing(Rings::RingId id);

    // ----- Interrupter -----

    [[nodiscard]] bool InterruptIsPending() const;
    void ForceClearInterrupt();
    [[nodiscard]] bool ReceivedIrq();
    void EventHandlerFinished();

    /// Called by the reactor with the root hub port of each Port Status Change
    void SetDeviceEnumerator(std::function<void(uint8_t port)> enumerator);

    // ----- Introspection -----

    [[nodiscard]] bool IsRunning() const noexcept { return initialized_; }
    [[nodiscard]] const Capabilities& Caps() const noexcept { return caps_; }
    [[nodiscard]] const RegisterLayout& Layout() const noexcept { return layout_; }
    [[nodiscard]] uint8_t EnabledSlots() const noexcept { return enabledSlots_; }
    [[nodiscard]] uint64_t DcbaaIOVA() const noexcept { return dcbaa_.deviceBase; }
    [[nodiscard]] Rings::LockedTrbRing& CommandRing() noexcept { return commandRing_; }
    [[nodiscard]] const Rings::EventRing& PrimaryEventRing() const noexcept { return eventRing_; }
    [[nodiscard]] Rings::TransferRingRegistry& TransferRings() noexcept { return transferRings_; }
    [[nodiscard]] Reactor::IrqReactor* EventReactor() noexcept { return reactor_.get(); }

    XhciController(const XhciController&) = delete;
    XhciController& operator=(const XhciController&) = delete;

private:
    [[nodiscard]] Result<void> ReadCapabilities();
    [[nodiscard]] Result<void> ResetController();
    [[nodiscard]] Result<void> SetupDeviceContextArray();
    [[nodiscard]] Result<void> RunController();
    void ReleaseContextMemory() noexcept;

    [[nodiscard]] static Result<Reactor::NextEventTrb> CheckCommandCompletion(Reactor::CompletionResult result);
    [[nodiscard]] static Result<Reactor::NextEventTrb> CheckTransferCompletion(Reactor::CompletionResult result);

    HardwareInterface& hw_;
    Shared::IDMAMemory& dma_;
    ControllerConfig config_;

    Capabilities caps_{};
    RegisterLayout layout_{};
    uint8_t enabledSlots_{0};
    std::atomic<bool> initialized_{false};

    Shared::DMARegion dcbaa_{};
    Shared::DMARegion scratchpadArray_{};
    std::vector<Shared::DMARegion> scratchpadPages_;

    Rings::LockedTrbRing commandRing_;
    Rings::EventRing eventRing_;
    Rings::TransferRingRegistry transferRings_;

    std::unique_ptr<InterruptManager> irq_;
    std::unique_ptr<DoorbellArray> doorbells_;
    std::unique_ptr<Reactor::IrqReactor> reactor_;

    std::mutex enumeratorLock_;
    std::function<void(uint8_t)> enumerator_;
};

} // namespace XHCD::Driver
