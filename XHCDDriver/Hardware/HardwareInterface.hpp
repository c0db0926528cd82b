#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "../Core/Error.hpp"

namespace XHCD::Driver {

/// 32-bit register access to the xHC BAR. Tests substitute a fake register file.
class HardwareInterface {
public:
    virtual ~HardwareInterface() = default;

    [[nodiscard]] virtual uint32_t Read(uint32_t offset) const noexcept = 0;
    virtual void Write(uint32_t offset, uint32_t value) noexcept = 0;

    /// 64-bit registers are written low dword first (xHCI §5.1)
    [[nodiscard]] uint64_t Read64(uint32_t offset) const noexcept;
    void Write64(uint32_t offset, uint64_t value) noexcept;

    void SetBits(uint32_t offset, uint32_t bits) noexcept;
    void ClearBits(uint32_t offset, uint32_t bits) noexcept;

    /**
     * Poll @p offset until (value & mask) is all set (expectSet) or all clear.
     * Returns false on timeout or when the device reads back 0xFFFFFFFF
     * (surprise removal / BAR gone).
     */
    [[nodiscard]] bool WaitBits(uint32_t offset, uint32_t mask, bool expectSet,
                                uint32_t timeoutUsec, uint32_t pollIntervalUsec = 100,
                                const char* name = "register") const;
};

/// BAR0 mapped from a PCI sysfs resource file (or any mmap-able device node).
class MmioHardwareInterface final : public HardwareInterface {
public:
    /// Map @p length bytes of @p path (0 = file size)
    [[nodiscard]] static Result<std::unique_ptr<MmioHardwareInterface>> Map(const std::string& path,
                                                                            size_t length = 0);

    ~MmioHardwareInterface() override;

    [[nodiscard]] uint32_t Read(uint32_t offset) const noexcept override;
    void Write(uint32_t offset, uint32_t value) noexcept override;

    [[nodiscard]] size_t Length() const noexcept { return length_; }

    MmioHardwareInterface(const MmioHardwareInterface&) = delete;
    MmioHardwareInterface& operator=(const MmioHardwareInterface&) = delete;

private:
    MmioHardwareInterface(volatile uint8_t* base, size_t length) noexcept
        : base_(base), length_(length) {}

    volatile uint8_t* base_{nullptr};
    size_t length_{0};
};

} // namespace XHCD::Driver
