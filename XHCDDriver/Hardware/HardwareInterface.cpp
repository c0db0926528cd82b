#include "HardwareInterface.hpp"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <chrono>
#include <thread>

#include "../Common/BarrierUtils.hpp"
#include "../Logging/Logging.hpp"

namespace XHCD::Driver {

uint64_t HardwareInterface::Read64(uint32_t offset) const noexcept {
    const uint64_t lo = Read(offset);
    const uint64_t hi = Read(offset + 4);
    return lo | (hi << 32);
}

void HardwareInterface::Write64(uint32_t offset, uint64_t value) noexcept {
    Write(offset, static_cast<uint32_t>(value));
    Write(offset + 4, static_cast<uint32_t>(value >> 32));
}

void HardwareInterface::SetBits(uint32_t offset, uint32_t bits) noexcept {
    Write(offset, Read(offset) | bits);
}

void HardwareInterface::ClearBits(uint32_t offset, uint32_t bits) noexcept {
    Write(offset, Read(offset) & ~bits);
}

// Polls until the masked value matches. LogFn-free variant of the usual
// wait helper: logs once at the end with attempts and elapsed time.
bool HardwareInterface::WaitBits(uint32_t offset,
                                 uint32_t mask,
                                 bool expectSet,
                                 uint32_t timeoutUsec,
                                 uint32_t pollIntervalUsec,
                                 const char* name) const {
    if (pollIntervalUsec == 0) {
        pollIntervalUsec = 100;
    }

    uint64_t waited = 0;
    uint64_t attempts = 0;

    while (timeoutUsec == 0 || waited < timeoutUsec) {
        const uint32_t value = Read(offset);
        attempts++;

        // MMIO reads return 0xFFFFFFFF when the device is gone
        if (value == 0xFFFFFFFFu) {
            XHCD_LOG_ERROR(Hardware, "%s: device gone (0x%08x) tries=%llu t=%lluus",
                           name, value, static_cast<unsigned long long>(attempts),
                           static_cast<unsigned long long>(waited));
            return false;
        }

        const bool bitSet = (value & mask) == mask;
        const bool bitClear = (value & mask) == 0;
        if ((expectSet && bitSet) || (!expectSet && bitClear)) {
            XHCD_LOG_V2(Hardware, "%s: 0x%08x tries=%llu t=%lluus", name, value,
                        static_cast<unsigned long long>(attempts),
                        static_cast<unsigned long long>(waited));
            return true;
        }

        if (timeoutUsec != 0 && waited + pollIntervalUsec > timeoutUsec) {
            break;
        }

        std::this_thread::sleep_for(std::chrono::microseconds(pollIntervalUsec));
        waited += pollIntervalUsec;
    }

    const uint32_t finalValue = Read(offset);
    XHCD_LOG_ERROR(Hardware, "%s: timeout waiting for mask 0x%08x %s (value=0x%08x tries=%llu t=%lluus)",
                   name, mask, expectSet ? "set" : "clear", finalValue,
                   static_cast<unsigned long long>(attempts),
                   static_cast<unsigned long long>(waited));
    return false;
}

// ----------------------------------------------------------------------------
// MmioHardwareInterface
// ----------------------------------------------------------------------------

Result<std::unique_ptr<MmioHardwareInterface>> MmioHardwareInterface::Map(const std::string& path,
                                                                          size_t length) {
    const int fd = ::open(path.c_str(), O_RDWR | O_SYNC | O_CLOEXEC);
    if (fd < 0) {
        XHCD_LOG_ERROR(Hardware, "MmioHardwareInterface: open(%s) failed: %m", path.c_str());
        return XHCD_ERROR_FATAL(kXHCDReturnNotFound, "cannot open BAR resource");
    }

    if (length == 0) {
        struct stat st{};
        if (::fstat(fd, &st) != 0 || st.st_size <= 0) {
            XHCD_LOG_ERROR(Hardware, "MmioHardwareInterface: cannot size %s", path.c_str());
            ::close(fd);
            return XHCD_ERROR_INVALID("BAR resource has no size");
        }
        length = static_cast<size_t>(st.st_size);
    }

    void* mapped = ::mmap(nullptr, length, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    ::close(fd);
    if (mapped == MAP_FAILED) {
        XHCD_LOG_ERROR(Hardware, "MmioHardwareInterface: mmap(%s, %zu) failed: %m", path.c_str(), length);
        return XHCD_ERROR_FATAL(kXHCDReturnIOError, "cannot map BAR resource");
    }

    XHCD_LOG(Hardware, "MmioHardwareInterface: mapped %s at %p (%zu bytes)", path.c_str(), mapped, length);
    return std::unique_ptr<MmioHardwareInterface>(
        new MmioHardwareInterface(static_cast<volatile uint8_t*>(mapped), length));
}

MmioHardwareInterface::~MmioHardwareInterface() {
    if (base_ != nullptr) {
        ::munmap(const_cast<uint8_t*>(base_), length_);
        base_ = nullptr;
    }
}

uint32_t MmioHardwareInterface::Read(uint32_t offset) const noexcept {
    if (offset + sizeof(uint32_t) > length_) {
        return 0xFFFFFFFFu;
    }
    return Read32(reinterpret_cast<volatile uint32_t*>(base_ + offset));
}

void MmioHardwareInterface::Write(uint32_t offset, uint32_t value) noexcept {
    if (offset + sizeof(uint32_t) > length_) {
        XHCD_LOG_ERROR(Hardware, "MmioHardwareInterface: write beyond BAR (0x%x)", offset);
        return;
    }
    Write32(reinterpret_cast<volatile uint32_t*>(base_ + offset), value);
}

} // namespace XHCD::Driver
