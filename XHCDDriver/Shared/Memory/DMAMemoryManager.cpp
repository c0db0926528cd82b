#include "DMAMemoryManager.hpp"

#include <algorithm>
#include <atomic>
#include <cstdio>

#include "../../Common/BarrierUtils.hpp"
#include "../../Logging/Logging.hpp"

namespace XHCD::Shared {

namespace {
constexpr size_t kTracePreviewBytes = 64;
std::atomic<bool> gDMACoherencyTraceEnabled{false};
} // namespace

void DMAMemoryManager::SetTracingEnabled(bool enabled) noexcept {
    const bool previous = gDMACoherencyTraceEnabled.exchange(enabled, std::memory_order_acq_rel);
    if (previous == enabled) {
        return;
    }
    XHCD_LOG(Rings, "DMAMemoryManager: coherency tracing %s", enabled ? "ENABLED" : "disabled");
}

bool DMAMemoryManager::IsTracingEnabled() noexcept {
    return gDMACoherencyTraceEnabled.load(std::memory_order_acquire);
}

DMAMemoryManager::~DMAMemoryManager() { Reset(); }

void DMAMemoryManager::Reset() noexcept {
    std::lock_guard<std::mutex> guard(lock_);
    freeList_.clear();
    slabVirt_ = nullptr;
    slabIOVA_ = 0;
    slabSize_ = 0;
    cursor_ = 0;
}

bool DMAMemoryManager::Initialize(uint8_t* virtualBase, uint64_t iovaBase, size_t totalSize) {
    std::lock_guard<std::mutex> guard(lock_);

    if (slabVirt_ != nullptr) {
        XHCD_LOG(Rings, "DMAMemoryManager: Already initialized");
        return false;
    }

    if (virtualBase == nullptr || totalSize < 16) {
        XHCD_LOG_ERROR(Rings, "DMAMemoryManager::Initialize: virt=%p size=%zu", virtualBase, totalSize);
        return false;
    }

    if ((iovaBase & 0xF) != 0) {
        XHCD_LOG_ERROR(Rings, "DMAMemoryManager: IOVA 0x%llx not 16-byte aligned",
                       static_cast<unsigned long long>(iovaBase));
        return false;
    }

    slabVirt_ = virtualBase;
    slabIOVA_ = iovaBase;
    slabSize_ = totalSize & ~size_t(15);
    cursor_ = 0;
    freeList_.clear();

    ZeroRange(slabVirt_, slabSize_);

    XHCD_LOG(Rings, "DMAMemoryManager: Initialized - vaddr=%p iova=0x%llx size=%zu",
             slabVirt_, static_cast<unsigned long long>(slabIOVA_), slabSize_);
    return true;
}

std::optional<DMARegion> DMAMemoryManager::AllocateRegion(size_t size, size_t alignment, size_t boundary) {
    std::lock_guard<std::mutex> guard(lock_);

    if (slabVirt_ == nullptr) {
        XHCD_LOG(Rings, "DMAMemoryManager: AllocateRegion called before Initialize");
        return std::nullopt;
    }

    if (size == 0) {
        XHCD_LOG(Rings, "DMAMemoryManager: AllocateRegion with size=0");
        return std::nullopt;
    }

    if (alignment < 16 || (alignment & (alignment - 1)) != 0) {
        alignment = 16;
    }

    const size_t alignedSize = AlignSize(size);
    if (boundary != 0 && alignedSize > boundary) {
        XHCD_LOG_ERROR(Rings, "DMAMemoryManager: size %zu cannot fit inside boundary %zu",
                       alignedSize, boundary);
        return std::nullopt;
    }

    // Reuse a released region of the same size first
    for (auto it = freeList_.begin(); it != freeList_.end(); ++it) {
        if (it->size == alignedSize && (it->deviceBase & (alignment - 1)) == 0 &&
            !CrossesBoundary(it->deviceBase, alignedSize, boundary)) {
            DMARegion region = *it;
            freeList_.erase(it);
            ZeroRange(region.virtualBase, region.size);
            XHCD_LOG_V3(Rings, "DMAMemoryManager: Reused region iova=0x%llx size=%zu",
                        static_cast<unsigned long long>(region.deviceBase), region.size);
            return region;
        }
    }

    // Alignment is applied to the device address; virt and IOVA share offsets
    uint64_t start = (slabIOVA_ + cursor_ + (alignment - 1)) & ~static_cast<uint64_t>(alignment - 1);
    if (CrossesBoundary(start, alignedSize, boundary)) {
        start = (start + boundary - 1) & ~static_cast<uint64_t>(boundary - 1);
    }
    const size_t offset = static_cast<size_t>(start - slabIOVA_);

    if (offset + alignedSize > slabSize_) {
        XHCD_LOG_ERROR(Rings,
            "DMAMemoryManager: AllocateRegion would overflow - need %zu at +0x%zx (slab=%zu cursor=%zu)",
            alignedSize, offset, slabSize_, cursor_);
        return std::nullopt;
    }

    DMARegion region{};
    region.virtualBase = slabVirt_ + offset;
    region.deviceBase = start;
    region.size = alignedSize;

    cursor_ = offset + alignedSize;

    XHCD_LOG_V3(Rings, "DMAMemoryManager: Allocated region - vaddr=%p iova=0x%llx size=%zu (requested %zu)",
                region.virtualBase, static_cast<unsigned long long>(region.deviceBase), region.size, size);

    return region;
}

void DMAMemoryManager::ReleaseRegion(const DMARegion& region) {
    std::lock_guard<std::mutex> guard(lock_);

    if (!IsInSlabRange(region.virtualBase) || region.size == 0) {
        XHCD_LOG_ERROR(Rings, "DMAMemoryManager: ReleaseRegion of foreign region %p size=%zu",
                       region.virtualBase, region.size);
        return;
    }

    freeList_.push_back(region);
    XHCD_LOG_V3(Rings, "DMAMemoryManager: Released region iova=0x%llx size=%zu (free=%zu)",
                static_cast<unsigned long long>(region.deviceBase), region.size, freeList_.size());
}

size_t DMAMemoryManager::AvailableSize() const noexcept {
    std::lock_guard<std::mutex> guard(lock_);
    return slabSize_ - cursor_;
}

size_t DMAMemoryManager::FreeListSize() const noexcept {
    std::lock_guard<std::mutex> guard(lock_);
    return freeList_.size();
}

uint64_t DMAMemoryManager::VirtToIOVA(const void* virt) const noexcept {
    if (!IsInSlabRange(virt)) {
        return 0;
    }

    const auto* bytePtr = static_cast<const uint8_t*>(virt);
    const ptrdiff_t offset = bytePtr - slabVirt_;

    return slabIOVA_ + static_cast<uint64_t>(offset);
}

void* DMAMemoryManager::IOVAToVirt(uint64_t iova) const noexcept {
    if (!IsInSlabRange(iova)) {
        return nullptr;
    }

    const uint64_t offset = iova - slabIOVA_;
    return slabVirt_ + offset;
}

bool DMAMemoryManager::IsInSlabRange(const void* ptr) const noexcept {
    if (slabVirt_ == nullptr || ptr == nullptr) {
        return false;
    }

    const auto* bytePtr = static_cast<const uint8_t*>(ptr);
    return (bytePtr >= slabVirt_) && (bytePtr < (slabVirt_ + slabSize_));
}

bool DMAMemoryManager::IsInSlabRange(uint64_t iova) const noexcept {
    if (slabVirt_ == nullptr) {
        return false;
    }

    return (iova >= slabIOVA_) && (iova < (slabIOVA_ + slabSize_));
}

void DMAMemoryManager::ZeroRange(uint8_t* address, size_t length) noexcept {
    auto* volatilePtr = reinterpret_cast<volatile uint8_t*>(address);
    for (size_t i = 0; i < length; ++i) {
        volatilePtr[i] = 0;
    }
}

void DMAMemoryManager::PublishToDevice(const void* address, size_t length) const noexcept {
    if (address != nullptr && length != 0 && IsTracingEnabled()) {
        if (!IsInSlabRange(address)) {
            XHCD_LOG(Rings, "PublishToDevice: address %p (len=%zu) outside DMA slab", address, length);
        } else {
            TraceHexPreview("PublishToDevice", address, length);
        }
    }

    ::XHCD::Driver::IoBarrier();
}

void DMAMemoryManager::FetchFromDevice(const void* address, size_t length) const noexcept {
    ::XHCD::Driver::IoBarrier();

    if (address != nullptr && length != 0 && IsTracingEnabled()) {
        if (!IsInSlabRange(address)) {
            XHCD_LOG(Rings, "FetchFromDevice: address %p (len=%zu) outside DMA slab", address, length);
        } else {
            TraceHexPreview("FetchFromDevice", address, length);
        }
    }
}

void DMAMemoryManager::TraceHexPreview(const char* tag,
                                       const void* address,
                                       size_t length) const noexcept {
    const auto* bytes = static_cast<const uint8_t*>(address);
    const size_t preview = std::min(length, kTracePreviewBytes);
    char line[3 * 16 + 1];

    for (size_t offset = 0; offset < preview; offset += 16) {
        const size_t chunk = std::min(static_cast<size_t>(16), preview - offset);
        char* cursor = line;
        size_t remaining = sizeof(line);
        for (size_t i = 0; i < chunk && remaining > 3; ++i) {
            const int written = std::snprintf(cursor, remaining, "%02X ", bytes[offset + i]);
            if (written <= 0) {
                break;
            }
            cursor += written;
            remaining -= static_cast<size_t>(written);
        }
        *cursor = '\0';
        XHCD_LOG(Rings, "    %s +0x%02zx: %s", tag, offset, line);
    }
}

} // namespace XHCD::Shared
