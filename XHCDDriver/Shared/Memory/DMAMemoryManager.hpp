#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include "IDMAMemory.hpp"

namespace XHCD::Shared {

/**
 * \brief DMA memory slab manager for xHCI rings and contexts.
 *
 * Adopts one contiguous DMA-capable slab (mapped by the platform layer, e.g.
 * a VFIO or udmabuf mapping) and partitions it into ring segments, the event
 * ring segment table and the device context base array.
 *
 * \par xHCI Requirements
 * - §6.1: DCBAA 64-byte aligned
 * - §6.4.4: TRB rings 16-byte aligned, must not cross a 64 KiB boundary
 * - §6.5: ERST 64-byte aligned
 *
 * \par Allocation Model
 * - Sequential cursor allocation for first use
 * - Released regions are kept on a free list and reused by same-sized
 *   requests (transfer rings come and go with endpoint configuration)
 */
class DMAMemoryManager final : public IDMAMemory {
public:
    DMAMemoryManager() = default;
    ~DMAMemoryManager() override;

    /// Forget the slab. The mapping itself belongs to the caller.
    void Reset() noexcept;

    /**
     * \brief Adopt a DMA slab.
     *
     * \param virtualBase CPU mapping of the slab
     * \param iovaBase Device-visible address of the first byte
     * \param totalSize Slab length in bytes (rounded down to 16)
     * \return true on success, false on bad arguments or double init
     *
     * The slab is zeroed for deterministic ring state.
     */
    [[nodiscard]] bool Initialize(uint8_t* virtualBase, uint64_t iovaBase, size_t totalSize);

    std::optional<DMARegion> AllocateRegion(size_t size,
                                            size_t alignment = 16,
                                            size_t boundary = 0) override;
    void ReleaseRegion(const DMARegion& region) override;

    [[nodiscard]] uint64_t VirtToIOVA(const void* virt) const noexcept override;
    [[nodiscard]] void* IOVAToVirt(uint64_t iova) const noexcept override;

    /**
     * \brief Enable or disable verbose DMA coherency tracing.
     *
     * When enabled, Publish/Fetch emit offsets and a hex preview of the range.
     */
    static void SetTracingEnabled(bool enabled) noexcept;
    [[nodiscard]] static bool IsTracingEnabled() noexcept;

    void PublishToDevice(const void* address, size_t length) const noexcept override;
    void FetchFromDevice(const void* address, size_t length) const noexcept override;

    [[nodiscard]] size_t TotalSize() const noexcept override { return slabSize_; }
    [[nodiscard]] size_t AvailableSize() const noexcept override;

    [[nodiscard]] uint8_t* BaseVirtual() const noexcept { return slabVirt_; }
    [[nodiscard]] uint64_t BaseIOVA() const noexcept { return slabIOVA_; }
    [[nodiscard]] size_t FreeListSize() const noexcept;

    DMAMemoryManager(const DMAMemoryManager&) = delete;
    DMAMemoryManager& operator=(const DMAMemoryManager&) = delete;

private:
    [[nodiscard]] static constexpr size_t AlignSize(size_t size) noexcept {
        return (size + 15) & ~size_t(15);
    }

    [[nodiscard]] static constexpr bool CrossesBoundary(uint64_t start, size_t size, size_t boundary) noexcept {
        if (boundary == 0 || size == 0) {
            return false;
        }
        return (start / boundary) != ((start + size - 1) / boundary);
    }

    [[nodiscard]] bool IsInSlabRange(const void* ptr) const noexcept;
    [[nodiscard]] bool IsInSlabRange(uint64_t iova) const noexcept;

    /// Zero a range with volatile stores (uncached mappings)
    static void ZeroRange(uint8_t* address, size_t length) noexcept;

    void TraceHexPreview(const char* tag, const void* address, size_t length) const noexcept;

    mutable std::mutex lock_;
    std::vector<DMARegion> freeList_;

    uint8_t* slabVirt_{nullptr};    ///< Virtual base address
    uint64_t slabIOVA_{0};          ///< Device-visible base address (IOVA)
    size_t slabSize_{0};            ///< Total slab size (aligned)
    size_t cursor_{0};              ///< Current allocation offset
};

} // namespace XHCD::Shared
