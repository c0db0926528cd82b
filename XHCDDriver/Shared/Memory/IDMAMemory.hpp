#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>

namespace XHCD::Shared {

/**
 * @brief DMA memory region with CPU virtual and device IOVA addresses.
 *
 * Represents a contiguous buffer visible to both the CPU and the xHC.
 */
struct DMARegion {
    uint8_t* virtualBase;   ///< CPU-accessible virtual address
    uint64_t deviceBase;    ///< Device-visible IOVA
    size_t size;            ///< Region size (16-byte multiple)
};

/**
 * @brief Pure virtual interface for DMA memory allocation and mapping.
 *
 * Consumers: TrbRing (command and transfer rings), EventRing (segments and
 * segment table), XhciController (DCBAA).
 */
class IDMAMemory {
public:
    virtual ~IDMAMemory() = default;

    // -------------------------------------------------------------------------
    // Allocation
    // -------------------------------------------------------------------------

    /**
     * @brief Allocate a zeroed DMA region.
     *
     * @param size Bytes to allocate (rounded up to 16)
     * @param alignment Start address alignment (power of 2, min 16)
     * @param boundary If nonzero, the region must not cross a multiple of this
     *                 value (xHCI rings must not straddle 64 KiB)
     * @return DMARegion on success, std::nullopt if insufficient space
     *
     * Thread Safety: safe to call from any thread.
     */
    virtual std::optional<DMARegion> AllocateRegion(
        size_t size,
        size_t alignment = 16,
        size_t boundary = 0) = 0;

    /**
     * @brief Return a region for reuse by a later allocation of the same size.
     *
     * The caller guarantees the device no longer references the region.
     */
    virtual void ReleaseRegion(const DMARegion& region) = 0;

    // -------------------------------------------------------------------------
    // Address Translation
    // -------------------------------------------------------------------------

    /// @return IOVA for @p virt, or 0 if outside the slab
    virtual uint64_t VirtToIOVA(const void* virt) const noexcept = 0;

    /// @return CPU pointer for @p iova, or nullptr if outside the slab
    virtual void* IOVAToVirt(uint64_t iova) const noexcept = 0;

    // -------------------------------------------------------------------------
    // Cache Coherency
    // -------------------------------------------------------------------------

    /**
     * @brief Order CPU writes before the device may fetch them.
     *
     * The slab is expected to be mapped coherent or uncached, so this is a
     * barrier rather than a cache flush.
     */
    virtual void PublishToDevice(const void* address, size_t length) const noexcept = 0;

    /**
     * @brief Order device writes before CPU reads of the range.
     */
    virtual void FetchFromDevice(const void* address, size_t length) const noexcept = 0;

    // -------------------------------------------------------------------------
    // Resource Queries
    // -------------------------------------------------------------------------

    virtual size_t TotalSize() const noexcept = 0;
    virtual size_t AvailableSize() const noexcept = 0;
};

} // namespace XHCD::Shared
