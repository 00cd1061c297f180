#pragma once

#include <cstddef>
#include <sys/types.h>

/**
 * @class MappedRegion
 * @brief Owns one mmap'd span of a ring descriptor.
 *
 * The span is readable and writable for the lifetime of the object and is
 * unmapped exactly once, when the owner is destroyed or reset. Which ring
 * structure lives in the span is decided by the caller through the offset.
 */
class MappedRegion {
    void *base;
    size_t length;

    MappedRegion(void *base, size_t length) noexcept;

public:
    /**
     * @brief Maps `length` bytes of the ring `fd` at one of the IORING_OFF_* offsets.
     * @param fd Ring descriptor returned by io_uring_setup.
     * @param offset IORING_OFF_SQ_RING, IORING_OFF_CQ_RING or IORING_OFF_SQES.
     * @param length Number of bytes to map.
     * @param what Name used in the error message.
     * @throws std::system_error with errno if mmap fails.
     */
    static MappedRegion map(int fd, off_t offset, size_t length, const char *what);

    /**
     * @brief Maps `length` zeroed private bytes not backed by any ring.
     * Used to stand in for kernel memory when exercising the queues in isolation.
     */
    static MappedRegion anonymous(size_t length);

    MappedRegion() noexcept;
    ~MappedRegion();

    MappedRegion(const MappedRegion &) = delete;
    MappedRegion &operator=(const MappedRegion &) = delete;
    MappedRegion(MappedRegion &&other) noexcept;
    MappedRegion &operator=(MappedRegion &&other) noexcept;

    // Unmaps now. Safe to call more than once.
    void reset() noexcept;

    [[nodiscard]] void *data() const noexcept { return base; }
    [[nodiscard]] size_t size() const noexcept { return length; }
    [[nodiscard]] bool is_mapped() const noexcept { return base != nullptr; }

    /**
     * @brief Returns a typed pointer `offset` bytes into the region.
     * @throws std::out_of_range if `count` T's at `offset` would not fit in the mapping.
     */
    template<typename T>
    [[nodiscard]] T *at(const size_t offset, const size_t count = 1) const {
        check_range(offset, sizeof(T) * count);
        return reinterpret_cast<T *>(static_cast<char *>(base) + offset);
    }

private:
    void check_range(size_t offset, size_t bytes) const;
};
