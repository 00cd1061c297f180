#pragma once

#include <atomic>
#include <span>
#include <stdexcept>
#include <linux/io_uring.h>

#include "MappedRegion.hpp"

/**
 * @brief Thrown by SubmissionQueue::push when every slot is still owned by the kernel.
 * Nothing is written; flush with a submit and retry once the kernel has consumed entries.
 */
class SubmissionQueueFull : public std::runtime_error {
public:
    SubmissionQueueFull() : std::runtime_error("out of space in submission queue!") {}
};

/**
 * @brief Builds an entry with only the generic fields set.
 * Opcode specific fields are left zeroed for the caller to fill in.
 */
inline io_uring_sqe make_sqe(const __u8 opcode, const __u8 flags, const __u64 user_data) {
    return io_uring_sqe {
        .opcode = opcode,
        .flags = flags,
        .user_data = user_data
    };
}

/**
 * @class SubmissionQueue
 * @brief Producer side of the io_uring submission ring.
 *
 * A view into memory owned by Ring (or by a test double). The process is the
 * only producer and owns the tail; the kernel consumes and advances the head.
 * Entries are written to the sqe array and their slot published through the
 * index array before the tail is released to the kernel.
 *
 * Not thread safe: one producer at a time, see ConcurrentRing otherwise.
 */
class SubmissionQueue {
    std::atomic<unsigned int> *head;
    std::atomic<unsigned int> *tail;
    std::atomic<unsigned int> *sq_flags;
    std::atomic<unsigned int> *dropped_count;
    unsigned int *array;
    io_uring_sqe *sqes;
    unsigned int ring_mask;
    unsigned int ring_entries;
    unsigned int local_tail;

public:
    /**
     * @param ring Region holding the SQ ring header and index array (possibly shared with the CQ ring).
     * @param sqe_region Region holding the sqe array.
     * @param params Negotiated parameters; sq_off is used to locate every field.
     */
    SubmissionQueue(const MappedRegion &ring, const MappedRegion &sqe_region, const io_uring_params &params);

    [[nodiscard]] unsigned int capacity() const noexcept { return ring_entries; }

    // Entries pushed but not yet consumed by the kernel.
    [[nodiscard]] unsigned int len() const noexcept;
    [[nodiscard]] unsigned int available_slots() const noexcept;
    [[nodiscard]] bool is_empty() const noexcept { return len() == 0; }
    [[nodiscard]] bool is_full() const noexcept { return len() >= ring_entries; }

    /**
     * @brief Copies `entry` into the next slot and releases it to the kernel.
     * @throws SubmissionQueueFull if no slot is free; the queue is left untouched.
     */
    void push(const io_uring_sqe &entry);

    /**
     * @brief Like push(), but the kernel does not see the entry until sync().
     */
    void push_deferred(const io_uring_sqe &entry);

    /**
     * @brief Pushes all entries or none, publishing them with a single tail store.
     * @throws SubmissionQueueFull if fewer than entries.size() slots are free.
     */
    void push_multiple(std::span<const io_uring_sqe> entries);

    // Publishes the local tail. Repeating it without pushes in between changes nothing.
    void sync() noexcept;

    // Tail as the kernel currently sees it.
    [[nodiscard]] unsigned int published_tail() const noexcept;
    // Pushed entries the kernel cannot see yet.
    [[nodiscard]] unsigned int unpublished() const noexcept;

    [[nodiscard]] unsigned int flags() const noexcept;
    [[nodiscard]] bool need_wakeup() const noexcept { return (flags() & IORING_SQ_NEED_WAKEUP) != 0; }
    [[nodiscard]] bool cq_overflow() const noexcept { return (flags() & IORING_SQ_CQ_OVERFLOW) != 0; }

    // Number of invalid entries the kernel has discarded. Never decreases.
    [[nodiscard]] unsigned int dropped() const noexcept;

private:
    void write_slot(const io_uring_sqe &entry) noexcept;
};
