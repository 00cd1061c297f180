#pragma once

#include <atomic>
#include <optional>
#include <linux/io_uring.h>

#include "MappedRegion.hpp"

/**
 * @brief The fields of one posted completion, copied out of its ring slot.
 *
 * io_uring_cqe ends in a flexible array member (big_cqe, for CQE32 rings), so
 * it cannot be held by value; this is the fixed 16 byte part of it.
 */
struct Completion {
    __u64 user_data;
    __s32 res;
    __u32 flags;
};

/**
 * @class CompletionQueue
 * @brief Consumer side of the io_uring completion ring.
 *
 * The kernel produces and advances the tail; the process consumes and owns the
 * head. Completions are handed out in the order the kernel posted them. The
 * consumed head is kept locally until sync() so a batch can be released with
 * one store.
 *
 * Not thread safe: one consumer at a time, see ConcurrentRing otherwise.
 */
class CompletionQueue {
    std::atomic<unsigned int> *head;
    std::atomic<unsigned int> *tail;
    std::atomic<unsigned int> *overflow_count;
    const io_uring_cqe *cqes;
    unsigned int ring_mask;
    unsigned int ring_entries;
    unsigned int local_head;

public:
    CompletionQueue(const MappedRegion &ring, const io_uring_params &params);

    [[nodiscard]] unsigned int capacity() const noexcept { return ring_entries; }

    // Completions posted by the kernel and not yet taken with next().
    [[nodiscard]] unsigned int len() const noexcept;
    [[nodiscard]] bool is_empty() const noexcept { return len() == 0; }

    /**
     * @brief Takes the oldest completion, if any.
     * The slot stays reserved from the kernel until sync() publishes the head.
     */
    [[nodiscard]] std::optional<Completion> next() noexcept;

    // Returns consumed slots to the kernel. Repeating it without next() in between changes nothing.
    void sync() noexcept;

    // Head as the kernel currently sees it.
    [[nodiscard]] unsigned int published_head() const noexcept;

    // Completions the kernel could not post because the ring was full. Never decreases.
    [[nodiscard]] unsigned int overflow() const noexcept;
};
