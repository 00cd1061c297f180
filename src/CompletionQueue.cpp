#include "CompletionQueue.hpp"

CompletionQueue::CompletionQueue(const MappedRegion &ring, const io_uring_params &params) {
    const io_cqring_offsets &off = params.cq_off;
    head = ring.at<std::atomic<unsigned int>>(off.head);
    tail = ring.at<std::atomic<unsigned int>>(off.tail);
    overflow_count = ring.at<std::atomic<unsigned int>>(off.overflow);
    ring_mask = *ring.at<unsigned int>(off.ring_mask);
    ring_entries = *ring.at<unsigned int>(off.ring_entries);
    cqes = ring.at<const io_uring_cqe>(off.cqes, ring_entries);
    local_head = head->load(std::memory_order_acquire);
}

unsigned int CompletionQueue::len() const noexcept {
    return tail->load(std::memory_order_acquire) - local_head;
}

std::optional<Completion> CompletionQueue::next() noexcept {
    // acquire: the cqe contents must be visible once the kernel's tail is
    if (local_head == tail->load(std::memory_order_acquire)) {
        return std::nullopt;
    }
    const io_uring_cqe &slot = cqes[local_head & ring_mask];
    const Completion completion { slot.user_data, slot.res, slot.flags };
    ++local_head;
    return completion;
}

void CompletionQueue::sync() noexcept {
    // release: we are done reading the slots before the kernel may reuse them
    head->store(local_head, std::memory_order_release);
}

unsigned int CompletionQueue::published_head() const noexcept {
    return head->load(std::memory_order_relaxed);
}

unsigned int CompletionQueue::overflow() const noexcept {
    return overflow_count->load(std::memory_order_acquire);
}
