#include "SubmissionQueue.hpp"

SubmissionQueue::SubmissionQueue(
    const MappedRegion &ring,
    const MappedRegion &sqe_region,
    const io_uring_params &params
) {
    const io_sqring_offsets &off = params.sq_off;
    head = ring.at<std::atomic<unsigned int>>(off.head);
    tail = ring.at<std::atomic<unsigned int>>(off.tail);
    sq_flags = ring.at<std::atomic<unsigned int>>(off.flags);
    dropped_count = ring.at<std::atomic<unsigned int>>(off.dropped);
    ring_mask = *ring.at<unsigned int>(off.ring_mask);
    ring_entries = *ring.at<unsigned int>(off.ring_entries);
    array = ring.at<unsigned int>(off.array, ring_entries);
    sqes = sqe_region.at<io_uring_sqe>(0, ring_entries);
    local_tail = tail->load(std::memory_order_acquire);
}

unsigned int SubmissionQueue::len() const noexcept {
    return local_tail - head->load(std::memory_order_acquire);
}

unsigned int SubmissionQueue::available_slots() const noexcept {
    return ring_entries - len();
}

void SubmissionQueue::write_slot(const io_uring_sqe &entry) noexcept {
    const unsigned int index = local_tail & ring_mask;
    sqes[index] = entry;
    array[index] = index;
    ++local_tail;
}

void SubmissionQueue::push(const io_uring_sqe &entry) {
    push_deferred(entry);
    sync();
}

void SubmissionQueue::push_deferred(const io_uring_sqe &entry) {
    if (is_full()) {
        throw SubmissionQueueFull();
    }
    write_slot(entry);
}

void SubmissionQueue::push_multiple(const std::span<const io_uring_sqe> entries) {
    if (entries.size() > available_slots()) {
        throw SubmissionQueueFull();
    }
    for (const auto &entry : entries) {
        write_slot(entry);
    }
    sync();
}

void SubmissionQueue::sync() noexcept {
    // release: the kernel must see the sqe and array writes before the new tail
    tail->store(local_tail, std::memory_order_release);
}

unsigned int SubmissionQueue::published_tail() const noexcept {
    return tail->load(std::memory_order_relaxed);
}

unsigned int SubmissionQueue::unpublished() const noexcept {
    return local_tail - published_tail();
}

unsigned int SubmissionQueue::flags() const noexcept {
    return sq_flags->load(std::memory_order_acquire);
}

unsigned int SubmissionQueue::dropped() const noexcept {
    return dropped_count->load(std::memory_order_acquire);
}
