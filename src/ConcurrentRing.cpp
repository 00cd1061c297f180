#include "ConcurrentRing.hpp"

#include <stdexcept>
#include <utility>

ConcurrentRing::ConcurrentRing(std::unique_ptr<Ring> ring) : ring(std::move(ring)) {
    if (!this->ring || this->ring->is_closed()) {
        throw std::invalid_argument("ConcurrentRing needs an open ring");
    }
}

void ConcurrentRing::push(const io_uring_sqe &entry) {
    std::lock_guard guard(sq_lock);
    checked().submission().push(entry);
}

std::optional<Completion> ConcurrentRing::pop() {
    std::lock_guard guard(cq_lock);
    CompletionQueue &cq = checked().completion();
    auto completion = cq.next();
    if (completion) {
        cq.sync();
    }
    return completion;
}

int ConcurrentRing::submit() {
    return submit_impl(0);
}

int ConcurrentRing::submit_and_wait(const unsigned int want) {
    return submit_impl(want);
}

int ConcurrentRing::submit_impl(const unsigned int want) {
    EnterRequest request;
    {
        std::lock_guard guard(sq_lock);
        request = checked().submitter().prepare(want);
    }
    if (!request.needs_enter) {
        return static_cast<int>(request.to_submit);
    }
    // blocking in the kernel must not hold up other producers
    return checked().submitter().enter(request.to_submit, request.min_complete, request.flags, nullptr);
}

void ConcurrentRing::register_target(const RegisterTarget &target) {
    checked().register_target(target);
}

void ConcurrentRing::unregister_target(const UnregisterTarget target) {
    checked().unregister_target(target);
}

unsigned int ConcurrentRing::available_slots() const {
    std::lock_guard guard(sq_lock);
    return checked().submission().available_slots();
}

unsigned int ConcurrentRing::completion_len() const {
    std::lock_guard guard(cq_lock);
    return checked().completion().len();
}

unsigned int ConcurrentRing::dropped() const {
    return checked().submission().dropped();
}

unsigned int ConcurrentRing::overflow() const {
    return checked().completion().overflow();
}

int ConcurrentRing::fd() const {
    return checked().fd();
}

Ring &ConcurrentRing::checked() const {
    if (!ring) {
        throw std::logic_error("ConcurrentRing no longer owns a ring");
    }
    return *ring;
}

std::unique_ptr<Ring> ConcurrentRing::into_inner() {
    std::scoped_lock guard(sq_lock, cq_lock);
    checked();
    return std::move(ring);
}
