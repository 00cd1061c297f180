#include "Submitter.hpp"

#include <atomic>

#include "Syscall.hpp"

Submitter::Submitter(const int ring_fd, const unsigned int setup_flags, SubmissionQueue &sq) noexcept
    : ring_fd(ring_fd), setup_flags(setup_flags), sq(sq) {}

int Submitter::submit() {
    return submit_and_wait_impl(0, nullptr);
}

int Submitter::submit_and_wait(const unsigned int want) {
    return submit_and_wait_impl(want, nullptr);
}

int Submitter::submit_and_wait(const unsigned int want, const sigset_t &mask) {
    return submit_and_wait_impl(want, &mask);
}

EnterRequest Submitter::prepare(const unsigned int want) {
    sq.sync();
    EnterRequest request { sq.len(), want, 0, true };
    if (want > 0) {
        request.flags |= IORING_ENTER_GETEVENTS;
    }

    if (setup_flags & IORING_SETUP_SQPOLL) {
        // The tail store must be ordered before reading the wakeup flag, otherwise
        // the poll thread can go idle between the two and never see our entries.
        std::atomic_thread_fence(std::memory_order_seq_cst);
        if (sq.need_wakeup()) {
            request.flags |= IORING_ENTER_SQ_WAKEUP;
        } else if (want == 0) {
            // the poll thread is awake and picks the entries up on its own
            request.needs_enter = false;
        }
    }
    return request;
}

int Submitter::submit_and_wait_impl(const unsigned int want, const sigset_t *sig) {
    const EnterRequest request = prepare(want);
    if (!request.needs_enter) {
        return static_cast<int>(request.to_submit);
    }
    return io_uring_enter(ring_fd, request.to_submit, request.min_complete, request.flags, sig);
}

int Submitter::enter(
    const unsigned int to_submit,
    const unsigned int min_complete,
    const unsigned int flags,
    const sigset_t *sig
) {
    return io_uring_enter(ring_fd, to_submit, min_complete, flags, sig);
}

void Submitter::register_target(const RegisterTarget &target) const {
    io_uring_register(ring_fd, target.get_op(), target.get_arg(), target.get_nr_args());
}

void Submitter::unregister_target(const UnregisterTarget target) const {
    io_uring_register(ring_fd, unregister_op(target), nullptr, 0);
}
