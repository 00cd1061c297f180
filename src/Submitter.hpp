#pragma once

#include <csignal>

#include "Register.hpp"
#include "SubmissionQueue.hpp"

/**
 * @brief Arguments for one io_uring_enter call, as decided by Submitter::prepare().
 */
struct EnterRequest {
    unsigned int to_submit;
    unsigned int min_complete;
    unsigned int flags;
    // false when an awake sqpoll thread makes the syscall unnecessary
    bool needs_enter;
};

/**
 * @class Submitter
 * @brief The only path into io_uring_enter and io_uring_register.
 *
 * Holds nothing but the ring descriptor, the setup flags and a reference to the
 * submission queue, so it is cheap to derive again whenever it is needed. It
 * must not outlive the Ring it came from.
 */
class Submitter {
    int ring_fd;
    unsigned int setup_flags;
    SubmissionQueue &sq;

public:
    Submitter(int ring_fd, unsigned int setup_flags, SubmissionQueue &sq) noexcept;

    /**
     * @brief Publishes pending entries and tells the kernel about them.
     * @return Number of entries the kernel accepted, which may be fewer than were pending.
     */
    int submit();

    /**
     * @brief Like submit(), then blocks until at least `want` completions are ready.
     * A `want` of zero does not block.
     * @throws std::system_error, e.g. with std::errc::interrupted when a signal arrives.
     */
    int submit_and_wait(unsigned int want);

    /**
     * @brief submit_and_wait() with `mask` installed as the signal mask while blocked.
     */
    int submit_and_wait(unsigned int want, const sigset_t &mask);

    /**
     * @brief Raw io_uring_enter with caller chosen IORING_ENTER_* flags.
     *
     * Low level escape hatch: no syncing, no SQPOLL wakeup handling and no
     * validation of the flags is done here. Prefer submit() and submit_and_wait().
     */
    int enter(unsigned int to_submit, unsigned int min_complete, unsigned int flags, const sigset_t *sig);

    /**
     * @brief Publishes the submission tail and works out how io_uring_enter must be called.
     * Split from the syscall so callers can release their own locks before blocking.
     */
    [[nodiscard]] EnterRequest prepare(unsigned int want);

    void register_target(const RegisterTarget &target) const;
    void unregister_target(UnregisterTarget target) const;

private:
    int submit_and_wait_impl(unsigned int want, const sigset_t *sig);
};
