#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <linux/io_uring.h>

#include "Ring.hpp"

/**
 * @class ConcurrentRing
 * @brief A Ring that any number of threads may push to and pop from.
 *
 * Each side of the ring gets one mutex, so at most one thread mutates the
 * submission queue and at most one drains the completion queue at any time.
 * The kernel still sees a plain single producer / single consumer ring.
 */
class ConcurrentRing {
    std::unique_ptr<Ring> ring;
    mutable std::mutex sq_lock;
    mutable std::mutex cq_lock;

public:
    /**
     * @param ring Ring to take over; must be open.
     * @throws std::invalid_argument if `ring` is null or closed.
     */
    explicit ConcurrentRing(std::unique_ptr<Ring> ring);

    ConcurrentRing(const ConcurrentRing &) = delete;
    ConcurrentRing &operator=(const ConcurrentRing &) = delete;

    /**
     * @brief Pushes and publishes one entry.
     * @throws SubmissionQueueFull if no slot is free.
     */
    void push(const io_uring_sqe &entry);

    /**
     * @brief Takes the oldest completion and returns its slot to the kernel.
     */
    std::optional<Completion> pop();

    int submit();
    int submit_and_wait(unsigned int want);

    void register_target(const RegisterTarget &target);
    void unregister_target(UnregisterTarget target);

    [[nodiscard]] unsigned int available_slots() const;
    [[nodiscard]] unsigned int completion_len() const;
    [[nodiscard]] unsigned int dropped() const;
    [[nodiscard]] unsigned int overflow() const;

    [[nodiscard]] int fd() const;

    /**
     * @brief Gives the Ring back. Every other call throws std::logic_error afterwards.
     */
    std::unique_ptr<Ring> into_inner();

private:
    int submit_impl(unsigned int want);
    Ring &checked() const;
};
