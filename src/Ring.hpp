#pragma once

#include <csignal>
#include <cstddef>
#include <iostream>
#include <optional>
#include <linux/io_uring.h>

#include "CompletionQueue.hpp"
#include "MappedRegion.hpp"
#include "Register.hpp"
#include "RingParams.hpp"
#include "SubmissionQueue.hpp"
#include "Submitter.hpp"

/**
 * @brief Byte sizes of the ring mappings, derived from the negotiated offsets.
 *
 * With IORING_FEAT_SINGLE_MMAP the SQ and CQ rings share one mapping of
 * combined_len() bytes at IORING_OFF_SQ_RING; otherwise each ring gets its own.
 * The sqe array is always mapped separately.
 */
struct RingLayout {
    size_t sq_ring_len = 0;
    size_t cq_ring_len = 0;
    size_t sqes_len = 0;
    bool single_mmap = false;

    static RingLayout from_params(const io_uring_params &params) noexcept;

    [[nodiscard]] size_t combined_len() const noexcept {
        return sq_ring_len > cq_ring_len ? sq_ring_len : cq_ring_len;
    }
};

/**
 * @brief The mappings backing one ring. cq_ring stays unmapped under single mmap.
 */
struct RingMemory {
    MappedRegion sq_ring;
    MappedRegion sqes;
    MappedRegion cq_ring;

    static RingMemory map(int ring_fd, const RingLayout &layout);

    [[nodiscard]] const MappedRegion &cq_region() const noexcept {
        return cq_ring.is_mapped() ? cq_ring : sq_ring;
    }
};

/**
 * @brief Everything needed to drive a ring at once, see Ring::split().
 */
struct RingParts {
    Submitter submitter;
    SubmissionQueue &submission;
    CompletionQueue &completion;
};

/**
 * @class Ring
 * @brief Owns an io_uring instance: the ring descriptor, its mappings and the queue views.
 *
 * The queues only borrow addresses inside the mappings, so a Ring can be
 * neither copied nor moved and hands out references that must not outlive it.
 * Teardown drops the queue views, then unmaps, then closes the descriptor.
 */
class Ring {
    int ring_fd = -1;
    unsigned int setup_flags = 0;
    unsigned int ring_features = 0;
    RingLayout ring_layout;
    // declared before the views so they are always destroyed first
    std::optional<RingMemory> memory;
    std::optional<SubmissionQueue> sq;
    std::optional<CompletionQueue> cq;

public:
    /**
     * @brief Sets up a ring with default parameters.
     * @param entries Requested submission queue size; the kernel rounds it up to a power of two.
     * @throws std::system_error if setup or mapping fails, std::invalid_argument if entries is 0.
     */
    explicit Ring(unsigned int entries);

    /**
     * @brief Sets up a ring with `params`, which is overwritten with the negotiated values.
     */
    Ring(unsigned int entries, RingParams &params);

    ~Ring();

    Ring(const Ring &) = delete;
    Ring &operator=(const Ring &) = delete;
    Ring(Ring &&) = delete;
    Ring &operator=(Ring &&) = delete;

    /**
     * @brief Releases the ring ahead of destruction. Further calls do nothing.
     * Any queue, Submitter or RingParts obtained earlier is invalid afterwards.
     */
    void close() noexcept;

    [[nodiscard]] bool is_closed() const noexcept { return ring_fd < 0; }

    [[nodiscard]] int fd() const noexcept { return ring_fd; }
    [[nodiscard]] unsigned int flags() const noexcept { return setup_flags; }
    [[nodiscard]] unsigned int features() const noexcept { return ring_features; }
    [[nodiscard]] const RingLayout &layout() const noexcept { return ring_layout; }
    [[nodiscard]] bool is_single_mmap() const noexcept { return ring_layout.single_mmap; }

    // These throw std::logic_error once the ring is closed.
    SubmissionQueue &submission();
    CompletionQueue &completion();
    [[nodiscard]] const RingMemory &regions() const;

    [[nodiscard]] Submitter submitter();
    [[nodiscard]] RingParts split();

    int submit() { return submitter().submit(); }
    int submit_and_wait(const unsigned int want) { return submitter().submit_and_wait(want); }
    int submit_and_wait(const unsigned int want, const sigset_t &mask) {
        return submitter().submit_and_wait(want, mask);
    }

    /**
     * @brief Raw io_uring_enter, see Submitter::enter.
     */
    int enter(const unsigned int to_submit, const unsigned int min_complete, const unsigned int flags,
              const sigset_t *sig = nullptr) {
        return submitter().enter(to_submit, min_complete, flags, sig);
    }

    void register_target(const RegisterTarget &target) { submitter().register_target(target); }
    void unregister_target(const UnregisterTarget target) { submitter().unregister_target(target); }

    // Prints descriptor, layout and queue positions.
    void dump(std::ostream &out = std::cerr) const;

private:
    void setup(unsigned int entries, RingParams &params);
    void require_open() const;
};
