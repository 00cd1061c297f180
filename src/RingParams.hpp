#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <linux/io_uring.h>

class Ring;

/**
 * @class RingParams
 * @brief Configuration for the io_uring ring setup.
 *
 * Wraps the io_uring_params record handed to io_uring_setup. The setters are
 * only meaningful before the ring is built; setup overwrites the record in
 * place with what the kernel negotiated (entry counts, granted features and
 * the ring offsets).
 */
class RingParams {
    io_uring_params params{};

public:
    RingParams() = default;

    /**
     * @brief Busy-wait for I/O completions instead of relying on interrupts.
     */
    RingParams &setup_iopoll();

    /**
     * @brief Have a kernel thread poll the submission queue.
     * @param idle How long the poll thread spins before sleeping; kernel default if empty.
     */
    RingParams &setup_sqpoll(std::optional<std::chrono::milliseconds> idle = std::nullopt);

    /**
     * @brief Pin the sqpoll thread to `cpu`. Only valid together with setup_sqpoll().
     */
    RingParams &setup_sqpoll_cpu(unsigned int cpu);

    /**
     * @brief Size the completion queue independently of the submission queue.
     * @param entries Must not be smaller than the submission entries; rounded up to a power of two.
     */
    RingParams &setup_cqsize(unsigned int entries);

    /**
     * @brief Clamp oversized entry counts to the kernel maximum instead of failing.
     */
    RingParams &setup_clamp();

    RingParams &feature_single_mmap();
    RingParams &feature_nodrop();
    RingParams &feature_submit_stable();

    [[nodiscard]] unsigned int sq_entries() const noexcept { return params.sq_entries; }
    [[nodiscard]] unsigned int cq_entries() const noexcept { return params.cq_entries; }
    [[nodiscard]] unsigned int flags() const noexcept { return params.flags; }
    [[nodiscard]] unsigned int features() const noexcept { return params.features; }
    [[nodiscard]] std::chrono::milliseconds sq_thread_idle() const noexcept {
        return std::chrono::milliseconds(params.sq_thread_idle);
    }

    [[nodiscard]] bool is_feature_single_mmap() const noexcept { return params.features & IORING_FEAT_SINGLE_MMAP; }
    [[nodiscard]] bool is_feature_nodrop() const noexcept { return params.features & IORING_FEAT_NODROP; }
    [[nodiscard]] bool is_feature_submit_stable() const noexcept { return params.features & IORING_FEAT_SUBMIT_STABLE; }

    /**
     * @brief Checks the requested configuration against `entries` before setup.
     * @throws std::invalid_argument on combinations the kernel would reject.
     */
    void validate(unsigned int entries) const;

    /**
     * @brief Sets up a ring with this configuration and fills in the negotiated values.
     */
    std::unique_ptr<Ring> build(unsigned int entries);

    [[nodiscard]] io_uring_params &raw() noexcept { return params; }
    [[nodiscard]] const io_uring_params &raw() const noexcept { return params; }
};
