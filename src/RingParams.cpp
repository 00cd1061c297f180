#include "RingParams.hpp"

#include <bit>
#include <limits>
#include <stdexcept>
#include <string>

#include "Ring.hpp"

RingParams &RingParams::setup_iopoll() {
    params.flags |= IORING_SETUP_IOPOLL;
    return *this;
}

RingParams &RingParams::setup_sqpoll(const std::optional<std::chrono::milliseconds> idle) {
    if (idle && (idle->count() < 0 || idle->count() > std::numeric_limits<__u32>::max())) {
        throw std::invalid_argument("sq_thread_idle out of range");
    }
    params.flags |= IORING_SETUP_SQPOLL;
    if (idle) {
        params.sq_thread_idle = static_cast<__u32>(idle->count());
    }
    return *this;
}

RingParams &RingParams::setup_sqpoll_cpu(const unsigned int cpu) {
    params.flags |= IORING_SETUP_SQ_AFF;
    params.sq_thread_cpu = cpu;
    return *this;
}

RingParams &RingParams::setup_cqsize(const unsigned int entries) {
    params.flags |= IORING_SETUP_CQSIZE;
    params.cq_entries = entries;
    return *this;
}

RingParams &RingParams::setup_clamp() {
    params.flags |= IORING_SETUP_CLAMP;
    return *this;
}

RingParams &RingParams::feature_single_mmap() {
    params.features |= IORING_FEAT_SINGLE_MMAP;
    return *this;
}

RingParams &RingParams::feature_nodrop() {
    params.features |= IORING_FEAT_NODROP;
    return *this;
}

RingParams &RingParams::feature_submit_stable() {
    params.features |= IORING_FEAT_SUBMIT_STABLE;
    return *this;
}

void RingParams::validate(const unsigned int entries) const {
    if (entries == 0) {
        throw std::invalid_argument("ring entries must be > 0");
    }
    if ((params.flags & IORING_SETUP_SQ_AFF) && !(params.flags & IORING_SETUP_SQPOLL)) {
        throw std::invalid_argument("setup_sqpoll_cpu requires setup_sqpoll");
    }
    // the kernel rounds both sizes up to a power of two before comparing them,
    // and clamps instead of failing under IORING_SETUP_CLAMP
    if ((params.flags & IORING_SETUP_CQSIZE) && !(params.flags & IORING_SETUP_CLAMP) &&
        (params.cq_entries == 0 || std::bit_ceil(params.cq_entries) < std::bit_ceil(entries))) {
        throw std::invalid_argument(
            "cq size " + std::to_string(params.cq_entries) +
            " must not be smaller than " + std::to_string(entries) + " entries");
    }
}

std::unique_ptr<Ring> RingParams::build(const unsigned int entries) {
    return std::make_unique<Ring>(entries, *this);
}
