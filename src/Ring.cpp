#include "Ring.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <unistd.h>

#include "Syscall.hpp"

RingLayout RingLayout::from_params(const io_uring_params &params) noexcept {
    RingLayout layout;
    layout.sq_ring_len = params.sq_off.array + params.sq_entries * sizeof(__u32);
    layout.cq_ring_len = params.cq_off.cqes + params.cq_entries * sizeof(io_uring_cqe);
    layout.sqes_len = params.sq_entries * sizeof(io_uring_sqe);
    layout.single_mmap = (params.features & IORING_FEAT_SINGLE_MMAP) != 0;
    return layout;
}

RingMemory RingMemory::map(const int ring_fd, const RingLayout &layout) {
    RingMemory memory;
    memory.sqes = MappedRegion::map(ring_fd, IORING_OFF_SQES, layout.sqes_len, "sqes");
    if (layout.single_mmap) {
        memory.sq_ring = MappedRegion::map(ring_fd, IORING_OFF_SQ_RING, layout.combined_len(), "sq/cq ring");
    } else {
        memory.sq_ring = MappedRegion::map(ring_fd, IORING_OFF_SQ_RING, layout.sq_ring_len, "sq ring");
        memory.cq_ring = MappedRegion::map(ring_fd, IORING_OFF_CQ_RING, layout.cq_ring_len, "cq ring");
    }
    return memory;
}

Ring::Ring(const unsigned int entries) {
    RingParams params;
    setup(entries, params);
}

Ring::Ring(const unsigned int entries, RingParams &params) {
    setup(entries, params);
}

Ring::~Ring() {
    close();
}

void Ring::setup(const unsigned int entries, RingParams &params) {
    params.validate(entries);

    io_uring_params &p = params.raw();
    ring_fd = io_uring_setup(entries, &p);
    setup_flags = p.flags;
    ring_features = p.features;

    try {
        ring_layout = RingLayout::from_params(p);
        memory.emplace(RingMemory::map(ring_fd, ring_layout));
        sq.emplace(memory->sq_ring, memory->sqes, p);
        cq.emplace(memory->cq_region(), p);
    } catch (const std::exception &) {
        // no half built ring: unwind in teardown order and hand the error on
        close();
        throw;
    }
}

void Ring::close() noexcept {
    if (ring_fd < 0) return;

    cq.reset();
    sq.reset();
    memory.reset();

    if (::close(ring_fd) != 0) {
        std::cerr << "[Ring] close(" << ring_fd << ") failed: " << std::strerror(errno) << std::endl;
    }
    ring_fd = -1;
}

void Ring::require_open() const {
    if (ring_fd < 0) {
        throw std::logic_error("ring is closed");
    }
}

SubmissionQueue &Ring::submission() {
    require_open();
    return *sq;
}

CompletionQueue &Ring::completion() {
    require_open();
    return *cq;
}

const RingMemory &Ring::regions() const {
    require_open();
    return *memory;
}

Submitter Ring::submitter() {
    require_open();
    return Submitter { ring_fd, setup_flags, *sq };
}

RingParts Ring::split() {
    require_open();
    return RingParts { Submitter { ring_fd, setup_flags, *sq }, *sq, *cq };
}

void Ring::dump(std::ostream &out) const {
    if (ring_fd < 0) {
        out << "[Ring] closed" << std::endl;
        return;
    }
    out << "[Ring] fd=" << ring_fd
        << " flags=0x" << std::hex << setup_flags << " features=0x" << ring_features << std::dec
        << (ring_layout.single_mmap ? " single_mmap" : " split_mmap")
        << " sq_ring=" << ring_layout.sq_ring_len << "B cq_ring=" << ring_layout.cq_ring_len
        << "B sqes=" << ring_layout.sqes_len << "B\n"
        << "  sq: len=" << sq->len() << "/" << sq->capacity()
        << " unpublished=" << sq->unpublished() << " dropped=" << sq->dropped()
        << " need_wakeup=" << sq->need_wakeup() << "\n"
        << "  cq: len=" << cq->len() << "/" << cq->capacity()
        << " overflow=" << cq->overflow() << std::endl;
}
