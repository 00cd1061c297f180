// tests/test_ring.cpp
//
// Ring lifecycle and the full submit/complete cycle against the real kernel,
// using IORING_OP_NOP so no file or socket is involved.

#include <gtest/gtest.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <pthread.h>
#include <sstream>
#include <sys/eventfd.h>
#include <sys/mman.h>
#include <unistd.h>

#include "RingTestSupport.hpp"

namespace {

bool fd_is_open(const int fd) {
    return fcntl(fd, F_GETFD) != -1 || errno != EBADF;
}

bool is_mapped(void *addr, const size_t length) {
    return msync(addr, length, MS_ASYNC) == 0 || errno != ENOMEM;
}

io_uring_sqe nop(const __u64 user_data) {
    return make_sqe(IORING_OP_NOP, 0, user_data);
}

}

TEST(RingTest, NegotiatesQueueSizes) {
    RingParams params;
    params.setup_cqsize(16);
    RING_OR_SKIP(ring, 8, params);

    EXPECT_EQ(params.sq_entries(), 8u);
    EXPECT_EQ(params.cq_entries(), 16u);
    EXPECT_EQ(ring->submission().capacity(), 8u);
    EXPECT_EQ(ring->completion().capacity(), 16u);
    EXPECT_GE(ring->fd(), 0);
    EXPECT_EQ(ring->features(), params.features());
}

TEST(RingTest, LayoutFollowsTheSingleMmapFeature) {
    RingParams params;
    params.setup_cqsize(16);
    RING_OR_SKIP(ring, 8, params);

    const RingLayout &layout = ring->layout();
    EXPECT_EQ(ring->is_single_mmap(), params.is_feature_single_mmap());
    EXPECT_EQ(layout.sqes_len, 8 * sizeof(io_uring_sqe));
    EXPECT_EQ(layout.sq_ring_len, params.raw().sq_off.array + 8 * sizeof(__u32));
    EXPECT_EQ(layout.cq_ring_len, params.raw().cq_off.cqes + 16 * sizeof(io_uring_cqe));
    if (ring->is_single_mmap()) {
        EXPECT_EQ(ring->regions().sq_ring.size(), layout.combined_len());
        EXPECT_EQ(ring->regions().sq_ring.size(), std::max(layout.sq_ring_len, layout.cq_ring_len));
        EXPECT_FALSE(ring->regions().cq_ring.is_mapped());
    } else {
        EXPECT_EQ(ring->regions().sq_ring.size(), layout.sq_ring_len);
        EXPECT_EQ(ring->regions().cq_ring.size(), layout.cq_ring_len);
    }
}

TEST(RingTest, DefaultCompletionQueueIsTwiceTheSubmissionQueue) {
    RING_OR_SKIP(ring, 8);
    EXPECT_EQ(ring->completion().capacity(), 2 * ring->submission().capacity());
}

TEST(RingTest, RejectsZeroEntries) {
    EXPECT_THROW(Ring ring(0), std::invalid_argument);
}

TEST(RingTest, FullCycleKeepsPushOrder) {
    RING_OR_SKIP(ring, 8);
    SubmissionQueue &sq = ring->submission();

    for (__u64 i = 0; i < 8; ++i) {
        sq.push(nop(i));
    }
    EXPECT_THROW(sq.push(nop(8)), SubmissionQueueFull);

    EXPECT_EQ(ring->submit(), 8);
    // nothing left to submit, only waits for the eight completions
    EXPECT_EQ(ring->submit_and_wait(8), 0);
    EXPECT_EQ(ring->completion().len(), 8u);

    CompletionQueue &cq = ring->completion();
    for (__u64 i = 0; i < 8; ++i) {
        const auto completion = cq.next();
        ASSERT_TRUE(completion.has_value());
        EXPECT_EQ(completion->user_data, i);
        EXPECT_EQ(completion->res, 0);
    }
    EXPECT_FALSE(cq.next().has_value());
    cq.sync();

    EXPECT_EQ(sq.available_slots(), 8u);
    EXPECT_EQ(cq.overflow(), 0u);
    EXPECT_EQ(sq.dropped(), 0u);
}

TEST(RingTest, SubmitThenWaitSeparately) {
    RING_OR_SKIP(ring, 4);
    auto [submitter, sq, cq] = ring->split();

    sq.push_deferred(nop(1));
    sq.push_deferred(nop(2));
    EXPECT_EQ(submitter.submit(), 2);
    EXPECT_GE(submitter.submit_and_wait(2), 0);

    unsigned int seen = 0;
    while (const auto completion = cq.next()) {
        EXPECT_EQ(completion->user_data, ++seen);
    }
    cq.sync();
    EXPECT_EQ(seen, 2u);
}

TEST(RingTest, SubmitAndWaitWithSignalMask) {
    RING_OR_SKIP(ring, 4);
    sigset_t mask;
    ASSERT_EQ(pthread_sigmask(SIG_SETMASK, nullptr, &mask), 0);
    sigaddset(&mask, SIGUSR1);

    ring->submission().push(nop(7));
    EXPECT_EQ(ring->submit_and_wait(1, mask), 1);

    const auto completion = ring->completion().next();
    ASSERT_TRUE(completion.has_value());
    EXPECT_EQ(completion->user_data, 7u);
    EXPECT_EQ(completion->res, 0);
    ring->completion().sync();
}

TEST(RingTest, RawEnterSubmitsAndWaits) {
    RING_OR_SKIP(ring, 4);
    SubmissionQueue &sq = ring->submission();
    for (__u64 i = 0; i < 3; ++i) {
        sq.push(nop(100 + i));
    }

    EXPECT_EQ(ring->enter(3, 3, IORING_ENTER_GETEVENTS), 3);

    CompletionQueue &cq = ring->completion();
    EXPECT_EQ(cq.len(), 3u);
    for (__u64 i = 0; i < 3; ++i) {
        const auto completion = cq.next();
        ASSERT_TRUE(completion.has_value());
        EXPECT_EQ(completion->user_data, 100 + i);
    }
    cq.sync();
    EXPECT_EQ(sq.available_slots(), 4u);
}

TEST(RingTest, SubmittingNothingIsNotAnError) {
    RING_OR_SKIP(ring, 4);
    EXPECT_EQ(ring->submit(), 0);
    EXPECT_EQ(ring->submit_and_wait(0), 0);
}

TEST(RingTest, EventFdCanBeRegisteredAndRemoved) {
    RING_OR_SKIP(ring, 4);
    const int efd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    ASSERT_GE(efd, 0);

    ring->register_target(RegisterTarget::event_fd(efd));
    ring->submission().push(nop(5));
    EXPECT_EQ(ring->submit_and_wait(1), 1);

    eventfd_t value = 0;
    EXPECT_EQ(eventfd_read(efd, &value), 0);
    EXPECT_GE(value, 1u);

    ring->unregister_target(UnregisterTarget::EVENT_FD);
    EXPECT_THROW(ring->unregister_target(UnregisterTarget::EVENT_FD), std::system_error);
    ::close(efd);
}

TEST(RingTest, CloseUnmapsBeforeClosingTheDescriptor) {
    RING_OR_SKIP(ring, 8);
    const int fd = ring->fd();
    const RingMemory &memory = ring->regions();
    void *sq_ring = memory.sq_ring.data();
    const size_t sq_ring_len = memory.sq_ring.size();
    void *sqes = memory.sqes.data();
    const size_t sqes_len = memory.sqes.size();
    EXPECT_EQ(memory.cq_ring.is_mapped(), !ring->is_single_mmap());

    ASSERT_TRUE(fd_is_open(fd));
    ASSERT_TRUE(is_mapped(sq_ring, sq_ring_len));
    ASSERT_TRUE(is_mapped(sqes, sqes_len));
    ring->close();

    EXPECT_TRUE(ring->is_closed());
    EXPECT_FALSE(is_mapped(sq_ring, sq_ring_len));
    EXPECT_FALSE(is_mapped(sqes, sqes_len));
    EXPECT_FALSE(fd_is_open(fd));
    EXPECT_THROW((void)ring->regions(), std::logic_error);
    EXPECT_THROW((void)ring->submission(), std::logic_error);
    EXPECT_THROW((void)ring->completion(), std::logic_error);
    EXPECT_THROW((void)ring->submitter(), std::logic_error);

    // a second close and the destructor are both no-ops
    ring->close();
    EXPECT_EQ(ring->fd(), -1);
}

TEST(RingTest, DestructionReleasesEverything) {
    int fd = -1;
    {
        RING_OR_SKIP(ring, 8);
        fd = ring->fd();
        ASSERT_TRUE(fd_is_open(fd));
    }
    EXPECT_FALSE(fd_is_open(fd));
}

TEST(RingTest, DumpDescribesTheRing) {
    RING_OR_SKIP(ring, 8);
    std::ostringstream out;
    ring->dump(out);
    EXPECT_NE(out.str().find("fd=" + std::to_string(ring->fd())), std::string::npos);
    EXPECT_NE(out.str().find("sq: len=0/8"), std::string::npos);

    ring->close();
    std::ostringstream closed;
    ring->dump(closed);
    EXPECT_EQ(closed.str(), "[Ring] closed\n");
}
