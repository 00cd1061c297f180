#pragma once

#include <csignal>
#include <linux/io_uring.h>

// Wrapper for io_uring_setup syscall with error checking.
// Throws std::system_error carrying errno on failure.
int io_uring_setup(unsigned entries, io_uring_params *params);

// Wrapper for io_uring_enter syscall with error checking.
// `sig` may be nullptr; when set it replaces the signal mask for the duration of the call.
int io_uring_enter(
    int ring_fd,
    unsigned int to_submit,
    unsigned int min_complete,
    unsigned int flags,
    const sigset_t *sig
);

// Wrapper for io_uring_register syscall with error checking
int io_uring_register(
    int ring_fd,
    unsigned int op,
    const void *arg,
    unsigned int nr_args
);
