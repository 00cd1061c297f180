#include "Syscall.hpp"

#include <cerrno>
#include <stdexcept>
#include <string>
#include <system_error>
#include <asm-generic/unistd.h>
#include <unistd.h>

namespace {

[[noreturn]] void throw_errno(const int err, const std::string &what) {
    throw std::system_error(err, std::generic_category(), what);
}

}

int io_uring_setup(const unsigned entries, io_uring_params *params) {
    if (params == nullptr) {
        throw std::invalid_argument("io_uring_setup: params must not be null");
    }
    const int ring_fd = static_cast<int>(syscall(__NR_io_uring_setup, entries, params));
    if (ring_fd < 0) {
        const int err = errno;
        throw_errno(err, "io_uring_setup failed");
    }
    return ring_fd;
}

int io_uring_enter(
    const int ring_fd,
    const unsigned int to_submit,
    const unsigned int min_complete,
    const unsigned int flags,
    const sigset_t *sig
) {
    // The kernel expects the size of its own sigset, not glibc's sigset_t.
    const size_t sig_size = sig != nullptr ? _NSIG / 8 : 0;
    const int result = static_cast<int>(
        syscall(__NR_io_uring_enter, ring_fd, to_submit, min_complete, flags, sig, sig_size));
    if (result < 0) {
        const int err = errno;
        throw_errno(err, "io_uring_enter failed");
    }
    return result;
}

int io_uring_register(
    const int ring_fd,
    const unsigned int op,
    const void *arg,
    const unsigned int nr_args
) {
    const int result = static_cast<int>(syscall(__NR_io_uring_register, ring_fd, op, arg, nr_args));
    if (result < 0) {
        const int err = errno;
        throw_errno(err, "io_uring_register op " + std::to_string(op) + " failed");
    }
    return result;
}
