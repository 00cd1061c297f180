#pragma once

#include <span>
#include <sys/uio.h>

/**
 * @class RegisterTarget
 * @brief Resources handed to the kernel with io_uring_register.
 *
 * Buffer and file sets are borrowed, not copied: they must stay alive for
 * the duration of the register call.
 */
class RegisterTarget {
    unsigned int op;
    const void *arg;
    unsigned int nr_args;
    int fd_value;

    RegisterTarget(unsigned int op, const void *arg, unsigned int nr_args, int fd_value = -1) noexcept;

public:
    // Fixed buffers for the *_FIXED opcodes
    static RegisterTarget buffers(std::span<const iovec> buffers);
    // Fixed file table; -1 entries are left empty
    static RegisterTarget files(std::span<const int> fds);
    // eventfd signalled on every posted completion
    static RegisterTarget event_fd(int fd) noexcept;

    [[nodiscard]] unsigned int get_op() const noexcept { return op; }
    [[nodiscard]] const void *get_arg() const noexcept { return arg != nullptr ? arg : &fd_value; }
    [[nodiscard]] unsigned int get_nr_args() const noexcept { return nr_args; }
};

/**
 * @enum UnregisterTarget
 * @brief Resource kind removed with io_uring_register.
 */
enum class UnregisterTarget {
    BUFFERS,
    FILES,
    EVENT_FD
};

[[nodiscard]] unsigned int unregister_op(UnregisterTarget target) noexcept;
