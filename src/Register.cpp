#include "Register.hpp"

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>
#include <linux/io_uring.h>

namespace {

unsigned int checked_count(const size_t count, const char *what) {
    if (count == 0) {
        throw std::invalid_argument(std::string("cannot register an empty ") + what + " set");
    }
    if (count > std::numeric_limits<unsigned int>::max()) {
        throw std::invalid_argument(std::string("too many ") + what + " to register");
    }
    return static_cast<unsigned int>(count);
}

}

RegisterTarget::RegisterTarget(
    const unsigned int op,
    const void *arg,
    const unsigned int nr_args,
    const int fd_value
) noexcept : op(op), arg(arg), nr_args(nr_args), fd_value(fd_value) {}

RegisterTarget RegisterTarget::buffers(const std::span<const iovec> buffers) {
    return RegisterTarget { IORING_REGISTER_BUFFERS, buffers.data(), checked_count(buffers.size(), "buffer") };
}

RegisterTarget RegisterTarget::files(const std::span<const int> fds) {
    return RegisterTarget { IORING_REGISTER_FILES, fds.data(), checked_count(fds.size(), "file") };
}

RegisterTarget RegisterTarget::event_fd(const int fd) noexcept {
    // arg stays null so get_arg() points at our own copy of the descriptor
    return RegisterTarget { IORING_REGISTER_EVENTFD, nullptr, 1, fd };
}

unsigned int unregister_op(const UnregisterTarget target) noexcept {
    switch (target) {
        case UnregisterTarget::BUFFERS: return IORING_UNREGISTER_BUFFERS;
        case UnregisterTarget::FILES: return IORING_UNREGISTER_FILES;
        case UnregisterTarget::EVENT_FD: return IORING_UNREGISTER_EVENTFD;
    }
    return IORING_UNREGISTER_EVENTFD;
}
