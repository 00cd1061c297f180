#include "MappedRegion.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <sys/mman.h>

MappedRegion::MappedRegion(void *base, const size_t length) noexcept : base(base), length(length) {}

MappedRegion::MappedRegion() noexcept : base(nullptr), length(0) {}

MappedRegion MappedRegion::map(const int fd, const off_t offset, const size_t length, const char *what) {
    if (length == 0) {
        throw std::invalid_argument(std::string("mmap of empty region ") + what);
    }
    void *ptr = mmap(nullptr, length, PROT_READ | PROT_WRITE, MAP_SHARED | MAP_POPULATE, fd, offset);
    if (ptr == MAP_FAILED) {
        const int err = errno;
        throw std::system_error(err, std::generic_category(), std::string("mmap failed on ") + what);
    }
    return MappedRegion { ptr, length };
}

MappedRegion MappedRegion::anonymous(const size_t length) {
    if (length == 0) {
        throw std::invalid_argument("mmap of empty anonymous region");
    }
    void *ptr = mmap(nullptr, length, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
    if (ptr == MAP_FAILED) {
        const int err = errno;
        throw std::system_error(err, std::generic_category(), "mmap failed on anonymous region");
    }
    return MappedRegion { ptr, length };
}

MappedRegion::~MappedRegion() {
    reset();
}

MappedRegion::MappedRegion(MappedRegion &&other) noexcept
    : base(std::exchange(other.base, nullptr)), length(std::exchange(other.length, 0)) {}

MappedRegion &MappedRegion::operator=(MappedRegion &&other) noexcept {
    if (this != &other) {
        reset();
        base = std::exchange(other.base, nullptr);
        length = std::exchange(other.length, 0);
    }
    return *this;
}

void MappedRegion::reset() noexcept {
    if (base == nullptr) return;
    if (munmap(base, length) != 0) {
        // nothing can be done about it here, the pages are lost to us either way
        std::cerr << "[MappedRegion] munmap failed: " << std::strerror(errno) << std::endl;
    }
    base = nullptr;
    length = 0;
}

void MappedRegion::check_range(const size_t offset, const size_t bytes) const {
    if (base == nullptr || offset > length || bytes > length - offset) {
        throw std::out_of_range(
            "offset " + std::to_string(offset) + " (+" + std::to_string(bytes) +
            ") outside mapped region of " + std::to_string(length) + " bytes");
    }
}
