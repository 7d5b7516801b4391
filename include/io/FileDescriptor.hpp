#pragma once

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <unistd.h>
#include <sys/types.h>

namespace fsort::io {

// Owns a POSIX file descriptor; closes it on destruction.
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(const int fd) noexcept : fd_(fd) {}

    ~FileDescriptor() { (void)close(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            (void)close();
            fd_ = other.release();
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    explicit operator bool() const noexcept { return fd_ >= 0; }

    int release() noexcept {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }

    // Returns ::close()'s result so callers can catch deferred write errors.
    int close() noexcept {
        if (fd_ < 0) return 0;
        const int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_{-1};
};

// One read(2), retried on EINTR. Returns bytes read, 0 at EOF, -1 with errno set.
inline ssize_t readSome(const int fd, void* b, const size_t n) {
    while (true) {
        const ssize_t r = ::read(fd, b, n);
        if (r < 0 && errno == EINTR) continue;
        return r;
    }
}

// Writes all n bytes, retrying short writes and EINTR. False with errno set on failure.
inline bool writeAll(const int fd, const void* b, size_t n) {
    const auto* p = static_cast<const uint8_t*>(b);
    while (n) {
        const ssize_t w = ::write(fd, p, n);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) {
            if (w == 0) errno = EIO;
            return false;
        }
        p += w;
        n -= static_cast<size_t>(w);
    }
    return true;
}

}
