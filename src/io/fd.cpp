#include "io/fd.hpp"

#include "util/errors.hpp"

#include <cerrno>
#include <unistd.h>

namespace filepipe {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        (void)Close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Fd::~Fd() { (void)Close(); }

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

void Fd::Reset(int fd) {
    (void)Close();
    fd_ = fd;
}

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

Result Fd::Close() {
    const int fd = fd_;
    fd_ = -1;
    if (fd <= STDERR_FILENO) return Result::Ok();
    // The descriptor is gone even if close reports an error; never retry.
    if (::close(fd) != 0 && errno != EINTR) {
        return ErrnoFail(errno, "close failed");
    }
    return Result::Ok();
}

} // namespace filepipe
