#include "io/fd.hpp"

#include <cerrno>
#include <unistd.h>

namespace vaudio {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Fd::~Fd() { Close(); }

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

void Fd::Reset(int fd) {
    Close();
    fd_ = fd;
}

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

void Fd::Close() {
    if (fd_ < 0) return;
    for (int attempts = 0; attempts < 3 && ::close(fd_) == -1; ++attempts) {
        if (errno != EINTR) break;
    }
    fd_ = -1;
}

} // namespace vaudio
