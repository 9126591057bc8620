#include "io/fd.hpp"

#include <cerrno>
#include <unistd.h>

namespace apg {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.Release()) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        (void)Close();
        fd_ = other.Release();
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

int Fd::Close() {
    const int fd = Release();
    if (fd < 0 || fd == STDIN_FILENO) return 0;
    if (::close(fd) != 0 && errno != EINTR) return errno;
    return 0;
}

} // namespace apg
