#include "io/fd.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace otafetch {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.Release()) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Reset(other.Release());
    }
    return *this;
}

Fd::~Fd() { Close(); }

Result Fd::Open(const std::string& path, int flags, mode_t mode, const char* what, Fd& out) {
    int fd = -1;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        return Result::Errno(std::string(what) + ": " + path);
    }
    out.Reset(fd);
    return Result::Ok();
}

int Fd::Release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

void Fd::Reset(int fd) {
    if (fd == fd_) return;
    Close();
    fd_ = fd;
}

void Fd::Close() {
    if (fd_ < 0) return;
    // Linux releases the descriptor even when close() reports EINTR.
    ::close(fd_);
    fd_ = -1;
}

} // namespace otafetch
