#pragma once

#include "util/result.hpp"

#include <string>
#include <sys/types.h>

namespace otafetch {

// Owns a POSIX file descriptor and closes it on destruction.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    // open(2) with O_CLOEXEC added; retried on EINTR. `what` prefixes the error.
    static Result Open(const std::string& path, int flags, mode_t mode, const char* what, Fd& out);

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    // Gives up ownership without closing.
    int Release();
    void Reset(int fd);
    void Close();

  private:
    int fd_{-1};
};

} // namespace otafetch
