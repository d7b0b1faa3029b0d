#include "io/file_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace otafetch {

Result FileWriter::OpenForResume(std::string path, std::uint64_t offset, FileWriter& out) {
    out.path_ = std::move(path);
    out.position_ = 0;

    if (auto r = Fd::Open(out.path_, O_WRONLY | O_CREAT, 0644, "Failed to open output", out.fd_); !r.is_ok()) {
        return r;
    }
    const int fd = out.fd_.Get();

    if (::ftruncate(fd, static_cast<off_t>(offset)) != 0) {
        return Result::Errno("ftruncate failed: " + out.path_);
    }
    if (::lseek(fd, static_cast<off_t>(offset), SEEK_SET) < 0) {
        return Result::Errno("lseek failed: " + out.path_);
    }
    out.position_ = offset;
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            position_ += static_cast<std::uint64_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return Result::Errno("Write failed: " + path_);
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        return Result::Errno("fsync failed: " + path_);
    }
    return Result::Ok();
}

} // namespace otafetch
