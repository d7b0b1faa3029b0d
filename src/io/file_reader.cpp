#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace otafetch {

Result FileReader::Open(std::string path, FileReader& out) {
    out.path_ = std::move(path);

    if (auto r = Fd::Open(out.path_, O_RDONLY, 0, "Failed to open input", out.fd_); !r.is_ok()) {
        return r;
    }

    struct stat st{};
    if (::fstat(out.fd_.Get(), &st) != 0) {
        return Result::Errno("fstat failed: " + out.path_);
    }
    if (S_ISDIR(st.st_mode)) {
        out.fd_.Close();
        return Result::Fail(EISDIR, "Input is a directory: " + out.path_);
    }
    out.size_ = static_cast<std::uint64_t>(st.st_size);
    return Result::Ok();
}

Result FileReader::Seek(std::uint64_t offset) {
    if (::lseek(fd_.Get(), static_cast<off_t>(offset), SEEK_SET) < 0) {
        return Result::Errno("lseek failed: " + path_);
    }
    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const { return size_; }

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace otafetch
