#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace otafetch {

// Writes a download destination. Opening for resume truncates the file to
// `offset` and positions the writer there, so the on-disk length always
// equals the number of bytes accepted so far.
class FileWriter final : public IWriter {
  public:
    static Result OpenForResume(std::string path, std::uint64_t offset, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    std::uint64_t Position() const { return position_; }

  private:
    std::string path_;
    Fd fd_;
    std::uint64_t position_ = 0;
};

} // namespace otafetch
