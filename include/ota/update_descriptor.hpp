#pragma once

#include "crypto/digest.hpp"

#include <cstdint>
#include <expected>
#include <map>
#include <string>

namespace otafetch {

// An available update artifact. Immutable once fetched.
struct UpdateDescriptor {
    std::string file_name;
    std::uint64_t total_bytes = 0;
    std::string checksum;  // lower-case hex
    DigestAlgorithm checksum_algorithm = DigestAlgorithm::kMd5;
    std::string url;
    std::string version;
    bool force = false;
    // Display-only fields (build date, changelog, ...).
    std::map<std::string, std::string> metadata;
};

class DescriptorParser {
  public:
    // {"filename", "size", "md5"|"sha256", "url", "version", "force", "metadata"}
    std::expected<UpdateDescriptor, std::string> Parse(const std::string& json_input) const;
};

} // namespace otafetch
