#pragma once

#include "ota/providers.hpp"

#include <string>

namespace otafetch {

// Reads the update descriptor from a JSON document on disk (a mounted
// mirror or a file dropped by another agent).
class JsonMetadataProvider final : public IMetadataProvider {
public:
    JsonMetadataProvider(std::string path, std::string current_version);

    std::expected<std::optional<UpdateDescriptor>, std::string> Fetch() override;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    std::string current_version_;
};

} // namespace otafetch
