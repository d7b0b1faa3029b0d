#include "ota/json_metadata_provider.hpp"

#include "util/logger.hpp"
#include "util/update_policy.hpp"

#include <fstream>
#include <sstream>

namespace otafetch {

JsonMetadataProvider::JsonMetadataProvider(std::string path, std::string current_version)
    : path_(std::move(path)), current_version_(std::move(current_version)) {}

std::expected<std::optional<UpdateDescriptor>, std::string> JsonMetadataProvider::Fetch() {
    std::ifstream in(path_);
    if (!in.is_open()) {
        return std::unexpected("cannot open metadata: " + path_);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return std::unexpected("cannot read metadata: " + path_);
    }

    DescriptorParser parser;
    auto parsed = parser.Parse(ss.str());
    if (!parsed) {
        return std::unexpected(path_ + ": " + parsed.error());
    }

    if (!UpdatePolicy::IsNewer(*parsed, current_version_)) {
        LogDebug("Metadata version %s is not newer than %s",
                 parsed->version.c_str(),
                 current_version_.c_str());
        return std::optional<UpdateDescriptor>{};
    }
    return std::optional<UpdateDescriptor>(std::move(*parsed));
}

} // namespace otafetch
