#include "ota/update_descriptor.hpp"

#include "util/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

namespace otafetch {

using json = nlohmann::json;

namespace {

bool IsHex(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::expected<void, std::string> ParseChecksum(const json& j, UpdateDescriptor& d) {
    const char* key = nullptr;
    if (j.contains("sha256")) {
        key = "sha256";
        d.checksum_algorithm = DigestAlgorithm::kSha256;
    } else if (j.contains("md5")) {
        key = "md5";
        d.checksum_algorithm = DigestAlgorithm::kMd5;
    } else {
        return std::unexpected("missing checksum ('md5' or 'sha256')");
    }

    const auto& v = j.at(key);
    if (!v.is_string()) {
        return std::unexpected(std::string("'") + key + "' must be a string");
    }
    d.checksum = ToLower(v.get<std::string>());
    if (d.checksum.size() != DigestHexLength(d.checksum_algorithm) || !IsHex(d.checksum)) {
        return std::unexpected(std::string("'") + key + "' is not a " +
                               std::to_string(DigestHexLength(d.checksum_algorithm)) +
                               "-digit hex string");
    }
    return {};
}

} // namespace

std::expected<UpdateDescriptor, std::string> DescriptorParser::Parse(const std::string& json_input) const {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        UpdateDescriptor d;
        d.file_name = j.value("filename", "");
        if (!IsPlainFileName(d.file_name)) {
            return std::unexpected("invalid 'filename': '" + d.file_name + "'");
        }

        if (!j.contains("size") || !(j["size"].is_number_unsigned() || j["size"].is_number_integer())) {
            return std::unexpected("missing or non-integer 'size'");
        }
        const auto size = j["size"].get<long long>();
        if (size < 0) {
            return std::unexpected("'size' must not be negative");
        }
        d.total_bytes = static_cast<std::uint64_t>(size);

        if (auto r = ParseChecksum(j, d); !r) {
            return std::unexpected(r.error());
        }

        d.url = j.value("url", "");
        if (d.url.empty()) {
            return std::unexpected("missing 'url'");
        }
        d.version = j.value("version", "0.0.0");
        d.force = j.value("force", false);

        if (auto it = j.find("metadata"); it != j.end()) {
            if (!it->is_object()) {
                return std::unexpected("'metadata' must be an object");
            }
            for (const auto& [key, val] : it->items()) {
                d.metadata.emplace(key, val.is_string() ? val.get<std::string>() : val.dump());
            }
        }

        return d;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

} // namespace otafetch
