#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace otafetch::config {

namespace {

std::string OrDefault(const std::optional<std::uint64_t>& v) {
    return v ? std::to_string(*v) : std::string("default");
}

} // namespace

void FetcherConfigFromFile::Reset() {
    *this = FetcherConfigFromFile{};
}

bool FetcherConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        LogError("Config: %s", err.c_str());
        last_error_ = err;
        return false;
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        LogError("Config: %s in %s", err.c_str(), path.c_str());
        Reset();
        last_error_ = err + " in " + path;
        return false;
    }
    return true;
}

bool FetcherConfigFromFile::LoadString(const std::string& json_text) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::ParseJsonObject(json_text, json, err) ||
        !detail::FillConfigFromJson(json, *this, err)) {
        LogError("Config: %s", err.c_str());
        Reset();
        last_error_ = err;
        return false;
    }
    return true;
}

void FetcherConfigFromFile::LogEffective() const {
    LogDebug("Config: metadata=%s current_version=%s settings=%s download_dir=%s",
             metadata_path.empty() ? "(none)" : metadata_path.c_str(),
             current_version.c_str(),
             settings_path.c_str(),
             download_directory ? download_directory->c_str() : "(settings)");
    LogDebug("Config: workers=%s poll_ms=%s grace_ms=%s grace_poll_ms=%s verify_chunk=%s throttle=%s route_ms=%s",
             OrDefault(worker_threads).c_str(),
             OrDefault(progress_poll_interval_ms).c_str(),
             OrDefault(grace_window_ms).c_str(),
             OrDefault(grace_poll_interval_ms).c_str(),
             OrDefault(verify_chunk_bytes).c_str(),
             OrDefault(throttle_bytes_per_sec).c_str(),
             OrDefault(route_watch_interval_ms).c_str());
}

} // namespace otafetch::config
