#include "util/config_json_utils.hpp"

#include <fstream>
#include <sstream>

namespace otafetch::config::detail {

namespace {

// Each getter leaves `out` alone when the key is absent and fails only when
// the key is present with the wrong type.

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j,
                     const char* key,
                     std::optional<std::uint64_t>& out,
                     std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v < 0) {
        err = std::string(key) + " must not be negative";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    std::stringstream ss;
    ss << is.rdbuf();
    if (!ParseJsonObject(ss.str(), out, err)) {
        err += ": " + path;
        return false;
    }
    return true;
}

bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err) {
    try {
        out = nlohmann::json::parse(text);
    } catch (const std::exception& e) {
        err = std::string("invalid JSON: ") + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object";
        return false;
    }
    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, FetcherConfigFromFile& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "MetadataPath", cfg.metadata_path, err)) return false;
    if (!GetStringIfPresent(j, "CurrentVersion", cfg.current_version, err)) return false;
    if (!GetStringIfPresent(j, "SettingsPath", cfg.settings_path, err)) return false;

    {
        std::string dir;
        if (!GetStringIfPresent(j, "DownloadDirectory", dir, err)) return false;
        if (!dir.empty()) cfg.download_directory = dir;
    }

    if (!GetU64IfPresent(j, "WorkerThreads", cfg.worker_threads, err)) return false;
    if (!GetU64IfPresent(j, "ProgressPollIntervalMs", cfg.progress_poll_interval_ms, err)) return false;
    if (!GetU64IfPresent(j, "GraceWindowMs", cfg.grace_window_ms, err)) return false;
    if (!GetU64IfPresent(j, "GracePollIntervalMs", cfg.grace_poll_interval_ms, err)) return false;
    if (!GetU64IfPresent(j, "VerifyChunkBytes", cfg.verify_chunk_bytes, err)) return false;
    if (!GetU64IfPresent(j, "ThrottleBytesPerSec", cfg.throttle_bytes_per_sec, err)) return false;
    if (!GetU64IfPresent(j, "RouteWatchIntervalMs", cfg.route_watch_interval_ms, err)) return false;

    if (cfg.worker_threads.has_value() && *cfg.worker_threads < kMinWorkerThreads) {
        err = "WorkerThreads must be at least " + std::to_string(kMinWorkerThreads);
        return false;
    }
    if (cfg.verify_chunk_bytes.has_value() && *cfg.verify_chunk_bytes == 0) {
        err = "VerifyChunkBytes must be at least 1";
        return false;
    }

    {
        std::string level;
        if (!GetStringIfPresent(j, "LogLevel", level, err)) return false;
        if (!level.empty()) {
            LogLevel lvl{};
            if (!ParseLogLevel(level, lvl)) {
                err = "unknown LogLevel '" + level + "'";
                return false;
            }
            cfg.log_level = lvl;
        }
    }

    return true;
}

} // namespace otafetch::config::detail
