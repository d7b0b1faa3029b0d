#include "util/settings_store.hpp"

#include "util/config_json_utils.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <fstream>

namespace otafetch {

namespace {
constexpr const char* kDownloadDirectoryKey = "DownloadDirectory";
} // namespace

JsonSettingsStore::JsonSettingsStore(std::string path, std::string default_directory)
    : path_(std::move(path)), default_directory_(std::move(default_directory)) {}

std::string JsonSettingsStore::GetDownloadDirectory() const {
    std::lock_guard<std::mutex> lk(mu_);

    std::ifstream existing(path_);
    if (!existing.is_open()) return default_directory_;
    existing.close();

    nlohmann::json j;
    std::string err;
    if (!config::detail::LoadJsonObjectFromFile(path_, j, err)) {
        LogWarn("Settings: %s, using %s", err.c_str(), default_directory_.c_str());
        return default_directory_;
    }
    auto it = j.find(kDownloadDirectoryKey);
    if (it == j.end() || !it->is_string() || it->get<std::string>().empty()) {
        return default_directory_;
    }
    return it->get<std::string>();
}

Result JsonSettingsStore::SetDownloadDirectory(const std::string& dir) {
    if (dir.empty()) return Result::Fail(EINVAL, "download directory must not be empty");

    std::lock_guard<std::mutex> lk(mu_);

    // Keep unrelated keys written by other tools.
    nlohmann::json j = nlohmann::json::object();
    std::string err;
    std::ifstream existing(path_);
    if (existing.is_open()) {
        existing.close();
        if (!config::detail::LoadJsonObjectFromFile(path_, j, err)) {
            LogWarn("Settings: %s, rewriting", err.c_str());
            j = nlohmann::json::object();
        }
    }
    j[kDownloadDirectoryKey] = dir;

    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream os(tmp_path, std::ios::trunc);
        if (!os.good()) return Result::Errno("open " + tmp_path);
        os << j.dump(2) << "\n";
        os.close();
        if (!os) return Result::Fail(EIO, "write " + tmp_path + " failed");
    }
    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        Result r = Result::Errno("rename " + tmp_path);
        std::remove(tmp_path.c_str());
        return r;
    }
    LogInfo("Download directory set to %s", dir.c_str());
    return Result::Ok();
}

} // namespace otafetch
