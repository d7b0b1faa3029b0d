#pragma once

#include "ota/providers.hpp"

#include <mutex>
#include <string>

namespace otafetch {

// Persists user settings as a small JSON object:
//   {"DownloadDirectory": "/data/ota"}
// Writes go to "<path>.tmp" and are renamed over the file.
class JsonSettingsStore final : public ISettingsStore {
public:
    explicit JsonSettingsStore(std::string path, std::string default_directory = kDefaultDownloadDirectory);

    std::string GetDownloadDirectory() const override;
    Result SetDownloadDirectory(const std::string& dir) override;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    std::string default_directory_;
    mutable std::mutex mu_;
};

} // namespace otafetch
