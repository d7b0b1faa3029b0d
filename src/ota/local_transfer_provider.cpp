#include "ota/local_transfer_provider.hpp"

#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <span>
#include <vector>

namespace otafetch {

LocalTransferProvider::LocalTransferProvider(Options opt) : opt_(opt) {
    if (opt_.chunk_bytes == 0) opt_.chunk_bytes = 256 * 1024;
}

LocalTransferProvider::~LocalTransferProvider() { Release(); }

bool LocalTransferProvider::HasTargetSet() const {
    std::lock_guard<std::mutex> lk(mu_);
    return source_.has_value();
}

Result LocalTransferProvider::SetTarget(const UpdateDescriptor& descriptor) {
    if (descriptor.url.empty()) {
        return Result::Fail(EINVAL, "descriptor has no url");
    }
    std::lock_guard<std::mutex> lk(mu_);
    source_ = LocalPathFromUrl(descriptor.url);
    expected_size_ = descriptor.total_bytes;
    return Result::Ok();
}

Result LocalTransferProvider::Start(const std::string& destination,
                                    const std::optional<Network>& network,
                                    std::uint64_t resume_offset) {
    Release();

    std::string source;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!source_) return Result::Fail(EINVAL, "no transfer target set");
        source = *source_;
        if (resume_offset > expected_size_) {
            return Result::Fail(EINVAL, "resume offset beyond end of file");
        }
        run_state_ = RunState::kRunning;
        written_ = resume_offset;
    }
    if (network) {
        LogDebug("LocalTransferProvider: %s over %s", source.c_str(), network->name.c_str());
    }

    stop_.store(false);
    worker_ = std::thread(&LocalTransferProvider::CopyLoop, this, std::move(source), destination, resume_offset);
    return Result::Ok();
}

std::int64_t LocalTransferProvider::CurrentLocked() const {
    switch (run_state_) {
        case RunState::kRunning:
        case RunState::kSucceeded:
            return static_cast<std::int64_t>(written_);
        case RunState::kIdle:
        case RunState::kFailed:
            break;
    }
    return kTerminated;
}

std::int64_t LocalTransferProvider::QueryProgressBytes() {
    std::lock_guard<std::mutex> lk(mu_);
    return CurrentLocked();
}

bool LocalTransferProvider::WaitForChange(std::int64_t last_seen, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, timeout, [&] {
        return run_state_ != RunState::kRunning || CurrentLocked() != last_seen;
    });
    return true;
}

void LocalTransferProvider::Release() {
    stop_.store(true);
    if (worker_.joinable()) worker_.join();
    {
        std::lock_guard<std::mutex> lk(mu_);
        run_state_ = RunState::kIdle;
        written_ = 0;
    }
    cv_.notify_all();
}

void LocalTransferProvider::Finish(RunState state) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        run_state_ = state;
    }
    cv_.notify_all();
}

void LocalTransferProvider::CopyLoop(std::string source, std::string destination, std::uint64_t offset) {
    SetThreadTag("transfer");
    FileReader reader;
    if (auto r = FileReader::Open(source, reader); !r.is_ok()) {
        LogError("LocalTransferProvider: %s", r.msg.c_str());
        Finish(RunState::kFailed);
        return;
    }
    if (auto r = reader.Seek(offset); !r.is_ok()) {
        LogError("LocalTransferProvider: %s", r.msg.c_str());
        Finish(RunState::kFailed);
        return;
    }

    FileWriter writer;
    if (auto r = FileWriter::OpenForResume(destination, offset, writer); !r.is_ok()) {
        LogError("LocalTransferProvider: %s", r.msg.c_str());
        Finish(RunState::kFailed);
        return;
    }

    std::uint64_t expected = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        expected = expected_size_;
    }

    std::vector<std::uint8_t> buf(opt_.chunk_bytes);
    const auto started = std::chrono::steady_clock::now();
    std::uint64_t copied = 0;

    while (!stop_.load()) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n < 0) {
            LogError("LocalTransferProvider: read %s failed (errno=%d)", source.c_str(), errno);
            Finish(RunState::kFailed);
            return;
        }
        if (n == 0) break;

        if (auto r = writer.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<std::size_t>(n)));
            !r.is_ok()) {
            LogError("LocalTransferProvider: %s", r.msg.c_str());
            Finish(RunState::kFailed);
            return;
        }
        copied += static_cast<std::uint64_t>(n);
        {
            std::lock_guard<std::mutex> lk(mu_);
            written_ = writer.Position();
        }
        cv_.notify_all();

        if (opt_.throttle_bytes_per_sec > 0) {
            const auto due = started + std::chrono::milliseconds(copied * 1000 / opt_.throttle_bytes_per_sec);
            while (!stop_.load() && std::chrono::steady_clock::now() < due) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
    }

    if (stop_.load()) return;

    if (auto r = writer.FsyncNow(); !r.is_ok()) {
        LogError("LocalTransferProvider: %s", r.msg.c_str());
        Finish(RunState::kFailed);
        return;
    }
    if (writer.Position() != expected) {
        LogError("LocalTransferProvider: %s ended at %llu bytes, expected %llu",
                 source.c_str(),
                 (unsigned long long)writer.Position(),
                 (unsigned long long)expected);
        Finish(RunState::kFailed);
        return;
    }
    Finish(RunState::kSucceeded);
}

} // namespace otafetch
