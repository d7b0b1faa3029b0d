#pragma once

#include "ota/providers.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace otafetch {

// Transfers from a local mirror (the descriptor url is a path or file://
// URL). One copy thread per Start(); the destination is reopened for resume
// so its length always matches the reported byte count.
class LocalTransferProvider final : public ITransferProvider {
public:
    struct Options {
        std::size_t chunk_bytes = 256 * 1024;
        // 0 copies as fast as the disk allows.
        std::uint64_t throttle_bytes_per_sec = 0;
    };

    LocalTransferProvider() : LocalTransferProvider(Options{}) {}
    explicit LocalTransferProvider(Options opt);
    LocalTransferProvider(const LocalTransferProvider&) = delete;
    LocalTransferProvider& operator=(const LocalTransferProvider&) = delete;
    ~LocalTransferProvider() override;

    bool HasTargetSet() const override;
    Result SetTarget(const UpdateDescriptor& descriptor) override;
    Result Start(const std::string& destination,
                 const std::optional<Network>& network,
                 std::uint64_t resume_offset) override;
    std::int64_t QueryProgressBytes() override;
    bool WaitForChange(std::int64_t last_seen, std::chrono::milliseconds timeout) override;
    void Release() override;

private:
    enum class RunState {
        kIdle,
        kRunning,
        kSucceeded,
        kFailed,
    };

    void CopyLoop(std::string source, std::string destination, std::uint64_t offset);
    void Finish(RunState state);
    std::int64_t CurrentLocked() const;

    Options opt_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::optional<std::string> source_;
    std::uint64_t expected_size_ = 0;
    RunState run_state_ = RunState::kIdle;
    std::uint64_t written_ = 0;
    std::atomic<bool> stop_{false};
    std::thread worker_;
};

} // namespace otafetch
