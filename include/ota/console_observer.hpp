#pragma once

#include "ota/observer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace otafetch {

// Renders download progress on stderr as a single rewritten line and
// records the last terminal event for the CLI to wait on.
class ConsoleObserver final : public IUpdateObserver {
public:
    enum class Outcome {
        kNone,
        kDescriptorFetched,
        kNoUpdate,
        kFetchFailed,
        kNoConnectivity,
        kVerifiedOk,
        kVerificationFailed,
        kCancelled,
        kError,
    };

    // Registers ClearProgressLine with the logger for the observer's lifetime.
    ConsoleObserver();
    ~ConsoleObserver() override;

    void RestoreState(const UpdateDescriptor& descriptor,
                      PhaseFlags flags,
                      std::uint64_t downloaded_bytes,
                      std::uint64_t total_bytes) override;
    void OnDescriptorFetched(const UpdateDescriptor& descriptor) override;
    void OnFetchFailed() override;
    void OnNoUpdate() override;
    void OnNoConnectivity() override;
    void OnInitialProgress(std::uint64_t downloaded, std::uint64_t total) override;
    void OnProgressBytes(const std::string& text) override;
    void OnProgressPercent(int percent) override;
    void OnTransferFinished() override;
    void OnVerificationResult(bool passed) override;
    void OnStatus(Status status) override;

    // Blocks until an outcome is recorded. Returns kNone once `interrupt` is set.
    Outcome WaitForOutcome(const std::atomic_bool& interrupt);
    Outcome CurrentOutcome();
    void ResetOutcome();

private:
    void SetOutcome(Outcome outcome);
    void DrawLocked();

    std::mutex mu_;
    std::condition_variable cv_;
    Outcome outcome_ = Outcome::kNone;

    std::string file_name_;
    std::string text_;
    int percent_ = 0;
};

const char* ConsoleOutcomeName(ConsoleObserver::Outcome outcome);

// Ends an active progress line; it is redrawn by the next progress update.
void ClearProgressLine();

} // namespace otafetch
