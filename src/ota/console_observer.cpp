#include "ota/console_observer.hpp"

#include "util/logger.hpp"
#include "util/progress_text.hpp"

#include <cstdio>

namespace otafetch {

namespace {
std::atomic_bool g_progress_line_active{false};
} // namespace

ConsoleObserver::ConsoleObserver() { SetLogPreWriteHook(&ClearProgressLine); }

ConsoleObserver::~ConsoleObserver() { SetLogPreWriteHook(nullptr); }

void ConsoleObserver::RestoreState(const UpdateDescriptor& descriptor,
                                   PhaseFlags flags,
                                   std::uint64_t downloaded_bytes,
                                   std::uint64_t total_bytes) {
    std::lock_guard<std::mutex> lk(mu_);
    file_name_ = descriptor.file_name;
    text_ = FormatProgressText(downloaded_bytes, total_bytes);
    percent_ = ProgressPercent(downloaded_bytes, total_bytes);

    ClearProgressLine();
    if (flags.finished) {
        std::fprintf(stderr, "%s is already downloaded\n", file_name_.c_str());
    } else if (flags.paused) {
        std::fprintf(stderr, "%s paused at %s\n", file_name_.c_str(), text_.c_str());
    } else {
        DrawLocked();
    }
}

void ConsoleObserver::OnDescriptorFetched(const UpdateDescriptor& descriptor) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        file_name_ = descriptor.file_name;
        text_.clear();
        percent_ = 0;
    }
    ClearProgressLine();
    std::fprintf(stderr,
                 "Update available: %s (version %s, %s)\n",
                 descriptor.file_name.c_str(),
                 descriptor.version.c_str(),
                 FormatBytes(descriptor.total_bytes).c_str());
    for (const auto& [key, value] : descriptor.metadata) {
        std::fprintf(stderr, "  %s: %s\n", key.c_str(), value.c_str());
    }
    SetOutcome(Outcome::kDescriptorFetched);
}

void ConsoleObserver::OnFetchFailed() {
    ClearProgressLine();
    std::fprintf(stderr, "Checking for updates failed\n");
    SetOutcome(Outcome::kFetchFailed);
}

void ConsoleObserver::OnNoUpdate() {
    ClearProgressLine();
    std::fprintf(stderr, "No update available\n");
    SetOutcome(Outcome::kNoUpdate);
}

void ConsoleObserver::OnNoConnectivity() {
    ClearProgressLine();
    std::fprintf(stderr, "No network connection\n");
    SetOutcome(Outcome::kNoConnectivity);
}

void ConsoleObserver::OnInitialProgress(std::uint64_t downloaded, std::uint64_t total) {
    std::lock_guard<std::mutex> lk(mu_);
    text_ = FormatProgressText(downloaded, total);
    percent_ = ProgressPercent(downloaded, total);
    DrawLocked();
}

void ConsoleObserver::OnProgressBytes(const std::string& text) {
    std::lock_guard<std::mutex> lk(mu_);
    text_ = text;
    DrawLocked();
}

void ConsoleObserver::OnProgressPercent(int percent) {
    std::lock_guard<std::mutex> lk(mu_);
    percent_ = percent;
    DrawLocked();
}

void ConsoleObserver::OnTransferFinished() {
    std::lock_guard<std::mutex> lk(mu_);
    percent_ = 100;
    DrawLocked();
    ClearProgressLine();
}

void ConsoleObserver::OnVerificationResult(bool passed) {
    ClearProgressLine();
    if (passed) {
        std::fprintf(stderr, "Checksum OK\n");
        SetOutcome(Outcome::kVerifiedOk);
    } else {
        std::fprintf(stderr, "Checksum mismatch, download removed\n");
        SetOutcome(Outcome::kVerificationFailed);
    }
}

void ConsoleObserver::OnStatus(Status status) {
    ClearProgressLine();
    std::fprintf(stderr, "%s\n", StatusText(status));
    switch (status) {
        case Status::kDownloading:
        case Status::kVerifying:
            break;
        case Status::kCancelled:
            SetOutcome(Outcome::kCancelled);
            break;
        case Status::kFileMissing:
        case Status::kDeleteFailed:
        case Status::kVerificationError:
        case Status::kTransferFailed:
            SetOutcome(Outcome::kError);
            break;
    }
}

ConsoleObserver::Outcome ConsoleObserver::WaitForOutcome(const std::atomic_bool& interrupt) {
    std::unique_lock<std::mutex> lk(mu_);
    while (outcome_ == Outcome::kNone) {
        if (interrupt.load(std::memory_order_relaxed)) return Outcome::kNone;
        cv_.wait_for(lk, std::chrono::milliseconds(100));
    }
    return outcome_;
}

ConsoleObserver::Outcome ConsoleObserver::CurrentOutcome() {
    std::lock_guard<std::mutex> lk(mu_);
    return outcome_;
}

void ConsoleObserver::ResetOutcome() {
    std::lock_guard<std::mutex> lk(mu_);
    outcome_ = Outcome::kNone;
}

void ConsoleObserver::SetOutcome(Outcome outcome) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        outcome_ = outcome;
    }
    cv_.notify_all();
}

void ConsoleObserver::DrawLocked() {
    std::fprintf(stderr, "\r[%s] %3d%% | %s", file_name_.c_str(), percent_, text_.c_str());
    std::fflush(stderr);
    g_progress_line_active = true;
}

const char* ConsoleOutcomeName(ConsoleObserver::Outcome outcome) {
    switch (outcome) {
        case ConsoleObserver::Outcome::kNone: return "none";
        case ConsoleObserver::Outcome::kDescriptorFetched: return "descriptor-fetched";
        case ConsoleObserver::Outcome::kNoUpdate: return "no-update";
        case ConsoleObserver::Outcome::kFetchFailed: return "fetch-failed";
        case ConsoleObserver::Outcome::kNoConnectivity: return "no-connectivity";
        case ConsoleObserver::Outcome::kVerifiedOk: return "verified";
        case ConsoleObserver::Outcome::kVerificationFailed: return "verification-failed";
        case ConsoleObserver::Outcome::kCancelled: return "cancelled";
        case ConsoleObserver::Outcome::kError: return "error";
    }
    return "unknown";
}

void ClearProgressLine() {
    if (g_progress_line_active.exchange(false)) {
        std::fprintf(stderr, "\n");
    }
}

} // namespace otafetch
