#include "ota/download_state_machine.hpp"

#include "io/file_writer.hpp"
#include "util/logger.hpp"
#include "util/progress_text.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

namespace otafetch {

namespace fs = std::filesystem;

namespace {

// Length of a regular file, nullopt when absent or not a regular file.
std::optional<std::uint64_t> OnDiskLength(const std::string& path) {
    std::error_code ec;
    const auto st = fs::status(path, ec);
    if (ec || !fs::is_regular_file(st)) return std::nullopt;
    const auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return static_cast<std::uint64_t>(size);
}

} // namespace

// Binds progress callbacks from one monitor task to the attempt it was
// started for, so a stale monitor cannot touch a newer attempt.
class DownloadStateMachine::AttemptSink final : public IProgressSink {
public:
    AttemptSink(DownloadStateMachine& owner, std::uint64_t attempt) : owner_(owner), attempt_(attempt) {}

    bool OnProgress(const ProgressUpdate& update) override {
        return owner_.OnMonitorProgress(attempt_, update);
    }

    void OnTransferComplete() override { owner_.OnMonitorComplete(attempt_); }

private:
    DownloadStateMachine& owner_;
    std::uint64_t attempt_;
};

DownloadStateMachine::DownloadStateMachine(IMetadataProvider& metadata,
                                           ITransferProvider& transfer,
                                           IConnectivitySource& connectivity,
                                           ISettingsStore& settings,
                                           Options opt)
    : metadata_(metadata),
      transfer_(transfer),
      settings_(settings),
      opt_(opt),
      pool_(std::max(opt.worker_threads, kMinWorkerThreads)),
      strand_(pool_),
      watcher_(connectivity, pool_, *this, opt.connectivity) {
    watcher_.Start();
}

DownloadStateMachine::~DownloadStateMachine() { Shutdown(); }

void DownloadStateMachine::AttachObserver(std::weak_ptr<IUpdateObserver> observer) {
    std::lock_guard<std::mutex> lk(observer_mu_);
    observer_ = std::move(observer);
}

void DownloadStateMachine::DetachObserver() {
    std::lock_guard<std::mutex> lk(observer_mu_);
    observer_.reset();
}

template <typename Fn>
void DownloadStateMachine::Notify(Fn&& fn) {
    std::shared_ptr<IUpdateObserver> observer;
    {
        std::lock_guard<std::mutex> lk(observer_mu_);
        observer = observer_.lock();
    }
    if (observer) fn(*observer);
}

void DownloadStateMachine::CheckForUpdate() {
    strand_.Post([this] { DoCheckForUpdate(); });
}

void DownloadStateMachine::StartDownload() {
    strand_.Post([this] { DoStartDownload(); });
}

void DownloadStateMachine::Pause(bool pause) {
    strand_.Post([this, pause] { DoPause(pause); });
}

void DownloadStateMachine::Cancel() {
    strand_.Post([this] { DoCancel(); });
}

void DownloadStateMachine::DeleteDownload() {
    strand_.Post([this] { DoDelete(); });
}

void DownloadStateMachine::Shutdown() {
    {
        std::lock_guard<std::recursive_mutex> lk(mu_);
        if (shut_down_) return;
        shut_down_ = true;
        StopTransferLocked();
        verify_task_.Cancel();
    }
    watcher_.Stop();
    pool_.Shutdown();
    LogDebug("DownloadStateMachine: shut down");
}

TransferState DownloadStateMachine::Snapshot() const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    TransferState s = state_;
    s.is_online = watcher_.IsOnline();
    return s;
}

std::optional<UpdateDescriptor> DownloadStateMachine::Descriptor() const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    return descriptor_;
}

std::string DownloadStateMachine::DestinationPath() const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    return destination_;
}

bool DownloadStateMachine::WaitForCommands(std::chrono::milliseconds timeout) const {
    return strand_.WaitIdle(timeout);
}

// ---- commands ----

void DownloadStateMachine::DoCheckForUpdate() {
    {
        std::lock_guard<std::recursive_mutex> lk(mu_);
        if (shut_down_) return;

        switch (state_.phase) {
            case Phase::kDownloading:
            case Phase::kPaused:
            case Phase::kVerifying:
                RestoreStateLocked();
                return;
            case Phase::kVerifiedOk:
                RestoreStateLocked();
                BeginVerificationLocked();
                return;
            default:
                break;
        }
        SetPhaseLocked(Phase::kFetching);
    }

    auto fetched = metadata_.Fetch();

    std::lock_guard<std::recursive_mutex> lk(mu_);
    if (shut_down_ || state_.phase != Phase::kFetching) return;

    if (!fetched) {
        LogWarn("Update check failed: %s", fetched.error().c_str());
        SetPhaseLocked(Phase::kIdle);
        Notify([](IUpdateObserver& o) { o.OnFetchFailed(); });
        return;
    }
    if (!fetched->has_value()) {
        LogInfo("No update available");
        SetPhaseLocked(Phase::kNoUpdate);
        Notify([](IUpdateObserver& o) { o.OnNoUpdate(); });
        return;
    }

    descriptor_ = std::move(**fetched);
    target_stale_ = true;
    state_.total_bytes = descriptor_->total_bytes;
    ResetCountersLocked();
    LogInfo("Update available: %s version=%s size=%llu",
            descriptor_->file_name.c_str(),
            descriptor_->version.c_str(),
            (unsigned long long)descriptor_->total_bytes);

    if (auto r = ResolveDestinationLocked(); !r.is_ok()) {
        LogError("Cannot prepare download directory: %s", r.msg.c_str());
    } else if (VerifyIfCompleteLocked()) {
        return;
    } else if (const auto len = OnDiskLength(destination_); len && *len < state_.total_bytes) {
        state_.downloaded_bytes = *len;
        state_.progress_percent = ProgressPercent(*len, state_.total_bytes);
    }

    SetPhaseLocked(Phase::kReady);
    const UpdateDescriptor descriptor = *descriptor_;
    Notify([&descriptor](IUpdateObserver& o) { o.OnDescriptorFetched(descriptor); });
}

void DownloadStateMachine::DoStartDownload() {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    if (shut_down_) return;
    if (!descriptor_) {
        LogWarn("StartDownload: no update descriptor, check for updates first");
        return;
    }
    switch (state_.phase) {
        case Phase::kReady:
        case Phase::kPaused:
        case Phase::kDownloading:
            StartTransferLocked();
            break;
        default:
            LogDebug("StartDownload ignored in phase %s", PhaseName(state_.phase));
            break;
    }
}

void DownloadStateMachine::DoPause(bool pause) {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    if (shut_down_) return;

    if (pause && state_.phase == Phase::kDownloading) {
        StopTransferLocked();
        SetPhaseLocked(Phase::kPaused);
        LogInfo("Download paused at %llu/%llu bytes",
                (unsigned long long)state_.downloaded_bytes,
                (unsigned long long)state_.total_bytes);
    } else if (!pause && state_.phase == Phase::kPaused) {
        StartTransferLocked();
    } else {
        LogDebug("Pause(%s) ignored in phase %s", pause ? "true" : "false", PhaseName(state_.phase));
    }
}

void DownloadStateMachine::DoCancel() {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    if (shut_down_) return;

    switch (state_.phase) {
        case Phase::kFetching:
        case Phase::kReady:
        case Phase::kDownloading:
        case Phase::kPaused:
        case Phase::kVerifying:
            break;
        default:
            LogDebug("Cancel ignored in phase %s", PhaseName(state_.phase));
            return;
    }

    StopTransferLocked();
    verify_task_.Cancel();
    ++verify_attempt_;
    watcher_.CancelGraceWindow();

    SetPhaseLocked(Phase::kCancelled);
    ResetCountersLocked();
    state_.total_bytes = 0;
    descriptor_.reset();
    target_stale_ = true;
    Notify([](IUpdateObserver& o) { o.OnStatus(Status::kCancelled); });
    SetPhaseLocked(Phase::kIdle);
}

void DownloadStateMachine::DoDelete() {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    if (shut_down_) return;

    if (state_.phase == Phase::kDownloading || state_.phase == Phase::kVerifying) {
        LogWarn("Refusing to delete the download while %s", PhaseName(state_.phase));
        Notify([](IUpdateObserver& o) { o.OnStatus(Status::kDeleteFailed); });
        return;
    }
    if (destination_.empty()) {
        if (!descriptor_ || !ResolveDestinationLocked().is_ok()) {
            LogWarn("Nothing to delete");
            return;
        }
    }

    if (auto r = DeleteFileLocked(); !r.is_ok()) return;

    ResetCountersLocked();
    if (state_.phase == Phase::kVerifiedOk) SetPhaseLocked(Phase::kIdle);
}

// ---- connectivity ----

void DownloadStateMachine::OnNetworkAvailable(const Network& network) {
    strand_.Post([this, network] { DoNetworkAvailable(network); });
}

void DownloadStateMachine::DoNetworkAvailable(const Network& network) {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    if (shut_down_) return;

    state_.is_online = true;
    network_ = network;
    // A loss may have arrived while this was queued.
    if (state_.phase == Phase::kDownloading && watcher_.IsOnline()) {
        LogInfo("Resuming transfer on network %s", network.name.c_str());
        StartTransferLocked();
    }
}

void DownloadStateMachine::OnNetworkLost(const Network& network) {
    // Runs on the source's thread so the socket is dropped without waiting
    // behind queued commands.
    std::lock_guard<std::recursive_mutex> lk(mu_);
    if (shut_down_) return;

    state_.is_online = false;
    if (!network_ || *network_ == network) network_.reset();
    StopTransferLocked();
    if (state_.phase != Phase::kVerifying && state_.phase != Phase::kVerifiedOk) {
        watcher_.ArmGraceWindow();
    }
}

void DownloadStateMachine::OnConnectivityTimeout() {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    if (shut_down_) return;
    Notify([](IUpdateObserver& o) { o.OnNoConnectivity(); });
}

// ---- helpers ----

void DownloadStateMachine::SetPhaseLocked(Phase phase) {
    if (state_.phase == phase) return;
    LogDebug("Phase %s -> %s", PhaseName(state_.phase), PhaseName(phase));
    state_.phase = phase;
}

void DownloadStateMachine::RestoreStateLocked() {
    if (!descriptor_) return;
    PhaseFlags flags;
    flags.paused = state_.phase == Phase::kPaused;
    flags.finished = state_.phase == Phase::kVerifying || state_.phase == Phase::kVerifiedOk;
    const UpdateDescriptor descriptor = *descriptor_;
    const auto downloaded = state_.downloaded_bytes;
    const auto total = state_.total_bytes;
    Notify([&](IUpdateObserver& o) { o.RestoreState(descriptor, flags, downloaded, total); });
}

Result DownloadStateMachine::ResolveDestinationLocked() {
    if (!descriptor_) return Result::Fail(-1, "no update descriptor");

    const fs::path dir(settings_.GetDownloadDirectory());
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        fs::create_directories(dir, ec);
        if (ec) {
            return Result::Fail(ec.value(), "cannot create " + dir.string() + ": " + ec.message());
        }
    }
    destination_ = (dir / descriptor_->file_name).string();
    return Result::Ok();
}

// Goes straight to verification when the destination already holds every byte.
bool DownloadStateMachine::VerifyIfCompleteLocked() {
    const auto len = OnDiskLength(destination_);
    if (!len) return false;
    if (*len > state_.total_bytes) {
        LogWarn("%s is larger than expected (%llu > %llu), it will be downloaded again",
                destination_.c_str(),
                (unsigned long long)*len,
                (unsigned long long)state_.total_bytes);
        return false;
    }
    if (*len != state_.total_bytes) return false;

    LogInfo("%s is already downloaded", destination_.c_str());
    state_.downloaded_bytes = *len;
    state_.progress_percent = 100;
    SetPhaseLocked(Phase::kVerifying);
    RestoreStateLocked();
    BeginVerificationLocked();
    return true;
}

void DownloadStateMachine::StartTransferLocked() {
    StopTransferLocked();

    if (auto r = ResolveDestinationLocked(); !r.is_ok()) {
        LogError("Cannot start download: %s", r.msg.c_str());
        SetPhaseLocked(Phase::kReady);
        Notify([](IUpdateObserver& o) { o.OnStatus(Status::kTransferFailed); });
        return;
    }
    if (VerifyIfCompleteLocked()) return;

    std::uint64_t offset = OnDiskLength(destination_).value_or(0);
    if (offset > state_.total_bytes) offset = 0;
    state_.downloaded_bytes = offset;
    state_.progress_percent = ProgressPercent(offset, state_.total_bytes);

    if (!transfer_.HasTargetSet() || target_stale_) {
        if (auto r = transfer_.SetTarget(*descriptor_); !r.is_ok()) {
            LogError("Cannot set download target: %s", r.msg.c_str());
            SetPhaseLocked(Phase::kReady);
            Notify([](IUpdateObserver& o) { o.OnStatus(Status::kTransferFailed); });
            return;
        }
        target_stale_ = false;
    }

    SetPhaseLocked(Phase::kDownloading);
    Notify([](IUpdateObserver& o) { o.OnStatus(Status::kDownloading); });
    const auto total = state_.total_bytes;
    Notify([offset, total](IUpdateObserver& o) { o.OnInitialProgress(offset, total); });

    LogInfo("Starting transfer of %s at offset %llu/%llu",
            destination_.c_str(),
            (unsigned long long)offset,
            (unsigned long long)total);
    if (auto r = transfer_.Start(destination_, network_, offset); !r.is_ok()) {
        LogError("Transfer failed to start: %s", r.msg.c_str());
        transfer_.Release();
        SetPhaseLocked(Phase::kReady);
        Notify([](IUpdateObserver& o) { o.OnStatus(Status::kTransferFailed); });
        return;
    }

    const std::uint64_t attempt = ++transfer_attempt_;
    const int percent = state_.progress_percent;
    monitor_task_ = pool_.Submit(
        "progress-monitor", [this, attempt, offset, total, percent](const CancelToken& token) {
            AttemptSink sink(*this, attempt);
            ProgressMonitor monitor(transfer_, sink, total, offset, percent, opt_.monitor);
            const auto outcome = monitor.Run(token);
            LogDebug("Progress monitor for attempt %llu: %s",
                     (unsigned long long)attempt,
                     MonitorOutcomeName(outcome));
            if (outcome == ProgressMonitor::Outcome::kTerminated && !token.IsCancelled()) {
                OnMonitorTerminated(attempt);
            }
        });
}

void DownloadStateMachine::StopTransferLocked() {
    monitor_task_.Cancel();
    monitor_task_ = TaskHandle();
    transfer_.Release();
}

void DownloadStateMachine::BeginVerificationLocked() {
    verify_task_.Cancel();
    SetPhaseLocked(Phase::kVerifying);
    Notify([](IUpdateObserver& o) { o.OnStatus(Status::kVerifying); });

    const std::uint64_t attempt = ++verify_attempt_;
    const std::string path = destination_;
    const std::string expected = descriptor_->checksum;
    const DigestAlgorithm algorithm = descriptor_->checksum_algorithm;
    const std::size_t chunk = opt_.verify_chunk_bytes;

    LogInfo("Verifying %s (%s)", path.c_str(), DigestName(algorithm));
    verify_task_ = pool_.Submit(
        "checksum-verify", [this, attempt, path, expected, algorithm, chunk](const CancelToken& token) {
            const ChecksumVerifier verifier(chunk);
            const VerifyResult result = verifier.Verify(path, expected, algorithm, token);
            OnVerificationDone(attempt, result);
        });
}

void DownloadStateMachine::ResetCountersLocked() {
    state_.downloaded_bytes = 0;
    state_.progress_percent = 0;
}

Result DownloadStateMachine::DeleteFileLocked() {
    std::error_code ec;
    if (fs::is_directory(destination_, ec)) {
        LogWarn("Not deleting %s: it is a directory", destination_.c_str());
        Notify([](IUpdateObserver& o) { o.OnStatus(Status::kDeleteFailed); });
        return Result::Fail(EISDIR, destination_ + " is a directory");
    }
    const bool removed = fs::remove(destination_, ec);
    if (ec) {
        LogError("Unable to delete %s: %s", destination_.c_str(), ec.message().c_str());
        Notify([](IUpdateObserver& o) { o.OnStatus(Status::kDeleteFailed); });
        return Result::Fail(ec.value(), ec.message());
    }
    if (removed) {
        LogInfo("Deleted %s", destination_.c_str());
    } else {
        LogDebug("%s does not exist", destination_.c_str());
    }
    return Result::Ok();
}

// ---- task callbacks ----

bool DownloadStateMachine::OnMonitorProgress(std::uint64_t attempt, const ProgressUpdate& update) {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    if (shut_down_ || attempt != transfer_attempt_ || state_.phase != Phase::kDownloading ||
        !monitor_task_.Valid() || monitor_task_.IsCancelled()) {
        return false;
    }

    state_.downloaded_bytes = update.bytes;
    Notify([&update](IUpdateObserver& o) { o.OnProgressBytes(update.text); });
    if (update.percent) {
        state_.progress_percent = *update.percent;
        Notify([&update](IUpdateObserver& o) { o.OnProgressPercent(*update.percent); });
    }
    return true;
}

void DownloadStateMachine::OnMonitorComplete(std::uint64_t attempt) {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    if (shut_down_ || attempt != transfer_attempt_ || state_.phase != Phase::kDownloading ||
        !monitor_task_.Valid() || monitor_task_.IsCancelled()) {
        return;
    }

    LogInfo("Download finished: %s", destination_.c_str());
    Notify([](IUpdateObserver& o) { o.OnTransferFinished(); });
    // The writer must be gone before the file is read back.
    monitor_task_ = TaskHandle();
    transfer_.Release();

    // A zero-length artifact is complete before the provider has written
    // anything, possibly before it created the file.
    if (state_.total_bytes == 0 && !OnDiskLength(destination_)) {
        FileWriter empty;
        if (auto r = FileWriter::OpenForResume(destination_, 0, empty); !r.is_ok()) {
            LogWarn("Cannot create empty download: %s", r.msg.c_str());
        }
    }
    BeginVerificationLocked();
}

// The provider gave up on its own. Loss, pause and cancel all clear
// monitor_task_ under mu_ first, so they never end up here.
void DownloadStateMachine::OnMonitorTerminated(std::uint64_t attempt) {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    if (shut_down_ || attempt != transfer_attempt_ || state_.phase != Phase::kDownloading ||
        !monitor_task_.Valid() || monitor_task_.IsCancelled()) {
        return;
    }

    LogError("Transfer of %s stopped at %llu/%llu bytes",
             destination_.c_str(),
             (unsigned long long)state_.downloaded_bytes,
             (unsigned long long)state_.total_bytes);
    monitor_task_ = TaskHandle();
    transfer_.Release();
    SetPhaseLocked(Phase::kReady);
    Notify([](IUpdateObserver& o) { o.OnStatus(Status::kTransferFailed); });
}

void DownloadStateMachine::OnVerificationDone(std::uint64_t attempt, const VerifyResult& result) {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    if (shut_down_ || attempt != verify_attempt_ || state_.phase != Phase::kVerifying) return;

    switch (result.outcome) {
        case VerifyOutcome::kPassed:
            LogInfo("Checksum verified: %s", result.actual.c_str());
            SetPhaseLocked(Phase::kVerifiedOk);
            Notify([](IUpdateObserver& o) { o.OnVerificationResult(true); });
            return;

        case VerifyOutcome::kMismatch:
            LogWarn("%s", result.message.c_str());
            if (auto r = DeleteFileLocked(); !r.is_ok()) {
                LogWarn("Corrupt download left on disk: %s", r.msg.c_str());
            }
            SetPhaseLocked(Phase::kVerifiedFailed);
            Notify([](IUpdateObserver& o) { o.OnVerificationResult(false); });
            break;

        case VerifyOutcome::kFileMissing:
            LogWarn("Verification failed: %s", result.message.c_str());
            Notify([](IUpdateObserver& o) { o.OnStatus(Status::kFileMissing); });
            break;

        case VerifyOutcome::kIoError:
        case VerifyOutcome::kAlgorithmUnavailable:
            LogError("Verification could not complete (%s): %s",
                     VerifyOutcomeName(result.outcome),
                     result.message.c_str());
            Notify([](IUpdateObserver& o) { o.OnStatus(Status::kVerificationError); });
            break;

        case VerifyOutcome::kCancelled:
            return;
    }

    ResetCountersLocked();
    SetPhaseLocked(Phase::kIdle);
}

} // namespace otafetch
