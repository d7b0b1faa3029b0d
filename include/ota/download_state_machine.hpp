#pragma once

#include "ota/checksum_verifier.hpp"
#include "ota/connectivity_watcher.hpp"
#include "ota/observer.hpp"
#include "ota/progress_monitor.hpp"
#include "ota/providers.hpp"
#include "ota/transfer_state.hpp"
#include "util/result.hpp"
#include "util/worker_pool.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace otafetch {

// Owns the lifecycle of one update artifact: check, download, pause/resume,
// cancel, verify. Commands return immediately and run in issue order on a
// strand of the internal worker pool.
//
// The on-disk length of the destination file is the resume checkpoint; no
// other state is persisted.
class DownloadStateMachine final : private ConnectivityWatcher::IListener {
public:
    // One worker each for the command strand, the progress monitor, the
    // grace-window wait and checksum verification.
    static constexpr std::size_t kMinWorkerThreads = 4;

    struct Options {
        // Raised to kMinWorkerThreads when smaller.
        std::size_t worker_threads = WorkerPool::kDefaultThreads;
        ProgressMonitor::Options monitor;
        ConnectivityWatcher::Options connectivity;
        std::size_t verify_chunk_bytes = ChecksumVerifier::kDefaultChunkBytes;
    };

    DownloadStateMachine(IMetadataProvider& metadata,
                         ITransferProvider& transfer,
                         IConnectivitySource& connectivity,
                         ISettingsStore& settings,
                         Options opt);
    DownloadStateMachine(const DownloadStateMachine&) = delete;
    DownloadStateMachine& operator=(const DownloadStateMachine&) = delete;
    ~DownloadStateMachine();

    // Held weakly; notifications are dropped while none is attached.
    void AttachObserver(std::weak_ptr<IUpdateObserver> observer);
    void DetachObserver();

    void CheckForUpdate();
    void StartDownload();
    void Pause(bool pause);
    void Cancel();
    void DeleteDownload();

    // Cancels all tasks, releases the transfer and joins the pool.
    void Shutdown();

    TransferState Snapshot() const;
    std::optional<UpdateDescriptor> Descriptor() const;
    std::string DestinationPath() const;

    // Waits until no command is queued or running.
    bool WaitForCommands(std::chrono::milliseconds timeout) const;

private:
    class AttemptSink;

    void OnNetworkAvailable(const Network& network) override;
    void OnNetworkLost(const Network& network) override;
    void OnConnectivityTimeout() override;

    void DoCheckForUpdate();
    void DoStartDownload();
    void DoPause(bool pause);
    void DoCancel();
    void DoDelete();
    void DoNetworkAvailable(const Network& network);

    // The *Locked helpers expect mu_ to be held.
    void SetPhaseLocked(Phase phase);
    void RestoreStateLocked();
    Result ResolveDestinationLocked();
    bool VerifyIfCompleteLocked();
    void StartTransferLocked();
    void StopTransferLocked();
    void BeginVerificationLocked();
    void ResetCountersLocked();
    Result DeleteFileLocked();

    bool OnMonitorProgress(std::uint64_t attempt, const ProgressUpdate& update);
    void OnMonitorComplete(std::uint64_t attempt);
    void OnMonitorTerminated(std::uint64_t attempt);
    void OnVerificationDone(std::uint64_t attempt, const VerifyResult& result);

    template <typename Fn>
    void Notify(Fn&& fn);

    IMetadataProvider& metadata_;
    ITransferProvider& transfer_;
    ISettingsStore& settings_;
    Options opt_;

    WorkerPool pool_;
    Strand strand_;
    ConnectivityWatcher watcher_;

    // Recursive: observer callbacks run with mu_ held and may call Snapshot().
    mutable std::recursive_mutex mu_;
    TransferState state_;
    std::optional<UpdateDescriptor> descriptor_;
    std::string destination_;
    std::optional<Network> network_;
    bool target_stale_ = true;
    std::uint64_t transfer_attempt_ = 0;
    std::uint64_t verify_attempt_ = 0;
    TaskHandle monitor_task_;
    TaskHandle verify_task_;
    bool shut_down_ = false;

    mutable std::mutex observer_mu_;
    std::weak_ptr<IUpdateObserver> observer_;
};

} // namespace otafetch
