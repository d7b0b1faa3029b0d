#pragma once

#include "ota/providers.hpp"
#include "util/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <mutex>

namespace otafetch {

// Tracks default-network availability and runs the grace window after a loss.
// It owns only the online flag; everything else is a call into the listener.
class ConnectivityWatcher {
public:
    class IListener {
    public:
        virtual ~IListener() = default;
        virtual void OnNetworkAvailable(const Network& network) = 0;
        virtual void OnNetworkLost(const Network& network) = 0;
        // Connectivity stayed down for the whole grace window.
        virtual void OnConnectivityTimeout() = 0;
    };

    struct Options {
        std::chrono::milliseconds poll_interval{500};
        std::chrono::milliseconds grace_window{5000};
    };

    ConnectivityWatcher(IConnectivitySource& source,
                        WorkerPool& pool,
                        IListener& listener,
                        Options opt);
    ConnectivityWatcher(const ConnectivityWatcher&) = delete;
    ConnectivityWatcher& operator=(const ConnectivityWatcher&) = delete;
    ~ConnectivityWatcher();

    void Start();
    void Stop();

    bool IsOnline() const { return online_.load(); }

    // Starts (or restarts) the bounded wait for connectivity to return.
    void ArmGraceWindow();
    void CancelGraceWindow();

private:
    void HandleEvent(const NetworkEvent& event);
    void GraceWait(const CancelToken& token);

    IConnectivitySource& source_;
    WorkerPool& pool_;
    IListener& listener_;
    Options opt_;

    std::atomic<bool> online_{false};
    std::mutex mu_;
    TaskHandle grace_task_;
    bool subscribed_ = false;
};

} // namespace otafetch
