#include "ota/connectivity_watcher.hpp"

#include "util/logger.hpp"

namespace otafetch {

ConnectivityWatcher::ConnectivityWatcher(IConnectivitySource& source,
                                         WorkerPool& pool,
                                         IListener& listener,
                                         Options opt)
    : source_(source), pool_(pool), listener_(listener), opt_(opt) {}

ConnectivityWatcher::~ConnectivityWatcher() { Stop(); }

void ConnectivityWatcher::Start() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (subscribed_) return;
        subscribed_ = true;
    }
    source_.Subscribe([this](const NetworkEvent& event) { HandleEvent(event); });
}

void ConnectivityWatcher::Stop() {
    bool unsubscribe = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        unsubscribe = subscribed_;
        subscribed_ = false;
        grace_task_.Cancel();
    }
    if (unsubscribe) source_.Unsubscribe();
}

void ConnectivityWatcher::ArmGraceWindow() {
    std::lock_guard<std::mutex> lk(mu_);
    grace_task_.Cancel();
    grace_task_ = pool_.Submit("connectivity-grace", [this](const CancelToken& token) { GraceWait(token); });
}

void ConnectivityWatcher::CancelGraceWindow() {
    std::lock_guard<std::mutex> lk(mu_);
    grace_task_.Cancel();
}

void ConnectivityWatcher::HandleEvent(const NetworkEvent& event) {
    switch (event.kind) {
        case NetworkEventKind::kAvailable:
            LogInfo("Connectivity: network available (%s)", event.network.name.c_str());
            online_.store(true);
            listener_.OnNetworkAvailable(event.network);
            break;
        case NetworkEventKind::kLost:
            LogInfo("Connectivity: network lost (%s)", event.network.name.c_str());
            online_.store(false);
            listener_.OnNetworkLost(event.network);
            break;
    }
}

void ConnectivityWatcher::GraceWait(const CancelToken& token) {
    const auto start = std::chrono::steady_clock::now();
    while (!online_.load()) {
        if (!token.WaitFor(opt_.poll_interval)) return;
        if (online_.load()) break;
        if (std::chrono::steady_clock::now() - start >= opt_.grace_window) {
            if (token.IsCancelled()) return;
            LogWarn("Connectivity: no network for %lld ms",
                    (long long)opt_.grace_window.count());
            listener_.OnConnectivityTimeout();
            return;
        }
    }
    LogDebug("Connectivity: network restored within the grace window");
}

} // namespace otafetch
