#include "ota/connectivity_sources.hpp"

#include "util/logger.hpp"

#include <fstream>
#include <net/if.h>
#include <net/route.h>
#include <sstream>

namespace otafetch {

ManualConnectivitySource::ManualConnectivitySource(Network initial) : current_(std::move(initial)) {}

void ManualConnectivitySource::Subscribe(Callback callback) {
    std::lock_guard<std::mutex> cb(cb_mu_);
    callback_ = std::move(callback);

    std::optional<Network> current;
    {
        std::lock_guard<std::mutex> lk(state_mu_);
        current = current_;
    }
    if (current && callback_) {
        callback_(NetworkEvent{.kind = NetworkEventKind::kAvailable, .network = *current});
    }
}

void ManualConnectivitySource::Unsubscribe() {
    std::lock_guard<std::mutex> cb(cb_mu_);
    callback_ = nullptr;
}

void ManualConnectivitySource::SetAvailable(const Network& network) {
    {
        std::lock_guard<std::mutex> lk(state_mu_);
        current_ = network;
    }
    Deliver(NetworkEvent{.kind = NetworkEventKind::kAvailable, .network = network});
}

void ManualConnectivitySource::SetLost() {
    Network lost;
    {
        std::lock_guard<std::mutex> lk(state_mu_);
        if (!current_) return;
        lost = *current_;
        current_.reset();
    }
    Deliver(NetworkEvent{.kind = NetworkEventKind::kLost, .network = lost});
}

std::optional<Network> ManualConnectivitySource::Current() const {
    std::lock_guard<std::mutex> lk(state_mu_);
    return current_;
}

void ManualConnectivitySource::Deliver(const NetworkEvent& event) {
    std::lock_guard<std::mutex> cb(cb_mu_);
    if (callback_) callback_(event);
}

RouteTableConnectivitySource::RouteTableConnectivitySource(Options opt) : opt_(std::move(opt)) {}

RouteTableConnectivitySource::~RouteTableConnectivitySource() { Unsubscribe(); }

void RouteTableConnectivitySource::Subscribe(Callback callback) {
    Unsubscribe();
    {
        std::lock_guard<std::mutex> lk(mu_);
        callback_ = std::move(callback);
        stop_ = false;
    }
    poller_ = std::thread(&RouteTableConnectivitySource::PollLoop, this);
}

void RouteTableConnectivitySource::Unsubscribe() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = true;
    }
    cv_.notify_all();
    if (poller_.joinable()) poller_.join();
    std::lock_guard<std::mutex> lk(mu_);
    callback_ = nullptr;
}

std::optional<std::string> RouteTableConnectivitySource::ParseDefaultRouteInterface(std::istream& in) {
    std::string line;
    // Header: Iface Destination Gateway Flags RefCnt Use Metric Mask ...
    if (!std::getline(in, line)) return std::nullopt;

    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string iface;
        std::string destination;
        std::string gateway;
        std::string flags_hex;
        if (!(fields >> iface >> destination >> gateway >> flags_hex)) continue;
        if (destination != "00000000") continue;

        unsigned long flags = 0;
        try {
            flags = std::stoul(flags_hex, nullptr, 16);
        } catch (const std::exception&) {
            continue;
        }
        if (flags & RTF_UP) return iface;
    }
    return std::nullopt;
}

std::optional<Network> RouteTableConnectivitySource::ReadDefaultNetwork() const {
    std::ifstream in(opt_.route_table);
    if (!in.is_open()) {
        LogDebug("Connectivity: cannot read %s", opt_.route_table.c_str());
        return std::nullopt;
    }
    auto iface = ParseDefaultRouteInterface(in);
    if (!iface) return std::nullopt;
    return Network{.name = *iface, .handle = ::if_nametoindex(iface->c_str())};
}

void RouteTableConnectivitySource::PollLoop() {
    SetThreadTag("route-poll");
    std::optional<Network> last;
    bool first = true;

    std::unique_lock<std::mutex> lk(mu_);
    while (!stop_) {
        lk.unlock();
        const auto now = ReadDefaultNetwork();
        lk.lock();
        if (stop_) break;

        if (first || now != last) {
            // A switch between interfaces is a loss followed by a new network.
            if (last && (!now || *now != *last) && callback_) {
                callback_(NetworkEvent{.kind = NetworkEventKind::kLost, .network = *last});
            }
            if (now && (!last || *now != *last) && callback_) {
                callback_(NetworkEvent{.kind = NetworkEventKind::kAvailable, .network = *now});
            }
            last = now;
            first = false;
        }
        cv_.wait_for(lk, opt_.poll_interval, [this] { return stop_; });
    }
}

} // namespace otafetch
