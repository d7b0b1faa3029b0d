#pragma once

#include "ota/providers.hpp"

#include <chrono>
#include <condition_variable>
#include <istream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace otafetch {

// Connectivity driven by the caller: the CLI (always online) and tests.
class ManualConnectivitySource final : public IConnectivitySource {
public:
    ManualConnectivitySource() = default;
    explicit ManualConnectivitySource(Network initial);

    // Replays kAvailable to a new subscriber when a network is up.
    void Subscribe(Callback callback) override;
    void Unsubscribe() override;

    void SetAvailable(const Network& network);
    void SetLost();

    std::optional<Network> Current() const;

private:
    void Deliver(const NetworkEvent& event);

    mutable std::mutex state_mu_;
    std::optional<Network> current_;

    // Held while a callback runs so Unsubscribe() can wait it out.
    std::mutex cb_mu_;
    Callback callback_;
};

// Follows the kernel's default IPv4 route. The interface carrying the
// default route is the network; losing the route is a loss event.
class RouteTableConnectivitySource final : public IConnectivitySource {
public:
    struct Options {
        std::string route_table = "/proc/net/route";
        std::chrono::milliseconds poll_interval{1000};
    };

    RouteTableConnectivitySource() : RouteTableConnectivitySource(Options{}) {}
    explicit RouteTableConnectivitySource(Options opt);
    RouteTableConnectivitySource(const RouteTableConnectivitySource&) = delete;
    RouteTableConnectivitySource& operator=(const RouteTableConnectivitySource&) = delete;
    ~RouteTableConnectivitySource() override;

    void Subscribe(Callback callback) override;
    void Unsubscribe() override;

    // Interface name of the first up default route in /proc/net/route format.
    static std::optional<std::string> ParseDefaultRouteInterface(std::istream& in);

private:
    void PollLoop();
    std::optional<Network> ReadDefaultNetwork() const;

    Options opt_;

    std::mutex mu_;
    std::condition_variable cv_;
    bool stop_ = false;
    Callback callback_;
    std::thread poller_;
};

} // namespace otafetch
