#pragma once

#include "ota/providers.hpp"
#include "util/worker_pool.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace otafetch {

struct ProgressUpdate {
    std::uint64_t bytes = 0;
    std::uint64_t total = 0;
    std::string text;
    // Set only when the floored percentage went up.
    std::optional<int> percent;
};

class IProgressSink {
public:
    virtual ~IProgressSink() = default;
    // Returning false stops the monitor (the attempt went stale).
    virtual bool OnProgress(const ProgressUpdate& update) = 0;
    virtual void OnTransferComplete() = 0;
};

// Watches one transfer attempt. Byte updates are forwarded only when the
// count grows, percent updates only when floor(bytes * 100 / total) grows.
class ProgressMonitor {
public:
    enum class Outcome {
        kCompleted,
        kTerminated,  // provider reported kTerminated or an impossible size
        kCancelled,
    };

    struct Options {
        // Sleep between polls for providers without change notification.
        std::chrono::milliseconds poll_interval{100};
    };

    ProgressMonitor(ITransferProvider& provider,
                    IProgressSink& sink,
                    std::uint64_t total_bytes,
                    std::uint64_t initial_bytes,
                    int initial_percent,
                    Options opt);

    Outcome Run(const CancelToken& token);

private:
    ITransferProvider& provider_;
    IProgressSink& sink_;
    std::uint64_t total_;
    std::uint64_t last_bytes_;
    int last_percent_;
    Options opt_;
};

const char* MonitorOutcomeName(ProgressMonitor::Outcome outcome);

} // namespace otafetch
