#include "ota/progress_monitor.hpp"

#include "util/logger.hpp"
#include "util/progress_text.hpp"

namespace otafetch {

ProgressMonitor::ProgressMonitor(ITransferProvider& provider,
                                 IProgressSink& sink,
                                 std::uint64_t total_bytes,
                                 std::uint64_t initial_bytes,
                                 int initial_percent,
                                 Options opt)
    : provider_(provider),
      sink_(sink),
      total_(total_bytes),
      last_bytes_(initial_bytes),
      last_percent_(initial_percent),
      opt_(opt) {}

ProgressMonitor::Outcome ProgressMonitor::Run(const CancelToken& token) {
    while (true) {
        if (token.IsCancelled()) return Outcome::kCancelled;

        const std::int64_t size = provider_.QueryProgressBytes();
        if (size < 0) {
            LogDebug("ProgressMonitor: transfer ended without success at %llu bytes",
                     (unsigned long long)last_bytes_);
            return Outcome::kTerminated;
        }

        const auto bytes = static_cast<std::uint64_t>(size);
        if (bytes > total_) {
            LogWarn("ProgressMonitor: provider reported %llu bytes, expected at most %llu",
                    (unsigned long long)bytes,
                    (unsigned long long)total_);
            return Outcome::kTerminated;
        }

        const bool grew = bytes > last_bytes_;
        if (grew) last_bytes_ = bytes;

        ProgressUpdate update;
        update.bytes = bytes;
        update.total = total_;
        // An empty artifact is 100% as soon as the provider reports it.
        const int pct = bytes == total_ ? 100 : ProgressPercent(bytes, total_);
        if (pct > last_percent_) {
            last_percent_ = pct;
            update.percent = pct;
        }

        if (grew || update.percent) {
            update.text = FormatProgressText(bytes, total_);
            if (token.IsCancelled() || !sink_.OnProgress(update)) return Outcome::kCancelled;
        }

        // Checked on every poll: a resumed or empty transfer may already sit at total.
        if (bytes == total_) {
            if (token.IsCancelled()) return Outcome::kCancelled;
            sink_.OnTransferComplete();
            return Outcome::kCompleted;
        }

        if (!provider_.WaitForChange(size, opt_.poll_interval)) {
            if (!token.WaitFor(opt_.poll_interval)) return Outcome::kCancelled;
        }
    }
}

const char* MonitorOutcomeName(ProgressMonitor::Outcome outcome) {
    switch (outcome) {
        case ProgressMonitor::Outcome::kCompleted:  return "completed";
        case ProgressMonitor::Outcome::kTerminated: return "terminated";
        case ProgressMonitor::Outcome::kCancelled:  return "cancelled";
    }
    return "unknown";
}

} // namespace otafetch
