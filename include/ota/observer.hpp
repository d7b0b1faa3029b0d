#pragma once

#include "ota/update_descriptor.hpp"

#include <cstdint>
#include <string>

namespace otafetch {

struct PhaseFlags {
    bool paused = false;
    bool finished = false;
};

// Short user-facing status updates.
enum class Status {
    kDownloading,
    kVerifying,
    kCancelled,
    kFileMissing,
    kDeleteFailed,
    kVerificationError,
    kTransferFailed,
};

const char* StatusText(Status status);

// Presentation-side listener. Callbacks arrive on worker threads, one at a
// time and in order; they may issue commands and read Snapshot().
class IUpdateObserver {
public:
    virtual ~IUpdateObserver() = default;

    virtual void RestoreState(const UpdateDescriptor& /*descriptor*/,
                              PhaseFlags /*flags*/,
                              std::uint64_t /*downloaded_bytes*/,
                              std::uint64_t /*total_bytes*/) {}
    virtual void OnDescriptorFetched(const UpdateDescriptor& /*descriptor*/) {}
    virtual void OnFetchFailed() {}
    virtual void OnNoUpdate() {}
    virtual void OnNoConnectivity() {}
    virtual void OnInitialProgress(std::uint64_t /*downloaded*/, std::uint64_t /*total*/) {}
    virtual void OnProgressBytes(const std::string& /*text*/) {}
    virtual void OnProgressPercent(int /*percent*/) {}
    virtual void OnTransferFinished() {}
    virtual void OnVerificationResult(bool /*passed*/) {}
    virtual void OnStatus(Status /*status*/) {}
};

} // namespace otafetch
