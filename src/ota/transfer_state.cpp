#include "ota/observer.hpp"
#include "ota/transfer_state.hpp"

namespace otafetch {

const char* PhaseName(Phase phase) {
    switch (phase) {
        case Phase::kIdle:           return "idle";
        case Phase::kFetching:       return "fetching";
        case Phase::kNoUpdate:       return "no-update";
        case Phase::kReady:          return "ready";
        case Phase::kDownloading:    return "downloading";
        case Phase::kPaused:         return "paused";
        case Phase::kVerifying:      return "verifying";
        case Phase::kVerifiedOk:     return "verified-ok";
        case Phase::kVerifiedFailed: return "verified-failed";
        case Phase::kCancelled:      return "cancelled";
    }
    return "unknown";
}

const char* StatusText(Status status) {
    switch (status) {
        case Status::kDownloading:       return "Downloading";
        case Status::kVerifying:         return "Checking checksum";
        case Status::kCancelled:         return "Download cancelled";
        case Status::kFileMissing:       return "Downloaded file not found";
        case Status::kDeleteFailed:      return "Unable to delete download";
        case Status::kVerificationError: return "Checksum could not be verified";
        case Status::kTransferFailed:    return "Download failed";
    }
    return "Unknown";
}

} // namespace otafetch
