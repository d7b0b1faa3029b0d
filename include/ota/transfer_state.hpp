#pragma once

#include <cstdint>

namespace otafetch {

enum class Phase {
    kIdle,
    kFetching,
    kNoUpdate,
    kReady,
    kDownloading,
    kPaused,
    kVerifying,
    kVerifiedOk,
    kVerifiedFailed,
    kCancelled,
};

const char* PhaseName(Phase phase);

struct TransferState {
    Phase phase = Phase::kIdle;
    std::uint64_t downloaded_bytes = 0;
    std::uint64_t total_bytes = 0;
    int progress_percent = 0;
    bool is_online = false;
};

} // namespace otafetch
