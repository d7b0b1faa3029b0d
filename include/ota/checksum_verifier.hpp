#pragma once

#include "crypto/digest.hpp"
#include "util/worker_pool.hpp"

#include <cstddef>
#include <string>

namespace otafetch {

enum class VerifyOutcome {
    kPassed,
    kMismatch,
    kFileMissing,
    kIoError,
    kAlgorithmUnavailable,
    kCancelled,
};

struct VerifyResult {
    VerifyOutcome outcome = VerifyOutcome::kIoError;
    std::string actual;   // computed digest, set for kPassed and kMismatch
    std::string message;

    bool passed() const { return outcome == VerifyOutcome::kPassed; }
};

const char* VerifyOutcomeName(VerifyOutcome outcome);

class ChecksumVerifier {
public:
    static constexpr std::size_t kDefaultChunkBytes = 1024 * 1024;

    explicit ChecksumVerifier(std::size_t chunk_bytes = kDefaultChunkBytes);

    // Streams `path` through the digest. Never throws.
    VerifyResult Verify(const std::string& path,
                        const std::string& expected_hex,
                        DigestAlgorithm algorithm,
                        const CancelToken& token = CancelToken()) const;

private:
    std::size_t chunk_bytes_;
};

} // namespace otafetch
