#include "ota/checksum_verifier.hpp"

#include "io/file_reader.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <vector>

namespace otafetch {

namespace {

std::string NormalizeHex(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

VerifyResult Fail(VerifyOutcome outcome, std::string message) {
    VerifyResult r;
    r.outcome = outcome;
    r.message = std::move(message);
    return r;
}

} // namespace

const char* VerifyOutcomeName(VerifyOutcome outcome) {
    switch (outcome) {
        case VerifyOutcome::kPassed:               return "passed";
        case VerifyOutcome::kMismatch:             return "mismatch";
        case VerifyOutcome::kFileMissing:          return "file-missing";
        case VerifyOutcome::kIoError:              return "io-error";
        case VerifyOutcome::kAlgorithmUnavailable: return "algorithm-unavailable";
        case VerifyOutcome::kCancelled:            return "cancelled";
    }
    return "unknown";
}

ChecksumVerifier::ChecksumVerifier(std::size_t chunk_bytes)
    : chunk_bytes_(chunk_bytes == 0 ? kDefaultChunkBytes : chunk_bytes) {}

VerifyResult ChecksumVerifier::Verify(const std::string& path,
                                      const std::string& expected_hex,
                                      DigestAlgorithm algorithm,
                                      const CancelToken& token) const {
    auto digest = Digest::Create(algorithm);
    if (!digest) {
        LogError("ChecksumVerifier: %s", digest.error().c_str());
        return Fail(VerifyOutcome::kAlgorithmUnavailable, digest.error());
    }

    FileReader reader;
    if (auto r = FileReader::Open(path, reader); !r.is_ok()) {
        if (r.err == ENOENT) {
            return Fail(VerifyOutcome::kFileMissing, r.msg);
        }
        return Fail(VerifyOutcome::kIoError, r.msg);
    }

    std::vector<std::uint8_t> buf(chunk_bytes_);
    while (true) {
        if (token.IsCancelled()) {
            return Fail(VerifyOutcome::kCancelled, "verification cancelled");
        }
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) {
            return Fail(VerifyOutcome::kIoError, "read failed: " + path);
        }
        if (!digest->Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)))) {
            return Fail(VerifyOutcome::kIoError, "digest update failed");
        }
    }

    VerifyResult result;
    result.actual = digest->FinalHex();
    if (result.actual.empty()) {
        return Fail(VerifyOutcome::kIoError, "digest finalization failed");
    }

    if (result.actual == NormalizeHex(expected_hex)) {
        result.outcome = VerifyOutcome::kPassed;
    } else {
        result.outcome = VerifyOutcome::kMismatch;
        result.message = "checksum mismatch: expected=" + expected_hex + " actual=" + result.actual;
    }
    return result;
}

} // namespace otafetch
