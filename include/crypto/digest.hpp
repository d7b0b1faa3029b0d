#pragma once

#include "io/io.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace otafetch {

enum class DigestAlgorithm {
    kMd5,
    kSha256,
};

// OpenSSL digest name ("md5", "sha256").
const char* DigestName(DigestAlgorithm alg);
std::size_t DigestHexLength(DigestAlgorithm alg);
std::optional<DigestAlgorithm> DigestAlgorithmFromName(std::string_view name);

std::string HexEncode(std::span<const std::uint8_t> bytes);

// Incremental digest over an OpenSSL EVP context.
class Digest {
public:
    static std::expected<Digest, std::string> Create(DigestAlgorithm alg);
    // Looks the digest up by its OpenSSL name; fails when the provider lacks it.
    static std::expected<Digest, std::string> Create(std::string_view evp_name);

    Digest(const Digest&) = delete;
    Digest& operator=(const Digest&) = delete;
    Digest(Digest&&) noexcept;
    Digest& operator=(Digest&&) noexcept;
    ~Digest();

    bool Update(std::span<const std::uint8_t> data);
    // Lower-case hex; empty on failure or when already finalized.
    std::string FinalHex();

private:
    struct Impl;
    explicit Digest(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

std::string DigestHex(DigestAlgorithm alg, std::span<const std::uint8_t> data);
std::string DigestHex(DigestAlgorithm alg, IReader& reader);

} // namespace otafetch
