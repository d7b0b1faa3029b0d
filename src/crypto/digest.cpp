#include "crypto/digest.hpp"

#include <openssl/evp.h>

#include <array>
#include <vector>

namespace otafetch {

namespace {

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

} // namespace

const char* DigestName(DigestAlgorithm alg) {
    switch (alg) {
        case DigestAlgorithm::kMd5:    return "md5";
        case DigestAlgorithm::kSha256: return "sha256";
    }
    return "unknown";
}

std::size_t DigestHexLength(DigestAlgorithm alg) {
    switch (alg) {
        case DigestAlgorithm::kMd5:    return 32;
        case DigestAlgorithm::kSha256: return 64;
    }
    return 0;
}

std::optional<DigestAlgorithm> DigestAlgorithmFromName(std::string_view name) {
    if (name == "md5") return DigestAlgorithm::kMd5;
    if (name == "sha256" || name == "sha-256") return DigestAlgorithm::kSha256;
    return std::nullopt;
}

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

struct Digest::Impl {
    EvpCtx ctx;
    bool finalized = false;
};

Digest::Digest(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
Digest::Digest(Digest&&) noexcept = default;
Digest& Digest::operator=(Digest&&) noexcept = default;
Digest::~Digest() = default;

std::expected<Digest, std::string> Digest::Create(DigestAlgorithm alg) {
    return Create(std::string_view(DigestName(alg)));
}

std::expected<Digest, std::string> Digest::Create(std::string_view evp_name) {
    const std::string name(evp_name);
    const EVP_MD* md = EVP_get_digestbyname(name.c_str());
    if (md == nullptr) {
        return std::unexpected("digest algorithm not available: " + name);
    }
    auto impl = std::make_unique<Impl>();
    if (!impl->ctx.ok()) {
        return std::unexpected(std::string("EVP_MD_CTX_new failed"));
    }
    // Init also fails when the active provider refuses the digest (FIPS and md5).
    if (EVP_DigestInit_ex(impl->ctx.get(), md, nullptr) != 1) {
        return std::unexpected("digest algorithm not available: " + name);
    }
    return Digest(std::move(impl));
}

bool Digest::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || impl_->finalized) return false;
    if (data.empty()) return true;
    if (EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size()) != 1) {
        impl_->finalized = true;
        return false;
    }
    return true;
}

std::string Digest::FinalHex() {
    if (!impl_ || impl_->finalized) return {};
    impl_->finalized = true;
    std::array<std::uint8_t, EVP_MAX_MD_SIZE> md{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), md.data(), &len) != 1) return {};
    return HexEncode(std::span<const std::uint8_t>(md.data(), len));
}

std::string DigestHex(DigestAlgorithm alg, std::span<const std::uint8_t> data) {
    auto digest = Digest::Create(alg);
    if (!digest) return {};
    if (!digest->Update(data)) return {};
    return digest->FinalHex();
}

std::string DigestHex(DigestAlgorithm alg, IReader& reader) {
    auto digest = Digest::Create(alg);
    if (!digest) return {};

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return {};
        if (!digest->Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)))) {
            return {};
        }
    }
    return digest->FinalHex();
}

} // namespace otafetch
