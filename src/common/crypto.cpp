//
// Created by cv2 on 22.12.2025.
//

#include "crypto.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/err.h>
#include <chrono>
#include <format>
#include <print>

namespace gridlite::crypto {

// --- Internal Helpers ---

static const EVP_MD* select_md(DigestAlgorithm alg) {
    switch (alg) {
        case DigestAlgorithm::MD5:    return EVP_md5();
        case DigestAlgorithm::SHA256: return EVP_sha256();
    }
    return nullptr;
}

std::string_view algorithm_name(DigestAlgorithm alg) {
    switch (alg) {
        case DigestAlgorithm::MD5:    return "md5";
        case DigestAlgorithm::SHA256: return "sha256";
    }
    return "unknown";
}

std::optional<DigestAlgorithm> parse_algorithm(std::string_view name) {
    if (name == "md5") return DigestAlgorithm::MD5;
    if (name == "sha256") return DigestAlgorithm::SHA256;
    return std::nullopt;
}

std::string to_hex(std::span<const uint8_t> data) {
    std::string s;
    s.reserve(data.size() * 2);
    for (auto b : data) s += std::format("{:02x}", b);
    return s;
}

// --- DigestAccumulator ---

DigestAccumulator::DigestAccumulator(DigestAlgorithm alg)
    : alg_(alg), ctx_(EVP_MD_CTX_new(), EVP_MD_CTX_free) {
    if (ctx_ && EVP_DigestInit_ex(ctx_.get(), select_md(alg_), nullptr) == 1) {
        ready_ = true;
    } else {
        std::println(stderr, "[Crypto] Digest init failed: {}", ERR_error_string(ERR_get_error(), nullptr));
    }
}

std::expected<void, Error> DigestAccumulator::update(std::span<const uint8_t> data) {
    if (finalized_) return std::unexpected(Error::AlreadyFinalized);
    if (!ready_) return std::unexpected(Error::DigestFailed);
    if (data.empty()) return {};

    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1)
        return std::unexpected(Error::DigestFailed);
    return {};
}

std::expected<std::string, Error> DigestAccumulator::finalize() {
    if (finalized_) return std::unexpected(Error::AlreadyFinalized);
    if (!ready_) return std::unexpected(Error::DigestFailed);

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    finalized_ = true;
    if (EVP_DigestFinal_ex(ctx_.get(), md, &md_len) != 1)
        return std::unexpected(Error::DigestFailed);

    return to_hex(std::span<const uint8_t>(md, md_len));
}

std::expected<std::string, Error> digest_hex(std::span<const uint8_t> data, DigestAlgorithm alg) {
    DigestAccumulator acc(alg);
    auto res = acc.update(data);
    if (!res) return std::unexpected(res.error());
    return acc.finalize();
}

// --- Randomness ---

std::expected<Bytes, Error> random_bytes(size_t count) {
    Bytes out(count);
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1)
        return std::unexpected(Error::RandomFailed);
    return out;
}

std::expected<std::string, Error> generate_object_id() {
    auto rnd = random_bytes(8);
    if (!rnd) return std::unexpected(rnd.error());

    auto now = std::chrono::system_clock::now();
    auto secs = static_cast<uint32_t>(
        std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count());

    Bytes raw;
    raw.reserve(12);
    for (int i = 3; i >= 0; i--) raw.push_back(static_cast<uint8_t>((secs >> (i * 8)) & 0xFF));
    raw.insert(raw.end(), rnd->begin(), rnd->end());

    return to_hex(raw);
}

} // namespace gridlite::crypto
