//
// Created by cv2 on 22.12.2025.
//

#pragma once
#include <vector>
#include <string>
#include <string_view>
#include <span>
#include <memory>
#include <expected>
#include <optional>
#include <cstdint>
#include <openssl/evp.h>

namespace gridlite::crypto {

    using Bytes = std::vector<uint8_t>;

    enum class Error {
        DigestFailed,
        AlreadyFinalized,
        RandomFailed
    };

    enum class DigestAlgorithm {
        MD5,
        SHA256
    };

    // "md5" / "sha256"
    std::string_view algorithm_name(DigestAlgorithm alg);
    std::optional<DigestAlgorithm> parse_algorithm(std::string_view name);

    // Streaming content hash over consecutive chunk payloads.
    // update() may be called any number of times; finalize() exactly once.
    class DigestAccumulator {
    public:
        explicit DigestAccumulator(DigestAlgorithm alg = DigestAlgorithm::MD5);

        std::expected<void, Error> update(std::span<const uint8_t> data);

        // Returns the lowercase hex digest. Further update/finalize calls fail.
        std::expected<std::string, Error> finalize();

        bool finalized() const { return finalized_; }
        DigestAlgorithm algorithm() const { return alg_; }

    private:
        using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

        DigestAlgorithm alg_;
        EvpMdCtxPtr ctx_;
        bool ready_ = false;
        bool finalized_ = false;
    };

    // One-shot helper, same algorithm as the accumulator
    std::expected<std::string, Error> digest_hex(std::span<const uint8_t> data,
                                                 DigestAlgorithm alg = DigestAlgorithm::MD5);

    std::expected<Bytes, Error> random_bytes(size_t count);

    // 12-byte ObjectId-style id as 24 hex chars: [unix time (4b, BE)] + [random (8b)]
    std::expected<std::string, Error> generate_object_id();

    std::string to_hex(std::span<const uint8_t> data);

} // namespace gridlite::crypto
