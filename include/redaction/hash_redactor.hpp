#pragma once

#include "redaction/iredactor.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dataprivacy {

/**
 * @brief Redactor replacing the value with a keyed, one-way 64-bit digest
 *
 * Output is always 16 lowercase hex chars. Identical input and secret give
 * identical output, so redacted records can still be correlated.
 *
 * Algorithms:
 * - XXH3:        xxHash XXH3_64bits_withSecret (fast, non-cryptographic).
 *                Secret 136-256 bytes; a fixed 192-byte default is used
 *                when none is given.
 * - HMAC_SHA256: OpenSSL HMAC-SHA256 truncated to 8 bytes. Key 16-256 bytes.
 */
class HashRedactor final : public IRedactor {
public:
    enum class Algorithm {
        XXH3,
        HMAC_SHA256
    };

    static constexpr size_t kRedactedLength = 16;
    static constexpr size_t kDefaultSecretSize = 192;
    static constexpr size_t kMinXxh3SecretSize = 136;
    static constexpr size_t kMinHmacKeySize = 16;
    static constexpr size_t kMaxSecretSize = 256;

    // XXH3 with the default secret
    HashRedactor();

    /**
     * @throws std::invalid_argument if the secret size is out of range for
     *         the algorithm
     */
    explicit HashRedactor(std::vector<uint8_t> secret, Algorithm algorithm = Algorithm::XXH3);

    ~HashRedactor() override;

    HashRedactor(const HashRedactor&) = delete;
    HashRedactor& operator=(const HashRedactor&) = delete;

    void redact(const DataClass& data_class,
                std::string_view value,
                RedactionSink& sink) const override;

    [[nodiscard]] std::optional<size_t> exact_len() const override { return kRedactedLength; }
    [[nodiscard]] std::string kind() const override;

    [[nodiscard]] Algorithm algorithm() const noexcept { return algorithm_; }
    [[nodiscard]] size_t secret_size() const noexcept { return secret_.size(); }

    /**
     * @brief Digest of value as a 64-bit integer (what redact() hex-encodes)
     * @throws std::runtime_error if OpenSSL fails to compute the HMAC
     */
    [[nodiscard]] uint64_t digest(std::string_view value) const;

    [[nodiscard]] static const char* algorithm_name(Algorithm algorithm);
    [[nodiscard]] static std::optional<Algorithm> parse_algorithm(const std::string& name);

    // Empty string when the size is acceptable, otherwise the reason
    [[nodiscard]] static std::string validate_secret_size(size_t size, Algorithm algorithm);

private:
    std::vector<uint8_t> secret_;
    Algorithm algorithm_;
};

} // namespace dataprivacy
