#include "redaction/hash_redactor.hpp"
#include "core/utils.hpp"

#define XXH_INLINE_ALL
#include <xxhash.h>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <format>
#include <stdexcept>

namespace dataprivacy {

static_assert(HashRedactor::kMinXxh3SecretSize == XXH3_SECRET_SIZE_MIN);

// Default secret is xxHash's own kSecret
static_assert(sizeof(XXH3_kSecret) == HashRedactor::kDefaultSecretSize);

HashRedactor::HashRedactor()
    : secret_(XXH3_kSecret, XXH3_kSecret + sizeof(XXH3_kSecret)),
      algorithm_(Algorithm::XXH3) {}

HashRedactor::HashRedactor(std::vector<uint8_t> secret, Algorithm algorithm)
    : secret_(std::move(secret)), algorithm_(algorithm) {
    const auto problem = validate_secret_size(secret_.size(), algorithm_);
    if (!problem.empty()) {
        OPENSSL_cleanse(secret_.data(), secret_.size());
        throw std::invalid_argument(problem);
    }
}

HashRedactor::~HashRedactor() {
    if (!secret_.empty()) {
        OPENSSL_cleanse(secret_.data(), secret_.size());
    }
}

std::string HashRedactor::validate_secret_size(size_t size, Algorithm algorithm) {
    const size_t min_size = (algorithm == Algorithm::XXH3) ? kMinXxh3SecretSize : kMinHmacKeySize;
    if (size < min_size || size > kMaxSecretSize) {
        return std::format("{} secret must be {}-{} bytes, got {}",
                           algorithm_name(algorithm), min_size, kMaxSecretSize, size);
    }
    return {};
}

uint64_t HashRedactor::digest(std::string_view value) const {
    switch (algorithm_) {
        case Algorithm::XXH3:
            return XXH3_64bits_withSecret(value.data(), value.size(),
                                          secret_.data(), secret_.size());

        case Algorithm::HMAC_SHA256: {
            unsigned char mac[EVP_MAX_MD_SIZE];
            unsigned int mac_len = 0;
            if (!HMAC(EVP_sha256(),
                      secret_.data(), static_cast<int>(secret_.size()),
                      reinterpret_cast<const unsigned char*>(value.data()), value.size(),
                      mac, &mac_len) || mac_len < 8) {
                throw std::runtime_error("HMAC-SHA256 computation failed");
            }

            // First 8 bytes, big-endian
            uint64_t result = 0;
            for (int i = 0; i < 8; ++i) {
                result = (result << 8) | mac[i];
            }
            OPENSSL_cleanse(mac, sizeof(mac));
            return result;
        }
    }
    throw std::runtime_error("unknown hash algorithm");
}

void HashRedactor::redact(const DataClass& /*data_class*/,
                          std::string_view value,
                          RedactionSink& sink) const {
    const auto hex = utils::u64_to_hex(digest(value));
    sink.write(std::string_view(hex.data(), hex.size()));
}

std::string HashRedactor::kind() const {
    return algorithm_name(algorithm_);
}

const char* HashRedactor::algorithm_name(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::XXH3:        return "xxh3";
        case Algorithm::HMAC_SHA256: return "hmac_sha256";
    }
    return "unknown";
}

std::optional<HashRedactor::Algorithm> HashRedactor::parse_algorithm(const std::string& name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "xxh3") return Algorithm::XXH3;
    if (lower == "hmac_sha256" || lower == "hmac-sha256") return Algorithm::HMAC_SHA256;
    return std::nullopt;
}

} // namespace dataprivacy
