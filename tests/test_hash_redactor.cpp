#include <catch2/catch_test_macros.hpp>
#include "redaction/hash_redactor.hpp"
#include "core/utils.hpp"

#define XXH_INLINE_ALL
#include <xxhash.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace dataprivacy;

namespace {

const DataClass kPersonal("example", "personal");

std::string run(const IRedactor& redactor, std::string_view value, const DataClass& dc = kPersonal) {
    std::string out;
    RedactionSink sink([&out](std::string_view s) { out += s; });
    redactor.redact(dc, value, sink);
    return out;
}

bool is_lower_hex(const std::string& s) {
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// Hex encoding
// ============================================================================

TEST_CASE("u64_to_hex is fixed width lowercase", "[hash_redactor]") {
    const auto zero = utils::u64_to_hex(0);
    CHECK(std::string(zero.data(), zero.size()) == "0000000000000000");

    const auto value = utils::u64_to_hex(0xDEADBEEF01234567ULL);
    CHECK(std::string(value.data(), value.size()) == "deadbeef01234567");
}

TEST_CASE("hex_to_bytes decodes and rejects malformed input", "[hash_redactor]") {
    CHECK(utils::hex_to_bytes("00ff10") == std::vector<uint8_t>{0x00, 0xff, 0x10});
    CHECK(utils::hex_to_bytes("ABcd") == std::vector<uint8_t>{0xab, 0xcd});
    CHECK(utils::hex_to_bytes("abc").empty());
    CHECK(utils::hex_to_bytes("zz").empty());
    CHECK(utils::hex_to_bytes("").empty());
}

// ============================================================================
// XXH3
// ============================================================================

TEST_CASE("Hash redactor output is 16 lowercase hex chars", "[hash_redactor]") {
    const HashRedactor redactor;
    const std::vector<std::string> inputs = {"John Doe", "", "x", std::string(4096, 'q')};
    for (const auto& input : inputs) {
        const auto out = run(redactor, input);
        CHECK(out.size() == HashRedactor::kRedactedLength);
        CHECK(is_lower_hex(out));
    }
    CHECK(redactor.exact_len() == 16);
    CHECK(redactor.kind() == "xxh3");
    CHECK(redactor.secret_size() == HashRedactor::kDefaultSecretSize);
}

TEST_CASE("Hash redactor is deterministic across instances", "[hash_redactor]") {
    const HashRedactor a;
    const HashRedactor b;
    CHECK(run(a, "John Doe") == run(a, "John Doe"));
    CHECK(run(a, "John Doe") == run(b, "John Doe"));
    CHECK(run(a, "John Doe") != run(a, "Jane Roe"));
}

TEST_CASE("Default secret matches plain XXH3", "[hash_redactor]") {
    const HashRedactor redactor;
    const std::string input = "John Doe";
    CHECK(redactor.digest(input) == XXH3_64bits(input.data(), input.size()));

    const auto hex = utils::u64_to_hex(XXH3_64bits(input.data(), input.size()));
    CHECK(run(redactor, input) == std::string(hex.data(), hex.size()));
}

TEST_CASE("Output does not depend on the data class", "[hash_redactor]") {
    const HashRedactor redactor;
    CHECK(run(redactor, "John Doe", DataClass("a", "b")) == run(redactor, "John Doe", DataClass("c", "d")));
}

TEST_CASE("Different secrets give different digests", "[hash_redactor]") {
    const HashRedactor a(std::vector<uint8_t>(HashRedactor::kDefaultSecretSize, 0x11));
    const HashRedactor b(std::vector<uint8_t>(HashRedactor::kDefaultSecretSize, 0x22));
    CHECK(run(a, "John Doe") != run(b, "John Doe"));
    CHECK(run(a, "John Doe") != run(HashRedactor(), "John Doe"));
}

TEST_CASE("XXH3 secret size is enforced", "[hash_redactor]") {
    CHECK_THROWS_AS(HashRedactor(std::vector<uint8_t>(HashRedactor::kMinXxh3SecretSize - 1, 1)),
                    std::invalid_argument);
    CHECK_THROWS_AS(HashRedactor(std::vector<uint8_t>(HashRedactor::kMaxSecretSize + 1, 1)),
                    std::invalid_argument);
    CHECK_NOTHROW(HashRedactor(std::vector<uint8_t>(HashRedactor::kMinXxh3SecretSize, 1)));
    CHECK_NOTHROW(HashRedactor(std::vector<uint8_t>(HashRedactor::kMaxSecretSize, 1)));

    CHECK(HashRedactor::validate_secret_size(HashRedactor::kDefaultSecretSize, HashRedactor::Algorithm::XXH3).empty());
    CHECK_FALSE(HashRedactor::validate_secret_size(8, HashRedactor::Algorithm::XXH3).empty());
}

// ============================================================================
// HMAC-SHA256
// ============================================================================

TEST_CASE("HMAC-SHA256 digest is the leading 8 bytes", "[hash_redactor]") {
    // RFC 4231 test case 1
    const HashRedactor redactor(std::vector<uint8_t>(20, 0x0b), HashRedactor::Algorithm::HMAC_SHA256);
    CHECK(redactor.digest("Hi There") == 0xb0344c61d8db3853ULL);
    CHECK(run(redactor, "Hi There") == "b0344c61d8db3853");
    CHECK(redactor.kind() == "hmac_sha256");
}

TEST_CASE("HMAC-SHA256 key size is enforced", "[hash_redactor]") {
    CHECK_THROWS_AS(HashRedactor(std::vector<uint8_t>(HashRedactor::kMinHmacKeySize - 1, 1),
                                 HashRedactor::Algorithm::HMAC_SHA256),
                    std::invalid_argument);
    CHECK_NOTHROW(HashRedactor(std::vector<uint8_t>(HashRedactor::kMinHmacKeySize, 1),
                               HashRedactor::Algorithm::HMAC_SHA256));
}

TEST_CASE("HMAC and XXH3 disagree for the same input", "[hash_redactor]") {
    const std::vector<uint8_t> key(HashRedactor::kDefaultSecretSize, 0x5a);
    const HashRedactor xxh3(key);
    const HashRedactor hmac(key, HashRedactor::Algorithm::HMAC_SHA256);
    CHECK(run(xxh3, "John Doe") != run(hmac, "John Doe"));
}

TEST_CASE("Hash algorithm names parse", "[hash_redactor]") {
    CHECK(HashRedactor::parse_algorithm("xxh3") == HashRedactor::Algorithm::XXH3);
    CHECK(HashRedactor::parse_algorithm("HMAC_SHA256") == HashRedactor::Algorithm::HMAC_SHA256);
    CHECK_FALSE(HashRedactor::parse_algorithm("md5").has_value());
    CHECK(std::string(HashRedactor::algorithm_name(HashRedactor::Algorithm::XXH3)) == "xxh3");
}
