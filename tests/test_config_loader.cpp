#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "classification/classified.hpp"
#include "redaction/redaction_engine.hpp"
#include "taxonomy/core_taxonomy.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace dataprivacy;

namespace {

DATAPRIVACY_DATA_CLASS(Personal, "example", "personal");
DATAPRIVACY_DATA_CLASS(Card, "example", "card");

// 16-byte HMAC key
constexpr const char* kHmacKeyHex = "000102030405060708090a0b0c0d0e0f";

template<typename C>
std::string render(const RedactionEngine& engine, const C& value) {
    std::string out;
    REQUIRE(engine.display_redacted(value, [&out](std::string_view s) { out += s; }).is_ok());
    return out;
}

bool has_error_containing(const std::vector<std::string>& errors, const std::string& needle) {
    for (const auto& e : errors) {
        if (e.find(needle) != std::string::npos) return true;
    }
    return false;
}

PrivacyConfig valid_config() {
    PrivacyConfig cfg;
    RedactorConfig mask;
    mask.name = "mask";
    mask.kind = "asterisk";
    cfg.redaction.redactors.push_back(mask);
    cfg.redaction.classes.push_back({"example/personal", "mask"});
    return cfg;
}

} // anonymous namespace

// ============================================================================
// Loading
// ============================================================================

TEST_CASE("Config: full document loads", "[config]") {
    const std::string toml = R"(
[logging]
level = "warn"

[redaction]
fallback = "drop"

[redaction.redactors.drop]
kind = "erase"

[redaction.redactors.stars]
kind = "mask"
mask_char = "#"
mask_length = 4

[redaction.redactors.digest]
kind = "hash"
algorithm = "hmac_sha256"
secret = "000102030405060708090a0b0c0d0e0f"

[[redaction.classes]]
class = "example/personal"
redactor = "stars"

[[redaction.classes]]
class = "example/card"
redactor = "digest"
)";

    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "warn");
    CHECK(cfg.redaction.fallback == "drop");
    REQUIRE(cfg.redaction.redactors.size() == 3);
    REQUIRE(cfg.redaction.classes.size() == 2);
    CHECK(cfg.redaction.classes[0].data_class == "example/personal");
    CHECK(cfg.redaction.classes[1].redactor == "digest");

    const auto engine = build_engine(cfg.redaction);
    REQUIRE(engine.is_ok());
    CHECK(render(*engine.value(), Personal<std::string>("John Doe")) == "####");
    CHECK(render(*engine.value(), Card<std::string>("4111")).size() == 16);
    CHECK(render(*engine.value(), Sensitive<std::string>("unmapped")).empty());
    CHECK(engine.value()->describe() == "[example/card, example/personal]");
}

TEST_CASE("Config: empty document gives an erase-everything engine", "[config]") {
    const auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "info");
    CHECK(result.config.redaction.redactors.empty());

    const auto engine = build_engine(result.config.redaction);
    REQUIRE(engine.is_ok());
    CHECK(engine.value()->size() == 0);
    CHECK(render(*engine.value(), Sensitive<std::string>("John Doe")).empty());
}

TEST_CASE("Config: malformed TOML is reported", "[config]") {
    const auto result = ConfigLoader::load_from_string("[redaction\nfallback = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("Config: load from file", "[config]") {
    const auto path = std::filesystem::temp_directory_path() / "dataprivacy_test_config.toml";
    {
        std::ofstream out(path);
        out << "[redaction.redactors.mask]\nkind = \"asterisk\"\n\n"
               "[[redaction.classes]]\nclass = \"core/sensitive\"\nredactor = \"mask\"\n";
    }

    const auto result = ConfigLoader::load_from_file(path.string());
    std::filesystem::remove(path);
    REQUIRE(result.success);

    const auto engine = build_engine(result.config.redaction);
    REQUIRE(engine.is_ok());
    CHECK(render(*engine.value(), Sensitive<std::string>("John Doe")) == "********");
}

TEST_CASE("Config: missing file is reported", "[config]") {
    const auto result = ConfigLoader::load_from_file("/nonexistent/dataprivacy.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to load config") != std::string::npos);
}

// ============================================================================
// Environment expansion
// ============================================================================

TEST_CASE("EnvConfig: secret expands from environment", "[config][env]") {
    ::setenv("DATAPRIVACY_TEST_HASH_KEY", kHmacKeyHex, 1);

    const std::string toml = R"(
[redaction.redactors.digest]
kind = "hash"
algorithm = "hmac_sha256"
secret = "${DATAPRIVACY_TEST_HASH_KEY}"
)";

    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    REQUIRE(result.config.redaction.redactors.size() == 1);
    CHECK(result.config.redaction.redactors[0].secret == kHmacKeyHex);

    ::unsetenv("DATAPRIVACY_TEST_HASH_KEY");
}

TEST_CASE("EnvConfig: unset secret variable fails validation for hmac", "[config][env]") {
    ::unsetenv("DATAPRIVACY_TEST_MISSING_KEY");

    const std::string toml = R"(
[redaction.redactors.digest]
kind = "hash"
algorithm = "hmac_sha256"
secret = "${DATAPRIVACY_TEST_MISSING_KEY}"
)";

    const auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("secret required") != std::string::npos);
}

TEST_CASE("EnvConfig: unclosed ${ is parse error", "[config][env]") {
    const std::string toml = R"(
[logging]
level = "${UNCLOSED"
)";
    const auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed") != std::string::npos);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("ConfigValidation: valid config has no errors", "[config][validation]") {
    CHECK(ConfigLoader::validate_config(valid_config()).empty());
}

TEST_CASE("ConfigValidation: unknown logging level", "[config][validation]") {
    auto cfg = valid_config();
    cfg.logging.level = "verbose";
    CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "logging.level"));
}

TEST_CASE("ConfigValidation: unknown redactor kind", "[config][validation]") {
    auto cfg = valid_config();
    cfg.redaction.redactors[0].kind = "passthrough";
    CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "not a known redactor kind"));

    cfg.redaction.redactors[0].kind = "";
    CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "kind is required"));
}

TEST_CASE("ConfigValidation: mask settings", "[config][validation]") {
    auto cfg = valid_config();
    cfg.redaction.redactors[0].mask_length = 0;
    CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "mask_length"));

    cfg.redaction.redactors[0].mask_length = 8;
    cfg.redaction.redactors[0].mask_char = "**";
    CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "mask_char"));
}

TEST_CASE("ConfigValidation: insert requires text", "[config][validation]") {
    auto cfg = valid_config();
    cfg.redaction.redactors[0].kind = "insert";
    CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "text required"));

    cfg.redaction.redactors[0].text = "[REDACTED]";
    CHECK(ConfigLoader::validate_config(cfg).empty());
}

TEST_CASE("ConfigValidation: hash secrets", "[config][validation]") {
    auto cfg = valid_config();
    auto& rc = cfg.redaction.redactors[0];
    rc.kind = "hash";

    // Built-in secret is fine for xxh3
    CHECK(ConfigLoader::validate_config(cfg).empty());

    rc.algorithm = "md5";
    CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "algorithm"));

    rc.algorithm = "xxh3";
    rc.secret = "not-hex";
    CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "hex"));

    rc.secret = kHmacKeyHex;   // 16 bytes, too short for xxh3
    const auto errors = ConfigLoader::validate_config(cfg);
    CHECK(has_error_containing(errors, "secret"));
    CHECK_FALSE(has_error_containing(errors, kHmacKeyHex));

    rc.algorithm = "hmac_sha256";
    CHECK(ConfigLoader::validate_config(cfg).empty());
}

TEST_CASE("ConfigValidation: unknown references", "[config][validation]") {
    auto cfg = valid_config();
    cfg.redaction.fallback = "missing";
    CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "fallback references unknown"));

    cfg = valid_config();
    cfg.redaction.classes[0].redactor = "missing";
    CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "references unknown redactor"));

    cfg.redaction.classes[0].redactor = "";
    CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "redactor is required"));
}

TEST_CASE("ConfigValidation: malformed and duplicate classes", "[config][validation]") {
    auto cfg = valid_config();
    cfg.redaction.classes.push_back({"no-slash", "mask"});
    CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "taxonomy/name"));

    cfg = valid_config();
    cfg.redaction.classes.push_back({"example/personal", "mask"});
    CHECK(has_error_containing(ConfigLoader::validate_config(cfg), "already mapped"));
}

TEST_CASE("ConfigValidation: errors are aggregated", "[config][validation]") {
    const std::string toml = R"(
[logging]
level = "loud"

[redaction]
fallback = "nowhere"
)";
    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Config validation failed") != std::string::npos);
    CHECK(result.error_message.find("logging.level") != std::string::npos);
    CHECK(result.error_message.find("nowhere") != std::string::npos);
}

// ============================================================================
// Redactor construction
// ============================================================================

TEST_CASE("create_redactor builds each kind", "[config]") {
    RedactorConfig rc;
    rc.name = "r";

    rc.kind = "erase";
    REQUIRE(create_redactor(rc).is_ok());
    CHECK(create_redactor(rc).value()->kind() == "erase");

    rc.kind = "mask_and_tag";
    CHECK(create_redactor(rc).value()->kind() == "mask_and_tag");

    rc.kind = "hash";
    CHECK(create_redactor(rc).value()->kind() == "xxh3");

    rc.algorithm = "hmac_sha256";
    rc.secret = kHmacKeyHex;
    CHECK(create_redactor(rc).value()->kind() == "hmac_sha256");

    rc.secret.clear();
    const auto missing = create_redactor(rc);
    REQUIRE(missing.is_error());
    CHECK(missing.error_category() == ErrorCategory::CONFIGURATION_ERROR);

    rc.kind = "unknown";
    CHECK(create_redactor(rc).is_error());
}

TEST_CASE("build_engine shares redactors referenced by several classes", "[config]") {
    RedactionConfig cfg;
    RedactorConfig rc;
    rc.name = "digest";
    rc.kind = "hash";
    cfg.redactors.push_back(rc);
    cfg.classes.push_back({"example/personal", "digest"});
    cfg.classes.push_back({"example/card", "digest"});

    const auto engine = build_engine(cfg);
    REQUIRE(engine.is_ok());
    CHECK(&engine.value()->resolve(PersonalTag::data_class()) ==
          &engine.value()->resolve(CardTag::data_class()));
}

TEST_CASE("build_engine rejects duplicate classes", "[config]") {
    auto cfg = valid_config();
    cfg.redaction.classes.push_back({"example/personal", "mask"});
    const auto engine = build_engine(cfg.redaction);
    REQUIRE(engine.is_error());
    CHECK(engine.error_category() == ErrorCategory::CONFIGURATION_ERROR);
}

TEST_CASE("apply_logging_config sets the log level", "[config]") {
    const auto previous = utils::log::level();

    apply_logging_config(LoggingConfig{"debug"});
    CHECK(utils::log::level() == utils::log::Level::DEBUG);

    apply_logging_config(LoggingConfig{"bogus"});
    CHECK(utils::log::level() == utils::log::Level::DEBUG);

    utils::log::set_level(previous);
}
