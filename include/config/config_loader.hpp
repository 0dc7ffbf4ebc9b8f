#pragma once

#include "core/error.hpp"
#include "redaction/iredactor.hpp"
#include "redaction/simple_redactor.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dataprivacy {

class RedactionEngine;

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Redaction Config (mirrors TOML hierarchy)
// ============================================================================

/**
 * [redaction.redactors.<name>]
 */
struct RedactorConfig {
    std::string name;
    std::string kind;                // erase | erase_and_tag | asterisk | mask | mask_and_tag
                                     // | insert | insert_and_tag | hash
    std::string mask_char = "*";
    int64_t mask_length = static_cast<int64_t>(SimpleRedactor::kDefaultMaskLength);
    std::string text;                // insert modes
    std::string algorithm = "xxh3";  // hash: xxh3 | hmac_sha256
    std::string secret;              // hash: hex; empty = built-in secret (xxh3 only)
};

/**
 * [[redaction.classes]]
 */
struct ClassRedactorConfig {
    std::string data_class;          // "taxonomy/name"
    std::string redactor;            // name of a [redaction.redactors.<name>] entry
};

struct RedactionConfig {
    std::string fallback;            // redactor name; empty = erase
    std::vector<RedactorConfig> redactors;
    std::vector<ClassRedactorConfig> classes;
};

// ============================================================================
// PrivacyConfig - Complete parsed configuration
// ============================================================================

struct PrivacyConfig {
    LoggingConfig logging;
    RedactionConfig redaction;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * Example:
 *
 *   [logging]
 *   level = "warn"
 *
 *   [redaction]
 *   fallback = "drop"
 *
 *   [redaction.redactors.drop]
 *   kind = "erase"
 *
 *   [redaction.redactors.pii_hash]
 *   kind = "hash"
 *   algorithm = "hmac_sha256"
 *   secret = "${REDACTION_HASH_KEY}"
 *
 *   [[redaction.classes]]
 *   class = "example/personal"
 *   redactor = "pii_hash"
 *
 * String values support ${VAR} environment expansion.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        PrivacyConfig config;

        static LoadResult ok(PrivacyConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to the .toml file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check cross-references and values; empty when valid
     *
     * Messages name the offending key but never echo secrets.
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const PrivacyConfig& config);

private:
    static LoggingConfig extract_logging(const toml::table& root);
    static RedactionConfig extract_redaction(const toml::table& root);
    static PrivacyConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(PrivacyConfig config);

    static void validate_redactor(const RedactorConfig& redactor, std::vector<std::string>& errors);
};

// ============================================================================
// Engine construction from config
// ============================================================================

/**
 * @brief Instantiate one configured redactor
 * @return CONFIGURATION_ERROR for unknown kinds or invalid parameters
 */
[[nodiscard]] Result<std::shared_ptr<const IRedactor>> create_redactor(const RedactorConfig& config);

/**
 * @brief Instantiate all redactors and register them per class
 *
 * Redactors referenced by several classes are shared, not duplicated.
 */
[[nodiscard]] Result<std::shared_ptr<const RedactionEngine>> build_engine(const RedactionConfig& config);

/**
 * @brief Apply [logging] settings to utils::log
 */
void apply_logging_config(const LoggingConfig& config);

} // namespace dataprivacy
