#include "config/config_loader.hpp"
#include "classification/data_class.hpp"
#include "core/utils.hpp"
#include "redaction/hash_redactor.hpp"
#include "redaction/redaction_engine.hpp"
#include "redaction/redaction_engine_builder.hpp"

#include <openssl/crypto.h>

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

using namespace std::string_literals;

namespace dataprivacy {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

bool is_hash_kind(const std::string& kind) {
    return utils::to_lower(kind) == "hash";
}

bool is_mask_mode(SimpleRedactor::Mode mode) {
    return mode == SimpleRedactor::Mode::MASK || mode == SimpleRedactor::Mode::MASK_AND_TAG;
}

bool is_insert_mode(SimpleRedactor::Mode mode) {
    return mode == SimpleRedactor::Mode::INSERT || mode == SimpleRedactor::Mode::INSERT_AND_TAG;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or(cfg.level);
    return cfg;
}

RedactionConfig ConfigLoader::extract_redaction(const toml::table& root) {
    RedactionConfig cfg;
    const auto* redaction = root["redaction"].as_table();
    if (!redaction) return cfg;
    const auto& r = *redaction;

    cfg.fallback = r["fallback"].value_or(""s);

    if (const auto* redactors = r["redactors"].as_table()) {
        cfg.redactors.reserve(redactors->size());
        for (auto&& [key, node] : *redactors) {
            const auto* tbl = node.as_table();
            if (!tbl) continue;
            const auto& t = *tbl;

            RedactorConfig rc;
            rc.name = std::string(key.str());
            rc.kind = t["kind"].value_or(""s);
            rc.mask_char = t["mask_char"].value_or(rc.mask_char);
            rc.mask_length = t["mask_length"].value_or(rc.mask_length);
            rc.text = t["text"].value_or(""s);
            rc.algorithm = t["algorithm"].value_or(rc.algorithm);
            rc.secret = t["secret"].value_or(""s);
            cfg.redactors.emplace_back(std::move(rc));
        }
    }

    if (const auto* classes = r["classes"].as_array()) {
        cfg.classes.reserve(classes->size());
        for (const auto& elem : *classes) {
            const auto* tbl = elem.as_table();
            if (!tbl) continue;

            ClassRedactorConfig cc;
            cc.data_class = (*tbl)["class"].value_or(""s);
            cc.redactor = (*tbl)["redactor"].value_or(""s);
            cfg.classes.emplace_back(std::move(cc));
        }
    }

    return cfg;
}

PrivacyConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    PrivacyConfig config;
    config.logging = extract_logging(tbl);
    config.redaction = extract_redaction(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(PrivacyConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

void ConfigLoader::validate_redactor(const RedactorConfig& rc, std::vector<std::string>& errors) {
    const std::string prefix = std::format("redaction.redactors.{}", rc.name);

    if (rc.kind.empty()) {
        errors.push_back(std::format("{}.kind is required", prefix));
        return;
    }

    if (is_hash_kind(rc.kind)) {
        const auto algorithm = HashRedactor::parse_algorithm(rc.algorithm);
        if (!algorithm) {
            errors.push_back(std::format("{}.algorithm must be xxh3 or hmac_sha256, got '{}'",
                                         prefix, rc.algorithm));
            return;
        }
        if (rc.secret.empty()) {
            if (*algorithm == HashRedactor::Algorithm::HMAC_SHA256) {
                errors.push_back(std::format("{}.secret required for hmac_sha256", prefix));
            }
            return;
        }
        auto secret = utils::hex_to_bytes(rc.secret);
        if (secret.empty()) {
            errors.push_back(std::format("{}.secret must be an even-length hex string", prefix));
            return;
        }
        const auto problem = HashRedactor::validate_secret_size(secret.size(), *algorithm);
        OPENSSL_cleanse(secret.data(), secret.size());
        if (!problem.empty()) {
            errors.push_back(std::format("{}.secret: {}", prefix, problem));
        }
        return;
    }

    const auto mode = SimpleRedactor::parse_mode(rc.kind);
    if (!mode) {
        errors.push_back(std::format("{}.kind '{}' is not a known redactor kind", prefix, rc.kind));
        return;
    }

    if (is_mask_mode(*mode)) {
        if (rc.mask_char.size() != 1) {
            errors.push_back(std::format("{}.mask_char must be a single character", prefix));
        }
        if (!utils::in_range<1, static_cast<int64_t>(SimpleRedactor::kMaxMaskLength)>(rc.mask_length)) {
            errors.push_back(std::format("{}.mask_length must be 1-{}, got {}",
                                         prefix, SimpleRedactor::kMaxMaskLength, rc.mask_length));
        }
    }

    if (is_insert_mode(*mode) && rc.text.empty()) {
        errors.push_back(std::format("{}.text required for kind '{}'", prefix, rc.kind));
    }
}

std::vector<std::string> ConfigLoader::validate_config(const PrivacyConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got '{}'", config.logging.level));
    }

    const auto& redaction = config.redaction;

    std::unordered_set<std::string> redactor_names;
    for (const auto& rc : redaction.redactors) {
        redactor_names.insert(rc.name);
        validate_redactor(rc, errors);
    }

    if (!redaction.fallback.empty() && !redactor_names.contains(redaction.fallback)) {
        errors.push_back(std::format("redaction.fallback references unknown redactor '{}'",
                                     redaction.fallback));
    }

    std::unordered_set<DataClass> seen_classes;
    for (size_t i = 0; i < redaction.classes.size(); ++i) {
        const auto& cc = redaction.classes[i];
        const auto data_class = DataClass::parse(cc.data_class);
        if (!data_class) {
            errors.push_back(std::format(
                "redaction.classes[{}].class must be 'taxonomy/name', got '{}'", i, cc.data_class));
        } else if (!seen_classes.insert(*data_class).second) {
            errors.push_back(std::format(
                "redaction.classes[{}]: data class {} is already mapped", i, *data_class));
        }

        if (cc.redactor.empty()) {
            errors.push_back(std::format("redaction.classes[{}].redactor is required", i));
        } else if (!redactor_names.contains(cc.redactor)) {
            errors.push_back(std::format(
                "redaction.classes[{}].redactor references unknown redactor '{}'", i, cc.redactor));
        }
    }

    return errors;
}

// ============================================================================
// Engine construction
// ============================================================================

Result<std::shared_ptr<const IRedactor>> create_redactor(const RedactorConfig& config) {
    using R = Result<std::shared_ptr<const IRedactor>>;

    try {
        if (is_hash_kind(config.kind)) {
            const auto algorithm = HashRedactor::parse_algorithm(config.algorithm);
            if (!algorithm) {
                return R::error(ErrorCategory::CONFIGURATION_ERROR,
                    std::format("Redactor '{}': unknown hash algorithm '{}'", config.name, config.algorithm));
            }
            if (config.secret.empty()) {
                if (*algorithm != HashRedactor::Algorithm::XXH3) {
                    return R::error(ErrorCategory::CONFIGURATION_ERROR,
                        std::format("Redactor '{}': {} requires a secret",
                                    config.name, HashRedactor::algorithm_name(*algorithm)));
                }
                return R::ok(std::make_shared<const HashRedactor>());
            }
            auto secret = utils::hex_to_bytes(config.secret);
            if (secret.empty()) {
                return R::error(ErrorCategory::CONFIGURATION_ERROR,
                    std::format("Redactor '{}': secret is not valid hex", config.name));
            }
            return R::ok(std::make_shared<const HashRedactor>(std::move(secret), *algorithm));
        }

        const auto mode = SimpleRedactor::parse_mode(config.kind);
        if (!mode) {
            return R::error(ErrorCategory::CONFIGURATION_ERROR,
                std::format("Redactor '{}': unknown kind '{}'", config.name, config.kind));
        }

        SimpleRedactor::Config cfg;
        cfg.mode = *mode;
        if (is_mask_mode(*mode)) {
            if (config.mask_char.size() != 1 || config.mask_length <= 0) {
                return R::error(ErrorCategory::CONFIGURATION_ERROR,
                    std::format("Redactor '{}': invalid mask settings", config.name));
            }
            cfg.mask_char = config.mask_char.front();
            cfg.mask_length = static_cast<size_t>(config.mask_length);
        }
        cfg.text = config.text;
        return R::ok(std::make_shared<const SimpleRedactor>(std::move(cfg)));
    } catch (const std::invalid_argument& e) {
        return R::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("Redactor '{}': {}", config.name, e.what()));
    }
}

Result<std::shared_ptr<const RedactionEngine>> build_engine(const RedactionConfig& config) {
    using R = Result<std::shared_ptr<const RedactionEngine>>;

    std::unordered_map<std::string, std::shared_ptr<const IRedactor>> instances;
    instances.reserve(config.redactors.size());
    for (const auto& rc : config.redactors) {
        auto created = create_redactor(rc);
        if (created.is_error()) {
            return R::error(created.error_category(), created.error_message());
        }
        instances.emplace(rc.name, std::move(created.value()));
    }

    const auto lookup = [&instances](const std::string& name) -> std::shared_ptr<const IRedactor> {
        const auto it = instances.find(name);
        return (it != instances.end()) ? it->second : nullptr;
    };

    RedactionEngineBuilder builder;

    if (!config.fallback.empty()) {
        auto fallback = lookup(config.fallback);
        if (!fallback) {
            return R::error(ErrorCategory::CONFIGURATION_ERROR,
                std::format("Fallback references unknown redactor '{}'", config.fallback));
        }
        builder.set_fallback_redactor(std::move(fallback));
    }

    for (const auto& cc : config.classes) {
        const auto data_class = DataClass::parse(cc.data_class);
        if (!data_class) {
            return R::error(ErrorCategory::CONFIGURATION_ERROR,
                std::format("Malformed data class '{}'", cc.data_class));
        }
        auto redactor = lookup(cc.redactor);
        if (!redactor) {
            return R::error(ErrorCategory::CONFIGURATION_ERROR,
                std::format("Data class {} references unknown redactor '{}'", *data_class, cc.redactor));
        }
        const auto added = builder.add_class_redactor(*data_class, std::move(redactor));
        if (added.is_error()) {
            return R::error(added.error_category(), added.error_message());
        }
    }

    return R::ok(std::move(builder).build());
}

void apply_logging_config(const LoggingConfig& config) {
    if (const auto level = utils::log::parse_level(config.level)) {
        utils::log::set_level(*level);
    } else {
        utils::log::warn(std::format("Unknown log level '{}', keeping current level", config.level));
    }
}

} // namespace dataprivacy
