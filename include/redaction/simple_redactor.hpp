#pragma once

#include "redaction/iredactor.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace dataprivacy {

/**
 * @brief Redactor performing fixed, value-independent substitutions
 *
 * Modes:
 * - ERASE:          write nothing
 * - ERASE_AND_TAG:  "<taxonomy/name:>"
 * - MASK:           fixed mask, "********" by default (length does not
 *                   depend on the input)
 * - MASK_AND_TAG:   "<taxonomy/name:********>"
 * - INSERT:         a configured replacement text, e.g. "[REDACTED]"
 * - INSERT_AND_TAG: "<taxonomy/name:[REDACTED]>"
 *
 * No mode ever writes any part of the input.
 */
class SimpleRedactor final : public IRedactor {
public:
    enum class Mode {
        ERASE,
        ERASE_AND_TAG,
        MASK,
        MASK_AND_TAG,
        INSERT,
        INSERT_AND_TAG
    };

    static constexpr char kDefaultMaskChar = '*';
    static constexpr size_t kDefaultMaskLength = 8;
    static constexpr size_t kMaxMaskLength = 1024;

    struct Config {
        Mode mode = Mode::MASK;
        char mask_char = kDefaultMaskChar;
        size_t mask_length = kDefaultMaskLength;
        std::string text;          // INSERT / INSERT_AND_TAG only
    };

    // Default: MASK with "********"
    SimpleRedactor();

    /**
     * @throws std::invalid_argument if mask_length is 0 or above kMaxMaskLength
     *         for a MASK mode
     */
    explicit SimpleRedactor(Config config);

    [[nodiscard]] static std::shared_ptr<const SimpleRedactor> erasing();
    [[nodiscard]] static std::shared_ptr<const SimpleRedactor> asterisk();
    [[nodiscard]] static std::shared_ptr<const SimpleRedactor> with_mode(Mode mode);
    [[nodiscard]] static std::shared_ptr<const SimpleRedactor> inserting(std::string text, bool tagged = false);

    void redact(const DataClass& data_class,
                std::string_view value,
                RedactionSink& sink) const override;

    [[nodiscard]] std::optional<size_t> exact_len() const override;
    [[nodiscard]] std::string kind() const override;

    [[nodiscard]] Mode mode() const noexcept { return mode_; }

    [[nodiscard]] static const char* mode_name(Mode mode);
    [[nodiscard]] static std::optional<Mode> parse_mode(const std::string& name);

private:
    static bool write_tagged(const DataClass& data_class, std::string_view body, RedactionSink& sink);

    Mode mode_;
    std::string replacement_;     // mask or inserted text, fixed at construction
};

} // namespace dataprivacy
