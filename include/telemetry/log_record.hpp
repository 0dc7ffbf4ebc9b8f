#pragma once

#include "classification/classified.hpp"
#include "core/utils.hpp"
#include "redaction/redaction_engine.hpp"

#include <memory>
#include <string>
#include <vector>

namespace dataprivacy {

/**
 * @brief Process-wide engine used by LogRecord when none is given explicitly
 *
 * Typically set once at startup; setting again replaces the engine for
 * records created afterwards.
 */
void set_redaction_engine_for_logging(std::shared_ptr<const RedactionEngine> engine);
[[nodiscard]] std::shared_ptr<const RedactionEngine> redaction_engine_for_logging();

/**
 * @brief Structured log line whose classified fields are redacted on entry
 *
 *   LogRecord(engine)
 *       .add("age", employee.age)
 *       .add_classified("name", employee.name)
 *       .emit();
 *   // 12:00:00.123 [INFO ] age=30, name=6f3a09c1d2e4b857
 *
 * Classified values are rendered through the engine the moment they are
 * added; the record never holds their raw text. Without any engine the
 * field renders as "<taxonomy/name:REDACTED>".
 */
class LogRecord {
public:
    // Uses redaction_engine_for_logging()
    LogRecord();
    explicit LogRecord(std::shared_ptr<const RedactionEngine> engine);

    template<typename V>
        requires TextConvertible<V>
    LogRecord& add(std::string name, const V& value) {
        fields_.push_back({std::move(name), detail::to_text(value)});
        return *this;
    }

    template<ClassifiedContainer C>
    LogRecord& add_classified(std::string name, const C& value) {
        std::string rendered;
        if (engine_) {
            const auto result = engine_->display_redacted(
                value, [&rendered](std::string_view chunk) { rendered += chunk; });
            if (result.is_error()) {
                rendered = value.data_class().redacted_marker();
            }
        } else {
            rendered = value.data_class().redacted_marker();
        }
        fields_.push_back({std::move(name), std::move(rendered)});
        return *this;
    }

    // "name=value, name2=value2"
    [[nodiscard]] std::string to_string() const;

    void emit(utils::log::Level level = utils::log::Level::INFO) const;

    [[nodiscard]] size_t field_count() const noexcept { return fields_.size(); }

private:
    struct Field {
        std::string name;
        std::string rendered;
    };

    std::shared_ptr<const RedactionEngine> engine_;
    std::vector<Field> fields_;
};

} // namespace dataprivacy
