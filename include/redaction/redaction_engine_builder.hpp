#pragma once

#include "classification/data_class.hpp"
#include "core/error.hpp"
#include "redaction/iredactor.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace dataprivacy {

class RedactionEngine;

/**
 * @brief Accumulates class → redactor registrations, then builds an engine
 *
 * Starts with an erasing fallback. At most one redactor per data class:
 * a second registration for the same class is rejected and the first one
 * stays in place. The fallback is a single policy knob, last write wins.
 *
 * build() consumes the builder:
 *   auto engine = std::move(builder).build();
 */
class RedactionEngineBuilder {
public:
    RedactionEngineBuilder();

    /**
     * @brief Register the redactor for one data class
     * @return CONFIGURATION_ERROR on duplicate class or null redactor
     */
    [[nodiscard]] Result<void> add_class_redactor(const DataClass& data_class,
                                                  std::shared_ptr<const IRedactor> redactor);

    /**
     * @brief Redactor for classes without an explicit registration
     *
     * Replaces any previous fallback. nullptr restores the erasing default.
     */
    RedactionEngineBuilder& set_fallback_redactor(std::shared_ptr<const IRedactor> redactor);

    [[nodiscard]] bool has_class_redactor(const DataClass& data_class) const;
    [[nodiscard]] std::vector<DataClass> registered_classes() const;
    [[nodiscard]] std::string describe() const;

    [[nodiscard]] std::shared_ptr<const RedactionEngine> build() &&;

private:
    std::unordered_map<DataClass, std::shared_ptr<const IRedactor>> redactors_;
    std::shared_ptr<const IRedactor> fallback_;
};

// Shared by builder and engine diagnostics: "[a/b, c/d]"
[[nodiscard]] std::string describe_classes(const std::vector<DataClass>& classes);

} // namespace dataprivacy
