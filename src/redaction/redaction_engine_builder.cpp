#include "redaction/redaction_engine_builder.hpp"
#include "redaction/redaction_engine.hpp"
#include "redaction/simple_redactor.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace dataprivacy {

RedactionEngineBuilder::RedactionEngineBuilder()
    : fallback_(SimpleRedactor::erasing()) {}

Result<void> RedactionEngineBuilder::add_class_redactor(const DataClass& data_class,
                                                        std::shared_ptr<const IRedactor> redactor) {
    if (!redactor) {
        return Result<void>::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("Null redactor for data class {}", data_class));
    }

    const auto [it, inserted] = redactors_.try_emplace(data_class, std::move(redactor));
    if (!inserted) {
        utils::log::warn(std::format(
            "Rejected duplicate redactor registration for data class {} (keeping {})",
            data_class, it->second->kind()));
        return Result<void>::error(ErrorCategory::CONFIGURATION_ERROR,
            std::format("Data class {} already has a registered redactor", data_class));
    }
    return Result<void>::ok();
}

RedactionEngineBuilder& RedactionEngineBuilder::set_fallback_redactor(
    std::shared_ptr<const IRedactor> redactor) {
    fallback_ = redactor ? std::move(redactor) : SimpleRedactor::erasing();
    return *this;
}

bool RedactionEngineBuilder::has_class_redactor(const DataClass& data_class) const {
    return redactors_.contains(data_class);
}

std::vector<DataClass> RedactionEngineBuilder::registered_classes() const {
    std::vector<DataClass> classes;
    classes.reserve(redactors_.size());
    for (const auto& [data_class, redactor] : redactors_) {
        classes.push_back(data_class);
    }
    std::sort(classes.begin(), classes.end());
    return classes;
}

std::string RedactionEngineBuilder::describe() const {
    return describe_classes(registered_classes());
}

std::shared_ptr<const RedactionEngine> RedactionEngineBuilder::build() && {
    utils::log::debug(std::format("Building redaction engine: {} class redactor(s), fallback={}",
                                  redactors_.size(), fallback_->kind()));

    auto engine = std::make_shared<const RedactionEngine>(
        RedactionEngine::Passkey{}, std::move(redactors_), std::move(fallback_));

    redactors_.clear();
    fallback_ = SimpleRedactor::erasing();
    return engine;
}

std::string describe_classes(const std::vector<DataClass>& classes) {
    std::string out = "[";
    for (size_t i = 0; i < classes.size(); ++i) {
        if (i > 0) out += ", ";
        out += classes[i].to_string();
    }
    out += "]";
    return out;
}

} // namespace dataprivacy
