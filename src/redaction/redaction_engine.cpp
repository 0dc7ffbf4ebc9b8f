#include "redaction/redaction_engine.hpp"
#include "redaction/redaction_engine_builder.hpp"

#include <algorithm>
#include <format>

namespace dataprivacy {

RedactionEngine::RedactionEngine(
    Passkey,
    std::unordered_map<DataClass, std::shared_ptr<const IRedactor>> redactors,
    std::shared_ptr<const IRedactor> fallback)
    : redactors_(std::move(redactors)),
      fallback_(std::move(fallback)) {}

Result<void> RedactionEngine::redact_as_class(const DataClass& data_class,
                                              std::string_view value,
                                              RedactionSink& sink) const {
    resolve(data_class).redact(data_class, value, sink);
    return sink_status(data_class, sink);
}

const IRedactor& RedactionEngine::resolve(const DataClass& data_class) const noexcept {
    const auto it = redactors_.find(data_class);
    if (it != redactors_.end()) {
        return *it->second;
    }
    return *fallback_;
}

bool RedactionEngine::has_class_redactor(const DataClass& data_class) const {
    return redactors_.contains(data_class);
}

std::optional<size_t> RedactionEngine::exact_len(const DataClass& data_class) const {
    return resolve(data_class).exact_len();
}

std::vector<DataClass> RedactionEngine::registered_classes() const {
    std::vector<DataClass> classes;
    classes.reserve(redactors_.size());
    for (const auto& [data_class, redactor] : redactors_) {
        classes.push_back(data_class);
    }
    std::sort(classes.begin(), classes.end());
    return classes;
}

std::string RedactionEngine::describe() const {
    return describe_classes(registered_classes());
}

Result<void> RedactionEngine::sink_status(const DataClass& data_class, const RedactionSink& sink) {
    if (sink.failed()) {
        return Result<void>::error(ErrorCategory::SINK_ERROR,
            std::format("Sink rejected redacted output for data class {}", data_class));
    }
    return Result<void>::ok();
}

} // namespace dataprivacy
