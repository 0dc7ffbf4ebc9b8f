#pragma once

#include "classification/classified.hpp"
#include "classification/data_class.hpp"
#include "core/error.hpp"
#include "redaction/iredactor.hpp"
#include "redaction/redaction_sink.hpp"

#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dataprivacy {

class RedactionEngineBuilder;

/**
 * @brief Read-only dispatch table from data class to redactor
 *
 * Created once by RedactionEngineBuilder::build() and shared as
 * std::shared_ptr<const RedactionEngine>. Nothing is mutated after
 * construction, so any number of threads may redact concurrently.
 *
 * Lookup order: exact class registration, then the fallback. The builder
 * always supplies a fallback (erasing unless overridden), so an
 * unregistered class is never written out in clear.
 *
 * Usage:
 *   RedactionEngineBuilder builder;
 *   builder.add_class_redactor(SensitiveTag::data_class(), SimpleRedactor::asterisk());
 *   auto engine = std::move(builder).build();
 *
 *   std::string out;
 *   auto r = engine->display_redacted(name, [&](std::string_view s) { out += s; });
 */
class RedactionEngine {
public:
    /**
     * @brief Redact a classified container into the sink
     *
     * The caller's sink is written in place, so its failed() and
     * bytes_written() reflect this call afterwards.
     * @return SINK_ERROR if the sink reported a failed write
     */
    template<ClassifiedContainer C>
    [[nodiscard]] Result<void> display_redacted(const C& container, RedactionSink& sink) const {
        const DataClass& data_class = container.data_class();
        container.externalize(resolve(data_class), sink);
        return sink_status(data_class, sink);
    }

    // Same, writing to a callback (void or bool return) through a local sink
    template<ClassifiedContainer C, typename F>
        requires std::constructible_from<RedactionSink, F>
              && (!std::same_as<std::remove_cvref_t<F>, RedactionSink>)
    [[nodiscard]] Result<void> display_redacted(const C& container, F&& callback) const {
        RedactionSink sink(std::forward<F>(callback));
        return display_redacted(container, sink);
    }

    /**
     * @brief Redact text that is known to belong to data_class
     * @return SINK_ERROR if the sink reported a failed write
     */
    [[nodiscard]] Result<void> redact_as_class(const DataClass& data_class,
                                               std::string_view value,
                                               RedactionSink& sink) const;

    template<typename F>
        requires std::constructible_from<RedactionSink, F>
              && (!std::same_as<std::remove_cvref_t<F>, RedactionSink>)
    [[nodiscard]] Result<void> redact_as_class(const DataClass& data_class,
                                               std::string_view value,
                                               F&& callback) const {
        RedactionSink sink(std::forward<F>(callback));
        return redact_as_class(data_class, value, sink);
    }

    /**
     * @brief Redactor used for data_class: exact match, else the fallback
     */
    [[nodiscard]] const IRedactor& resolve(const DataClass& data_class) const noexcept;

    [[nodiscard]] bool has_class_redactor(const DataClass& data_class) const;

    // Constant output length for data_class, if its redactor has one
    [[nodiscard]] std::optional<size_t> exact_len(const DataClass& data_class) const;

    // Sorted list of explicitly registered classes
    [[nodiscard]] std::vector<DataClass> registered_classes() const;

    // "[core/sensitive, example/pii]"
    [[nodiscard]] std::string describe() const;

    [[nodiscard]] size_t size() const noexcept { return redactors_.size(); }
    [[nodiscard]] const IRedactor& fallback() const noexcept { return *fallback_; }

    /**
     * @brief Construction token: only RedactionEngineBuilder can create one
     */
    class Passkey {
        friend class RedactionEngineBuilder;
        Passkey() = default;
    };

    // Reachable only through RedactionEngineBuilder::build()
    RedactionEngine(Passkey,
                    std::unordered_map<DataClass, std::shared_ptr<const IRedactor>> redactors,
                    std::shared_ptr<const IRedactor> fallback);

private:

    static Result<void> sink_status(const DataClass& data_class, const RedactionSink& sink);

    const std::unordered_map<DataClass, std::shared_ptr<const IRedactor>> redactors_;
    const std::shared_ptr<const IRedactor> fallback_;
};

} // namespace dataprivacy
