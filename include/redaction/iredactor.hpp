#pragma once

#include "classification/data_class.hpp"
#include "redaction/redaction_sink.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace dataprivacy {

/**
 * @brief Abstract redaction strategy
 *
 * Enables polymorphic redaction: built-in SimpleRedactor / HashRedactor
 * or any application-defined strategy registered with the builder.
 *
 * Implementations must be logically immutable once constructed: the engine
 * calls redact() concurrently from many threads without synchronization.
 * Output goes to the sink in fragments and is never returned as a buffer.
 */
class IRedactor {
public:
    virtual ~IRedactor() = default;

    virtual void redact(const DataClass& data_class,
                        std::string_view value,
                        RedactionSink& sink) const = 0;

    /**
     * @brief Exact length of the redacted output, if constant
     *
     * Hint for callers that pre-size output buffers.
     */
    [[nodiscard]] virtual std::optional<size_t> exact_len() const { return std::nullopt; }

    // Short strategy name used in diagnostics ("asterisk", "xxh3", ...)
    [[nodiscard]] virtual std::string kind() const = 0;
};

} // namespace dataprivacy
