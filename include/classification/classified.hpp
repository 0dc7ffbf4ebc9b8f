#pragma once

#include "classification/data_class.hpp"
#include "redaction/iredactor.hpp"
#include "redaction/redaction_sink.hpp"

#include <openssl/crypto.h>

#include <concepts>
#include <cstddef>
#include <format>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace dataprivacy {

// ============================================================================
// Text extraction
// ============================================================================

/**
 * @brief True if std::format can render T (the primary std::formatter is
 * disabled, i.e. not default constructible, for unsupported types)
 */
template<typename T>
concept StdFormattable = std::semiregular<std::formatter<T, char>>;

template<typename T>
concept TextConvertible = std::convertible_to<const T&, std::string_view> || StdFormattable<T>;

namespace detail {

template<TextConvertible T>
[[nodiscard]] std::string to_text(const T& value) {
    if constexpr (std::convertible_to<const T&, std::string_view>) {
        return std::string(std::string_view(value));
    } else {
        return std::format("{}", value);
    }
}

/**
 * @brief Plain-text form of a payload, alive for one redaction call
 *
 * The text is rendered straight into the owned buffer (sized up front, so
 * it never reallocates) and no intermediate string holds a copy. The
 * buffer is wiped with OPENSSL_cleanse by wipe() and on destruction,
 * including when the sink throws mid-redaction.
 */
class ScrubbedText {
public:
    template<TextConvertible T>
    explicit ScrubbedText(const T& value) {
        if constexpr (std::convertible_to<const T&, std::string_view>) {
            const std::string_view view(value);
            text_.reserve(view.size());
            text_.assign(view);
        } else {
            const size_t size = std::formatted_size("{}", value);
            text_.resize(size);
            std::format_to_n(text_.data(), static_cast<std::ptrdiff_t>(size), "{}", value);
        }
    }

    ~ScrubbedText() { wipe(); }

    ScrubbedText(const ScrubbedText&) = delete;
    ScrubbedText& operator=(const ScrubbedText&) = delete;

    [[nodiscard]] std::string_view view() const noexcept { return text_; }

    // Zero the buffer in place and leave the text empty; capacity is kept
    void wipe() noexcept {
        if (!text_.empty()) {
            OPENSSL_cleanse(text_.data(), text_.size());
            text_.clear();
        }
    }

private:
    std::string text_;
};

} // namespace detail

// ============================================================================
// Classified<T, Tag>
// ============================================================================

/**
 * @brief Container marking a value as belonging to a data class
 *
 * Tag supplies the class through a static `data_class()` function; the
 * class is associated with the type, not stored per instance.
 *
 * There is no operator<<, no std::formatter specialization and
 * no conversion operator: formatting a container does not compile. Text
 * leaves the container only through externalize() (redacted) or
 * declassify*() (raw, explicitly named for review).
 */
template<typename T, typename Tag>
class Classified {
public:
    using value_type = T;
    using tag_type = Tag;

    Classified() requires std::default_initializable<T> = default;
    explicit Classified(T value) : payload_(std::move(value)) {}

    [[nodiscard]] static const DataClass& data_class() { return Tag::data_class(); }

    /**
     * @brief Move the raw value out of the container
     */
    [[nodiscard]] T declassify() && { return std::move(payload_); }

    /**
     * @brief Borrow the raw value
     */
    [[nodiscard]] const T& declassify_ref() const& noexcept { return payload_; }

    template<typename F>
        requires std::invocable<F, const T&>
    void visit(F&& operation) const {
        std::invoke(std::forward<F>(operation), payload_);
    }

    template<typename F>
        requires std::invocable<F, T&>
    void visit_mut(F&& operation) {
        std::invoke(std::forward<F>(operation), payload_);
    }

    // "<taxonomy/name:REDACTED>", independent of the payload
    [[nodiscard]] std::string debug_string() const { return data_class().redacted_marker(); }

    /**
     * @brief Render the payload as text and push it through the redactor
     */
    void externalize(const IRedactor& redactor, RedactionSink& sink) const
        requires TextConvertible<T> {
        const detail::ScrubbedText text(payload_);
        redactor.redact(data_class(), text.view(), sink);
    }

    bool operator==(const Classified&) const = default;

private:
    T payload_{};
};

/**
 * @brief Anything the engine can redact: reports its class and can
 * externalize itself through a redactor
 *
 * Satisfied by every Classified<T, Tag> and by hand-written containers.
 */
template<typename C>
concept ClassifiedContainer = requires(const C& c, const IRedactor& redactor, RedactionSink& sink) {
    { c.data_class() } -> std::convertible_to<const DataClass&>;
    c.externalize(redactor, sink);
};

} // namespace dataprivacy

template<typename T, typename Tag>
    requires requires(const T& v) { std::hash<T>{}(v); }
struct std::hash<dataprivacy::Classified<T, Tag>> {
    size_t operator()(const dataprivacy::Classified<T, Tag>& c) const {
        return std::hash<T>{}(c.declassify_ref());
    }
};

/**
 * @brief Declare a classified container type for one data class
 *
 *   DATAPRIVACY_DATA_CLASS(CustomerContent, "contoso", "customer_content");
 *   CustomerContent<std::string> text{"hello"};
 *
 * Expands to a tag struct `<Type>Tag` and an alias template `<Type><T>`.
 */
#define DATAPRIVACY_DATA_CLASS(Type, taxonomy_name, class_name)                       \
    struct Type##Tag {                                                               \
        static const ::dataprivacy::DataClass& data_class() {                        \
            static const ::dataprivacy::DataClass instance{taxonomy_name, class_name}; \
            return instance;                                                         \
        }                                                                            \
    };                                                                               \
    template<typename T>                                                             \
    using Type = ::dataprivacy::Classified<T, Type##Tag>
