#pragma once

#include <compare>
#include <cstddef>
#include <format>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace dataprivacy {

/**
 * @brief Identity of a data class: a taxonomy name plus a class name
 *
 * Both identifiers must be non-empty and made of [A-Za-z0-9_.-]. The
 * separator characters '/' and ':' are rejected so the rendered forms
 * ("core/sensitive", "<core/sensitive:REDACTED>") stay unambiguous.
 *
 * Instances are immutable. Ordering compares taxonomy first, then name.
 */
class DataClass {
public:
    /**
     * @throws std::invalid_argument if either identifier is empty or malformed
     */
    DataClass(std::string taxonomy, std::string name);

    /**
     * @brief Parse "taxonomy/name" (as written in config files)
     * @return nullopt if the text is not exactly two valid identifiers
     */
    [[nodiscard]] static std::optional<DataClass> parse(std::string_view text);

    [[nodiscard]] static bool is_valid_identifier(std::string_view id) noexcept;

    [[nodiscard]] const std::string& taxonomy() const noexcept { return taxonomy_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    // "taxonomy/name"
    [[nodiscard]] std::string to_string() const;

    // "<taxonomy/name:REDACTED>"
    [[nodiscard]] std::string redacted_marker() const;

    bool operator==(const DataClass&) const = default;
    std::strong_ordering operator<=>(const DataClass&) const = default;

private:
    std::string taxonomy_;
    std::string name_;
};

} // namespace dataprivacy

template<>
struct std::hash<dataprivacy::DataClass> {
    size_t operator()(const dataprivacy::DataClass& dc) const noexcept {
        const size_t h1 = std::hash<std::string>{}(dc.taxonomy());
        const size_t h2 = std::hash<std::string>{}(dc.name());
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

template<>
struct std::formatter<dataprivacy::DataClass> : std::formatter<std::string_view> {
    auto format(const dataprivacy::DataClass& dc, std::format_context& ctx) const {
        return std::formatter<std::string_view>::format(dc.to_string(), ctx);
    }
};
