#include "classification/data_class.hpp"

#include <format>
#include <stdexcept>

namespace dataprivacy {

DataClass::DataClass(std::string taxonomy, std::string name)
    : taxonomy_(std::move(taxonomy)), name_(std::move(name)) {
    if (!is_valid_identifier(taxonomy_)) {
        throw std::invalid_argument(
            std::format("Invalid data class taxonomy '{}'", taxonomy_));
    }
    if (!is_valid_identifier(name_)) {
        throw std::invalid_argument(
            std::format("Invalid data class name '{}' in taxonomy '{}'", name_, taxonomy_));
    }
}

bool DataClass::is_valid_identifier(std::string_view id) noexcept {
    if (id.empty()) return false;
    for (const char c : id) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
                     || (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
        if (!ok) return false;
    }
    return true;
}

std::optional<DataClass> DataClass::parse(std::string_view text) {
    const auto slash = text.find('/');
    if (slash == std::string_view::npos) return std::nullopt;

    const auto taxonomy = text.substr(0, slash);
    const auto name = text.substr(slash + 1);
    if (!is_valid_identifier(taxonomy) || !is_valid_identifier(name)) {
        return std::nullopt;
    }
    return DataClass(std::string(taxonomy), std::string(name));
}

std::string DataClass::to_string() const {
    return std::format("{}/{}", taxonomy_, name_);
}

std::string DataClass::redacted_marker() const {
    return std::format("<{}/{}:REDACTED>", taxonomy_, name_);
}

} // namespace dataprivacy
