#include "redaction/simple_redactor.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>
#include <unordered_map>

namespace dataprivacy {

SimpleRedactor::SimpleRedactor() : SimpleRedactor(Config{}) {}

SimpleRedactor::SimpleRedactor(Config config) : mode_(config.mode) {
    switch (mode_) {
        case Mode::ERASE:
        case Mode::ERASE_AND_TAG:
            break;

        case Mode::MASK:
        case Mode::MASK_AND_TAG:
            if (config.mask_length == 0 || config.mask_length > kMaxMaskLength) {
                throw std::invalid_argument(std::format(
                    "mask_length must be 1-{}, got {}", kMaxMaskLength, config.mask_length));
            }
            replacement_.assign(config.mask_length, config.mask_char);
            break;

        case Mode::INSERT:
        case Mode::INSERT_AND_TAG:
            replacement_ = std::move(config.text);
            break;
    }
}

std::shared_ptr<const SimpleRedactor> SimpleRedactor::erasing() {
    static const auto instance = std::make_shared<const SimpleRedactor>(Config{.mode = Mode::ERASE});
    return instance;
}

std::shared_ptr<const SimpleRedactor> SimpleRedactor::asterisk() {
    static const auto instance = std::make_shared<const SimpleRedactor>();
    return instance;
}

std::shared_ptr<const SimpleRedactor> SimpleRedactor::with_mode(Mode mode) {
    Config cfg;
    cfg.mode = mode;
    return std::make_shared<const SimpleRedactor>(std::move(cfg));
}

std::shared_ptr<const SimpleRedactor> SimpleRedactor::inserting(std::string text, bool tagged) {
    Config cfg;
    cfg.mode = tagged ? Mode::INSERT_AND_TAG : Mode::INSERT;
    cfg.text = std::move(text);
    return std::make_shared<const SimpleRedactor>(std::move(cfg));
}

void SimpleRedactor::redact(const DataClass& data_class,
                            std::string_view /*value*/,
                            RedactionSink& sink) const {
    switch (mode_) {
        case Mode::ERASE:
            return;

        case Mode::ERASE_AND_TAG:
            write_tagged(data_class, {}, sink);
            return;

        case Mode::MASK:
        case Mode::INSERT:
            sink.write(replacement_);
            return;

        case Mode::MASK_AND_TAG:
        case Mode::INSERT_AND_TAG:
            write_tagged(data_class, replacement_, sink);
            return;
    }
}

bool SimpleRedactor::write_tagged(const DataClass& data_class,
                                  std::string_view body,
                                  RedactionSink& sink) {
    return sink.write("<")
        && sink.write(data_class.taxonomy())
        && sink.write("/")
        && sink.write(data_class.name())
        && sink.write(":")
        && (body.empty() || sink.write(body))
        && sink.write(">");
}

std::optional<size_t> SimpleRedactor::exact_len() const {
    switch (mode_) {
        case Mode::ERASE:
            return 0;
        case Mode::MASK:
        case Mode::INSERT:
            return replacement_.size();
        case Mode::ERASE_AND_TAG:
        case Mode::MASK_AND_TAG:
        case Mode::INSERT_AND_TAG:
            return std::nullopt;   // depends on the class name
    }
    return std::nullopt;
}

std::string SimpleRedactor::kind() const {
    return mode_name(mode_);
}

const char* SimpleRedactor::mode_name(Mode mode) {
    switch (mode) {
        case Mode::ERASE:          return "erase";
        case Mode::ERASE_AND_TAG:  return "erase_and_tag";
        case Mode::MASK:           return "mask";
        case Mode::MASK_AND_TAG:   return "mask_and_tag";
        case Mode::INSERT:         return "insert";
        case Mode::INSERT_AND_TAG: return "insert_and_tag";
    }
    return "unknown";
}

std::optional<SimpleRedactor::Mode> SimpleRedactor::parse_mode(const std::string& name) {
    static const std::unordered_map<std::string, Mode> lookup = {
        {"erase",          Mode::ERASE},
        {"erase_and_tag",  Mode::ERASE_AND_TAG},
        {"mask",           Mode::MASK},
        {"asterisk",       Mode::MASK},
        {"mask_and_tag",   Mode::MASK_AND_TAG},
        {"insert",         Mode::INSERT},
        {"insert_and_tag", Mode::INSERT_AND_TAG},
    };

    const auto it = lookup.find(utils::to_lower(name));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

} // namespace dataprivacy
