#include "telemetry/log_record.hpp"

#include <mutex>

namespace dataprivacy {

namespace {

std::mutex& engine_mutex() {
    static std::mutex m;
    return m;
}

std::shared_ptr<const RedactionEngine>& engine_slot() {
    static std::shared_ptr<const RedactionEngine> engine;
    return engine;
}

} // anonymous namespace

void set_redaction_engine_for_logging(std::shared_ptr<const RedactionEngine> engine) {
    std::lock_guard<std::mutex> lock(engine_mutex());
    engine_slot() = std::move(engine);
}

std::shared_ptr<const RedactionEngine> redaction_engine_for_logging() {
    std::lock_guard<std::mutex> lock(engine_mutex());
    return engine_slot();
}

LogRecord::LogRecord() : engine_(redaction_engine_for_logging()) {}

LogRecord::LogRecord(std::shared_ptr<const RedactionEngine> engine)
    : engine_(std::move(engine)) {}

std::string LogRecord::to_string() const {
    std::string line;
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (i > 0) line += ", ";
        line += fields_[i].name;
        line += '=';
        line += fields_[i].rendered;
    }
    return line;
}

void LogRecord::emit(utils::log::Level level) const {
    utils::log::write(level, to_string());
}

} // namespace dataprivacy
