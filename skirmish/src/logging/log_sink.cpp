// log_sink.cpp
#include "log_sink.h"

#include <algorithm>

SpdlogLogSink::SpdlogLogSink(std::shared_ptr<spdlog::logger> logger) : logger(std::move(logger)) {}

void SpdlogLogSink::log(const LogEntry& entry) {
    std::string data;
    for (const auto& [key, value] : entry.data) {
        data += " " + key + "=" + value;
    }
    spdlog::logger* target = logger ? logger.get() : spdlog::default_logger_raw();
    target->log(entry.level, "[{}] {}{}", entry.kind, entry.message, data);
}

void MemoryLogSink::log(const LogEntry& entry) {
    entries.push_back(entry);
}

size_t MemoryLogSink::count(const std::string& kind) const {
    return std::count_if(entries.begin(), entries.end(), [&kind](const LogEntry& entry) { return entry.kind == kind; });
}

const LogEntry* MemoryLogSink::last(const std::string& kind) const {
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        if (it->kind == kind) {
            return &*it;
        }
    }
    return nullptr;
}

void emitLog(LogSink* sink, LogEntry entry) {
    if (sink) {
        sink->log(entry);
    }
}
