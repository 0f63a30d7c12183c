#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

// Structured engine log entry. Kinds are stable identifiers such as "ResponseWindowOpened".
struct LogEntry {
    std::string kind;
    spdlog::level::level_enum level = spdlog::level::info;
    std::string message;
    std::map<std::string, std::string> data;
};

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void log(const LogEntry& entry) = 0;
};

// Writes entries through an spdlog logger (the default logger when none is given).
class SpdlogLogSink : public LogSink {
public:
    explicit SpdlogLogSink(std::shared_ptr<spdlog::logger> logger = nullptr);
    void log(const LogEntry& entry) override;

private:
    std::shared_ptr<spdlog::logger> logger;
};

// Keeps every entry; used by tests and replays.
class MemoryLogSink : public LogSink {
public:
    std::vector<LogEntry> entries;

    void log(const LogEntry& entry) override;

    size_t count(const std::string& kind) const;
    const LogEntry* last(const std::string& kind) const;
};

// No-op when sink is null.
void emitLog(LogSink* sink, LogEntry entry);
