#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace g1 {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
};

std::string_view to_string(LogLevel level);

// Log sink injected into the connector components
class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, std::string_view component, std::string_view message) = 0;

    void debug(std::string_view component, std::string_view message) {
        log(LogLevel::Debug, component, message);
    }
    void info(std::string_view component, std::string_view message) {
        log(LogLevel::Info, component, message);
    }
    void warning(std::string_view component, std::string_view message) {
        log(LogLevel::Warning, component, message);
    }
    void error(std::string_view component, std::string_view message) {
        log(LogLevel::Error, component, message);
    }
};

// Writes "component: message" lines, debug/info to stdout, warning/error to stderr
class ConsoleLogger : public Logger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info) : min_level_(min_level) {}

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel min_level() const { return min_level_; }

    void log(LogLevel level, std::string_view component, std::string_view message) override;

private:
    LogLevel min_level_;
};

} // namespace g1
