#include "logger.hpp"
#include <iostream>

namespace g1 {

std::string_view to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

void ConsoleLogger::log(LogLevel level, std::string_view component, std::string_view message) {
    if (level < min_level_) return;

    if (level >= LogLevel::Warning) {
        std::cerr << component << ": " << message << std::endl;
    } else {
        std::cout << component << ": " << message << std::endl;
    }
}

} // namespace g1
