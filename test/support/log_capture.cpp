#include "support/log_capture.hpp"
#include <main/utils/logger.hpp>
#include <cstdio>

namespace {
    std::vector<std::string>& storage() {
        static std::vector<std::string> s_lines;
        return s_lines;
    }

    const char* levelLetter(LogLevel level) {
        switch (level) {
            case LogLevel::ERROR: return "E";
            case LogLevel::WARN:  return "W";
            case LogLevel::INFO:  return "I";
            case LogLevel::DEBUG: return "D";
        }
        return "I";
    }
}

void Logger::setEspLogLevel(const char* tag, LogLevel level) {
    (void)tag;
    (void)level;
}

void Logger::emit(LogLevel level, const char* tag, const char* message) {
    std::string line = std::string(tag) + ": " + message;
    storage().push_back(line);
    std::printf("%s (%s) %s\n", levelLetter(level), tag, message);
}

namespace LogCapture {
    const std::vector<std::string>& lines() {
        return storage();
    }

    void clear() {
        storage().clear();
    }

    bool contains(const std::string& needle) {
        return count(needle) > 0;
    }

    std::size_t count(const std::string& needle) {
        std::size_t n = 0;
        for (const std::string& line : storage()) {
            if (line.find(needle) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }
}
