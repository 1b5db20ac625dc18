#include <main/utils/logger.hpp>
#include <esp_log.h>

namespace {
    static esp_log_level_t toEspLevel(LogLevel level) {
        switch (level) {
            case LogLevel::ERROR: return ESP_LOG_ERROR;
            case LogLevel::WARN:  return ESP_LOG_WARN;
            case LogLevel::INFO:  return ESP_LOG_INFO;
            case LogLevel::DEBUG: return ESP_LOG_DEBUG;
        }
        return ESP_LOG_INFO;
    }
}

void Logger::setEspLogLevel(const char* tag, LogLevel level) {
    esp_log_level_set(tag, toEspLevel(level));
}

void Logger::emit(LogLevel level, const char* tag, const char* message) {
    switch (level) {
        case LogLevel::ERROR: ESP_LOGE(tag, "%s", message); break;
        case LogLevel::WARN:  ESP_LOGW(tag, "%s", message); break;
        case LogLevel::INFO:  ESP_LOGI(tag, "%s", message); break;
        case LogLevel::DEBUG: ESP_LOGD(tag, "%s", message); break;
        default:              ESP_LOGI(tag, "%s", message); break;
    }
}
