#include "gltf2mesh/Logger.hpp"
#include <iostream>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <atomic>
#include <stdexcept>

namespace gltf2mesh {

    namespace {
        std::mutex logMutex;
        std::atomic<int> minLevel{static_cast<int>(LogLevel::Info)};

        std::string timestamp() {
            auto now = std::chrono::system_clock::now();
            auto in_time = std::chrono::system_clock::to_time_t(now);
            std::tm local{};
            localtime_r(&in_time, &local);
            std::ostringstream ss;
            ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
            return ss.str();
        }

        void log(LogLevel level, const char* tag, const std::string& message) {
            if (static_cast<int>(level) < minLevel.load()) {
                return;
            }
            // I task di caricamento girano in parallelo: una riga alla volta
            std::lock_guard<std::mutex> lock(logMutex);
            std::cerr << "[" << timestamp() << "] [" << tag << "] " << message << std::endl;
        }
    }

    void Logger::debug(const std::string& message) {
        log(LogLevel::Debug, "DEBUG", message);
    }

    void Logger::info(const std::string& message) {
        log(LogLevel::Info, "INFO", message);
    }

    void Logger::warn(const std::string& message) {
        log(LogLevel::Warn, "WARN", message);
    }

    void Logger::error(const std::string& message) {
        log(LogLevel::Error, "ERROR", message);
    }

    void Logger::setLevel(LogLevel level) {
        minLevel.store(static_cast<int>(level));
    }

    LogLevel Logger::level() {
        return static_cast<LogLevel>(minLevel.load());
    }

    LogLevel Logger::parseLevel(const std::string& name) {
        if (name == "debug") return LogLevel::Debug;
        if (name == "info") return LogLevel::Info;
        if (name == "warn") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        throw std::runtime_error("Unknown log level: " + name);
    }

} // namespace gltf2mesh
