#pragma once
#include <string>

namespace gltf2mesh {

    enum class LogLevel {
        Debug = 0,
        Info,
        Warn,
        Error
    };

    class Logger {
    public:
        static void debug(const std::string& message);
        static void info(const std::string& message);
        static void warn(const std::string& message);
        static void error(const std::string& message);

        // I messaggi sotto questa soglia vengono scartati
        static void setLevel(LogLevel level);
        static LogLevel level();

        static LogLevel parseLevel(const std::string& name);
    };

} // namespace gltf2mesh
