#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace Arbor {

/**
 * @brief Thread-safe logging utility shared by the batch pipeline and the query service.
 *
 * Info/Step/Success go to stdout, Warning/Error to stderr. Messages below the
 * process-wide threshold are dropped before taking the lock.
 */
class Logger {
public:
    enum class Level {
        Debug = 0,
        Info,
        Step,
        Success,
        Warning,
        Error
    };

    static void set_level(Level level) {
        threshold().store(level, std::memory_order_relaxed);
    }

    static Level level() {
        return threshold().load(std::memory_order_relaxed);
    }

    static bool enabled(Level level) {
        return static_cast<int>(level) >= static_cast<int>(threshold().load(std::memory_order_relaxed));
    }

    /**
     * @brief Parse "debug", "info", "warning"/"warn", "error" (anything else maps to Info).
     */
    static Level parse_level(std::string_view name) {
        if (name == "debug") return Level::Debug;
        if (name == "warning" || name == "warn") return Level::Warning;
        if (name == "error") return Level::Error;
        return Level::Info;
    }

    static void log(Level level, const std::string& message) {
        if (!enabled(level)) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;90m"; prefix = "... "; break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
        }

        std::ostream& out = (level >= Level::Warning) ? std::cerr : std::cout;
        out << color << prefix << message << "\033[0m" << std::endl;
    }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::atomic<Level>& threshold() {
        static std::atomic<Level> value{Level::Info};
        return value;
    }
};

} // namespace Arbor
