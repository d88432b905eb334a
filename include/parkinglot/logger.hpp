#pragma once

#include <atomic>
#include <cstdio>
#include <mutex>

#include "parkinglot/config.hpp"

namespace parkinglot {
namespace Logger {

    namespace detail {
        constexpr const char *names[] = {"DEBUG", "INFO ", "WARN ", "ERROR", "OFF  "};

        inline std::atomic<int> minLevel{static_cast<int>(Config::Logging::DEFAULT_LEVEL)};
        inline std::atomic<FILE *> output{nullptr};
        inline std::mutex writeMutex;

        template<typename... Args>
        void log(LogLevel level, const char *tag, const char *message, Args... args) {
            if (static_cast<int>(level) < minLevel.load()) {
                return;
            }

            constexpr int capacity = 512;
            char buf[capacity];
            auto clamp = [](int written) {
                return written < 0 ? 0 : (written > capacity - 2 ? capacity - 2 : written);
            };

            int n = clamp(snprintf(buf, capacity, "[%s] [%s] ", names[static_cast<int>(level)], tag));
            if constexpr (sizeof...(Args) == 0) {
                n = clamp(n + snprintf(buf + n, capacity - n, "%s", message));
            } else {
                n = clamp(n + snprintf(buf + n, capacity - n, message, args...));
            }
            buf[n++] = '\n';
            buf[n] = '\0';

            FILE *out = output.load();
            std::lock_guard<std::mutex> lock(writeMutex);
            fputs(buf, out != nullptr ? out : stderr);
        }
    }

    /** Drop every message below the given level. */
    inline void setLevel(LogLevel level) {
        detail::minLevel.store(static_cast<int>(level));
    }

    inline LogLevel level() {
        return static_cast<LogLevel>(detail::minLevel.load());
    }

    /** Redirect log lines; nullptr restores stderr. */
    inline void setOutput(FILE *out) {
        detail::output.store(out);
    }

    template<typename... Args>
    void debug(const char *tag, const char *message, Args... args) {
        detail::log(LogLevel::DEBUG, tag, message, args...);
    }

    template<typename... Args>
    void info(const char *tag, const char *message, Args... args) {
        detail::log(LogLevel::INFO, tag, message, args...);
    }

    template<typename... Args>
    void warn(const char *tag, const char *message, Args... args) {
        detail::log(LogLevel::WARN, tag, message, args...);
    }

    template<typename... Args>
    void error(const char *tag, const char *message, Args... args) {
        detail::log(LogLevel::ERROR, tag, message, args...);
    }

} // namespace Logger
} // namespace parkinglot
