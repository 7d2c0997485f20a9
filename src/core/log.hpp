#pragma once
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

/**
 * @brief Console logger shared by the sensor threads
 *
 * DEBUG and INFO go to std::cout, WARN and ERROR to std::cerr. Each record
 * is written as a single line under a mutex so concurrent update loops
 * never interleave their output. DEBUG records are dropped unless debug
 * output was switched on from the configuration.
 */
class Log {
public:
    enum class Level {
        DEBUG = 0,
        INFO,
        WARN,
        ERROR
    };

    static void set_debug(bool enabled) { debug_enabled().store(enabled); }
    static bool is_debug() { return debug_enabled().load(); }

    static void write(Level level, const std::string& message) {
        if (level == Level::DEBUG && !is_debug()) return;

        std::string line = timestamp() + " " + level_to_string(level) + " " + message;

        std::lock_guard<std::mutex> lock(output_mutex());
        if (level >= Level::WARN) {
            std::cerr << line << std::endl;
        } else {
            std::cout << line << std::endl;
        }
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO: return "INFO";
            case Level::WARN: return "WARN";
            case Level::ERROR: return "ERROR";
            default: return "UNKNOWN";
        }
    }

private:
    static std::atomic<bool>& debug_enabled() {
        static std::atomic<bool> enabled{false};
        return enabled;
    }

    static std::mutex& output_mutex() {
        static std::mutex mtx;
        return mtx;
    }

    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        std::time_t tt = std::chrono::system_clock::to_time_t(now);
        std::tm tm_local{};
        localtime_r(&tt, &tm_local);

        std::ostringstream oss;
        oss << std::put_time(&tm_local, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms;
        return oss.str();
    }
};

namespace detail {
template<typename... Args>
std::string concat(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}
}

template<typename... Args>
void log_debug(Args&&... args) {
    if (!Log::is_debug()) return;
    Log::write(Log::Level::DEBUG, detail::concat(std::forward<Args>(args)...));
}

template<typename... Args>
void log_info(Args&&... args) {
    Log::write(Log::Level::INFO, detail::concat(std::forward<Args>(args)...));
}

template<typename... Args>
void log_warn(Args&&... args) {
    Log::write(Log::Level::WARN, detail::concat(std::forward<Args>(args)...));
}

template<typename... Args>
void log_error(Args&&... args) {
    Log::write(Log::Level::ERROR, detail::concat(std::forward<Args>(args)...));
}
