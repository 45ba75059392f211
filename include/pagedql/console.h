#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pagedql/console.h — Leveled console logging with colors
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    console::setLevel(console::Level::Debug);
//    console::debug("content query:", sql);
//    console::warn("ignoring hint", name);
//
//  Output goes to stdout (log/info/success/debug) and stderr
//  (warn/error) unless a stream is installed with setStream().
//
// ═══════════════════════════════════════════════════════════════════

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace pagedql::console {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

namespace detail {

// ANSI color codes
struct Colors {
    static constexpr const char* Reset   = "\033[0m";
    static constexpr const char* Red     = "\033[31m";
    static constexpr const char* Yellow  = "\033[33m";
    static constexpr const char* Blue    = "\033[34m";
    static constexpr const char* Cyan    = "\033[36m";
    static constexpr const char* Green   = "\033[32m";
    static constexpr const char* Gray    = "\033[90m";
};

inline std::atomic<Level>& threshold() {
    static std::atomic<Level> level{Level::Info};
    return level;
}

inline std::atomic<std::ostream*>& sink() {
    static std::atomic<std::ostream*> os{nullptr};
    return os;
}

inline std::mutex& writeMutex() {
    static std::mutex m;
    return m;
}

template <typename T>
std::string stringify(const T& arg) {
    if constexpr (std::is_same_v<T, nlohmann::json> || std::is_same_v<T, nlohmann::ordered_json>) {
        return arg.dump();
    } else if constexpr (std::is_convertible_v<T, std::string_view>) {
        return std::string(std::string_view(arg));
    } else if constexpr (std::is_same_v<std::decay_t<T>, bool>) {
        return arg ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        if constexpr (std::is_floating_point_v<T>) {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        }
        return std::to_string(arg);
    } else if constexpr (requires { nlohmann::json(arg).dump(); }) {
        return nlohmann::json(arg).dump();
    } else {
        std::ostringstream oss;
        oss << arg;
        return oss.str();
    }
}

inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

template <typename... Args>
void print(Level level, std::ostream& fallback, const char* color, const char* prefix,
           const Args&... args) {
    if (level < threshold().load()) return;

    std::ostringstream line;
    line << Colors::Gray << "[" << timestamp() << "] "
         << color << prefix << Colors::Reset;

    bool first = true;
    auto printOne = [&](const auto& arg) {
        if (!first) line << " ";
        first = false;
        line << stringify(arg);
    };
    (printOne(args), ...);
    line << '\n';

    std::ostream* os = sink().load();
    std::lock_guard<std::mutex> lock(writeMutex());
    (os ? *os : fallback) << line.str() << std::flush;
}

} // namespace detail

// ── Threshold: messages below it are dropped ──
inline void setLevel(Level level) { detail::threshold().store(level); }
inline Level level() { return detail::threshold().load(); }
inline bool enabled(Level l) { return l >= detail::threshold().load(); }

// ── Redirect all output (nullptr restores stdout/stderr) ──
inline void setStream(std::ostream* os) { detail::sink().store(os); }

template <typename... Args>
void log(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Reset, "", args...);
}

template <typename... Args>
void info(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Blue, "ℹ ", args...);
}

template <typename... Args>
void warn(const Args&... args) {
    detail::print(Level::Warn, std::cerr, detail::Colors::Yellow, "⚠ ", args...);
}

template <typename... Args>
void error(const Args&... args) {
    detail::print(Level::Error, std::cerr, detail::Colors::Red, "✖ ", args...);
}

template <typename... Args>
void success(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Green, "✔ ", args...);
}

template <typename... Args>
void debug(const Args&... args) {
    detail::print(Level::Debug, std::cout, detail::Colors::Cyan, "● ", args...);
}

// ── console::time / console::timeEnd ──
namespace detail {
    inline std::unordered_map<std::string, std::chrono::steady_clock::time_point>& timers() {
        static std::unordered_map<std::string, std::chrono::steady_clock::time_point> t;
        return t;
    }
    inline std::mutex& timersMutex() {
        static std::mutex m;
        return m;
    }
}

inline void time(const std::string& label) {
    std::lock_guard<std::mutex> lock(detail::timersMutex());
    detail::timers()[label] = std::chrono::steady_clock::now();
}

// Logs at debug level; returns elapsed milliseconds (negative if unknown label)
inline double timeEnd(const std::string& label) {
    std::chrono::steady_clock::time_point start;
    {
        std::lock_guard<std::mutex> lock(detail::timersMutex());
        auto it = detail::timers().find(label);
        if (it == detail::timers().end()) {
            warn("Timer '" + label + "' does not exist");
            return -1.0;
        }
        start = it->second;
        detail::timers().erase(it);
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    auto ms = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0;
    debug(label + ":", std::to_string(ms) + "ms");
    return ms;
}

} // namespace pagedql::console
