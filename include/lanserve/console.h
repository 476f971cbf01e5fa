#pragma once
// ═══════════════════════════════════════════════════════════════════
//  lanserve/console.h — Timestamped, coloured, thread-safe logging
// ═══════════════════════════════════════════════════════════════════
//
//  console::info("Serving", path);
//  console::warn("Download interrupted from", ip, ":", e.what());
//
//  Every line is prefixed with [HH:MM:SS.mmm]. Lines written from
//  concurrent transfer threads never interleave.
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
#include <nlohmann/json.hpp>

namespace lanserve::console {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Silent = 4 };

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

inline std::mutex& outputMutex() {
    static std::mutex m;
    return m;
}

inline std::atomic<Level>& threshold() {
    static std::atomic<Level> level{Level::Info};
    return level;
}

// Stringify a single argument
template <typename T>
std::string stringify(const T& arg) {
    if constexpr (std::is_convertible_v<T, std::string_view>) {
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
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

template <typename... Args>
void print(Level level, std::ostream& os, const char* color, const char* prefix,
           const Args&... args) {
    if (level < threshold().load(std::memory_order_relaxed)) return;

    // Format outside the lock, write under it
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

    std::lock_guard<std::mutex> lock(outputMutex());
    os << line.str() << std::flush;
}

} // namespace detail

// ── Minimum level that is printed (default: Info) ──
inline void setLevel(Level level) {
    detail::threshold().store(level);
}

inline Level level() {
    return detail::threshold().load();
}

// ── console::log ──
template <typename... Args>
void log(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Reset, "", args...);
}

// ── console::info ──
template <typename... Args>
void info(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Blue, "ℹ ", args...);
}

// ── console::warn ──
template <typename... Args>
void warn(const Args&... args) {
    detail::print(Level::Warn, std::cerr, detail::Colors::Yellow, "⚠ ", args...);
}

// ── console::error ──
template <typename... Args>
void error(const Args&... args) {
    detail::print(Level::Error, std::cerr, detail::Colors::Red, "✖ ", args...);
}

// ── console::success ──
template <typename... Args>
void success(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Green, "✔ ", args...);
}

// ── console::debug ──
template <typename... Args>
void debug(const Args&... args) {
    detail::print(Level::Debug, std::cout, detail::Colors::Cyan, "● ", args...);
}

} // namespace lanserve::console
