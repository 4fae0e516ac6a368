#pragma once
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <optional>
#include <string_view>

namespace Slipstream {
namespace Log {

enum class Level { TRACE=0, DEBUG, INFO, WARN, ERROR };

inline constexpr std::array<std::string_view, 5> kLevelNames{"trace", "debug", "info", "warn", "error"};

// Lowercase name as used by SLIPSTREAM_LOG and the config file.
inline std::string_view levelName(Level lvl) {
    return kLevelNames[static_cast<size_t>(lvl)];
}

inline std::optional<Level> levelFromName(std::string_view name) {
    for (size_t i = 0; i < kLevelNames.size(); ++i) {
        if (kLevelNames[i] == name) return static_cast<Level>(i);
    }
    return std::nullopt;
}

inline std::atomic<Level>& runtimeLevel() {
    static std::atomic<Level> level = []{
#ifdef NDEBUG
        Level def = Level::INFO;
#else
        Level def = Level::DEBUG;
#endif
        // Unknown values fall back to errors only.
        if(const char* env = std::getenv("SLIPSTREAM_LOG"))
            return levelFromName(env).value_or(Level::ERROR);
        return def;
    }();
    return level;
}

// Config files may lower or raise the level after startup; the env var still wins.
inline void setLevel(Level lvl) {
    if (std::getenv("SLIPSTREAM_LOG")) return;
    runtimeLevel().store(lvl);
}

inline bool enabled(Level lvl) { return lvl >= runtimeLevel().load(std::memory_order_relaxed); }

inline const char* tag(Level lvl) {
    switch(lvl) {
        case Level::TRACE: return "TRACE";
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        default:           return "ERROR";
    }
}

inline std::string_view baseName(std::string_view file) {
    size_t pos = file.find_last_of("/\\");
    return pos == std::string_view::npos ? file : file.substr(pos + 1);
}

// One line per call: [time][LEVEL][category][file:line] message. WARN and above go to stderr.
template<class... Args>
inline void log(Level lvl, std::string_view category, const char* file, int line,
                fmt::format_string<Args...> fmt, Args&&... args) {
    if (!enabled(lvl)) return;
    const auto now = std::chrono::system_clock::now();
    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
    fmt::memory_buffer line_buf;
    fmt::format_to(std::back_inserter(line_buf), "[{:%Y-%m-%d %H:%M:%S}.{:06}][{}][{}][{}:{}] ",
                   std::chrono::floor<std::chrono::seconds>(now), us % 1000000,
                   tag(lvl), category, baseName(file), line);
    fmt::format_to(std::back_inserter(line_buf), fmt, std::forward<Args>(args)...);
    line_buf.push_back('\n');
    std::FILE* out = lvl >= Level::WARN ? stderr : stdout;
    std::fwrite(line_buf.data(), 1, line_buf.size(), out);
}

}
}

#define LOG_IMPL(level, cat, fmt, ...) ::Slipstream::Log::log(::Slipstream::Log::Level::level, cat, __FILE__, __LINE__, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_T(cat, fmt, ...) LOG_IMPL(TRACE, cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_D(cat, fmt, ...) LOG_IMPL(DEBUG, cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_I(cat, fmt, ...) LOG_IMPL(INFO,  cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_W(cat, fmt, ...) LOG_IMPL(WARN,  cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_E(cat, fmt, ...) LOG_IMPL(ERROR, cat, fmt __VA_OPT__(, ) __VA_ARGS__)

// Counters are per call site.
#define LOG_EVERY_N(level, N, cat, fmt, ...) \
    do { static std::atomic<int> LOG_##level##_CNT{0}; if(++LOG_##level##_CNT % (N) == 1 || (N) == 1) LOG_IMPL(level, cat, fmt __VA_OPT__(,) __VA_ARGS__); } while(0)
#define LOG_FIRST_N(level, N, cat, fmt, ...) \
    do { static std::atomic<int> LOG_##level##_FIRST_CNT{0}; if(LOG_##level##_FIRST_CNT.fetch_add(1) < (N)) { LOG_IMPL(level, cat, fmt __VA_OPT__(,) __VA_ARGS__); } } while(0)
