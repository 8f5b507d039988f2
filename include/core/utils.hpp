#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <type_traits>

namespace rulegate::utils {

// ============================================================================
// Request IDs
// ============================================================================

/// Random RFC 4122 style identifier (version/variant bits not set)
inline std::string generate_uuid() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    const uint64_t a = rng();
    const uint64_t b = rng();
    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
        a >> 32, (a >> 16) & 0xFFFF, a & 0xFFFF,
        b >> 48, b & 0xFFFFFFFFFFFFULL);
}

inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

inline constexpr const char* booltostr(bool x) { return x ? "true" : "false"; }

/// from_chars wrapper; rejects empty input and trailing garbage
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv, int base = 10) {
    T value{};
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(sv.data(), end, value, base);
    if (ec != std::errc{} || sv.empty() || ptr != end) return std::nullopt;
    return value;
}

// ============================================================================
// Strings
// ============================================================================

inline std::string to_lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline std::string to_upper(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

inline bool iequals(std::string_view a, std::string_view b) {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

inline constexpr std::string_view kWhitespace = " \t\r\n";

inline std::string trim(std::string_view s) {
    const auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(kWhitespace);
    return std::string(s.substr(first, last - first + 1));
}

inline bool is_blank(std::string_view s) {
    return s.find_first_not_of(kWhitespace) == std::string_view::npos;
}

/// "/api/" + "v1/x" -> "/api/v1/x"; never doubles or drops the separator
inline std::string join_path(std::string_view base, std::string_view path) {
    while (!base.empty() && base.back() == '/') base.remove_suffix(1);
    std::string joined(base);
    if (path.empty() || path.front() != '/') joined += '/';
    joined += path;
    return joined;
}

/// Stopwatch on the steady clock
class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    template<typename Duration = std::chrono::microseconds>
    [[nodiscard]] Duration elapsed() const {
        return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start_);
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

namespace detail {

inline std::atomic<Level>& threshold() {
    static std::atomic<Level> level{Level::INFO};
    return level;
}

inline constexpr std::string_view level_tag(Level level) {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        case Level::ERROR: return "ERROR";
    }
    return "?";
}

/// One line per call on stderr: "2026-01-02 03:04:05.678 WARN  message"
inline void emit(Level level, std::string_view msg) {
    if (level < threshold().load(std::memory_order_relaxed)) return;

    const auto ts = std::chrono::system_clock::now();
    const auto secs = std::chrono::system_clock::to_time_t(ts);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()).count() % 1000;

    std::tm local{};
    ::localtime_r(&secs, &local);
    char clock[24];
    std::strftime(clock, sizeof(clock), "%Y-%m-%d %H:%M:%S", &local);

    const auto line = std::format("{}.{:03} {:<5} {}\n", clock, millis, level_tag(level), msg);

    static std::mutex sink_mutex;
    std::lock_guard lock(sink_mutex);
    std::cerr << line;
}

} // namespace detail

inline void set_level(Level level) {
    detail::threshold().store(level, std::memory_order_relaxed);
}

/// Case-insensitive "debug", "info", "warn"/"warning", "error"; anything else is INFO
inline Level parse_level(std::string_view name) {
    if (iequals(name, "debug")) return Level::DEBUG;
    if (iequals(name, "warn") || iequals(name, "warning")) return Level::WARN;
    if (iequals(name, "error")) return Level::ERROR;
    return Level::INFO;
}

inline void debug(std::string_view msg) { detail::emit(Level::DEBUG, msg); }
inline void info(std::string_view msg)  { detail::emit(Level::INFO, msg); }
inline void warn(std::string_view msg)  { detail::emit(Level::WARN, msg); }
inline void error(std::string_view msg) { detail::emit(Level::ERROR, msg); }

} // namespace log

} // namespace rulegate::utils
