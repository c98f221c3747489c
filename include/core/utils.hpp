#pragma once

#include <array>
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
#include <vector>

namespace sqlgate::utils {

// ============================================================================
// ID Generation
// ============================================================================

inline std::string generate_uuid() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    const uint64_t high = dis(gen);
    const uint64_t low = dis(gen);

    // RFC 4122 version 4 / variant 1 bits
    return std::format("{:08x}-{:04x}-4{:03x}-{:04x}-{:012x}",
        static_cast<uint32_t>(high >> 32),
        static_cast<uint16_t>((high >> 16) & 0xFFFF),
        static_cast<uint16_t>(high & 0x0FFF),
        static_cast<uint16_t>(((low >> 48) & 0x3FFF) | 0x8000),
        low & 0xFFFFFFFFFFFF);
}

// ============================================================================
// Time Utilities
// ============================================================================

/// ISO-8601 UTC, millisecond precision: 2024-03-01T12:00:00.123Z
inline std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    const auto time = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    ::gmtime_r(&time, &tm_buf);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    return std::format("{}.{:03d}Z", time_buf, static_cast<int>(ms.count()));
}

inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

/// "12ms" - the duration rendering used in response bodies and outcome records
inline std::string format_millis(int64_t millis) {
    return std::format("{}ms", millis);
}

// ============================================================================
// Numeric Parsing (std::from_chars, no exceptions or locale)
// ============================================================================

// Parse integer, returns std::nullopt on failure or trailing garbage
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string trim(const std::string& str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

inline std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

// ============================================================================
// Timer
// ============================================================================

/// Wall time since construction, on the steady clock
class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    std::chrono::milliseconds elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_);
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (thread-safe, stderr, level-filtered)
// ============================================================================

namespace log {

enum class Level : uint8_t { INFO = 0, WARN = 1, ERROR = 2 };

/// "info" / "warn" / "error" (case-insensitive)
[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) {
    const auto lowered = to_lower(name);
    if (lowered == "info") return Level::INFO;
    if (lowered == "warn" || lowered == "warning") return Level::WARN;
    if (lowered == "error") return Level::ERROR;
    return std::nullopt;
}

namespace detail {
    inline std::atomic<uint8_t>& min_level() {
        static std::atomic<uint8_t> level{0};
        return level;
    }

    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline void write(Level level, std::string_view msg) {
        if (static_cast<uint8_t>(level) < min_level().load(std::memory_order_relaxed)) {
            return;
        }
        static constexpr std::array<std::string_view, 3> kTags = {"INFO ", "WARN ", "ERROR"};
        const auto line = std::format("{} [{}] {}\n",
            format_timestamp(now()), kTags[static_cast<size_t>(level)], msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << line;
    }
} // namespace detail

/// Messages below this level are dropped. Default: INFO.
inline void set_level(Level level) {
    detail::min_level().store(static_cast<uint8_t>(level), std::memory_order_relaxed);
}

inline void info(std::string_view msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(std::string_view msg) {
    detail::write(Level::WARN, msg);
}

inline void error(std::string_view msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace sqlgate::utils
