#pragma once

#include <mutex>
#include <cstdint>
#include <ctime>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>
#include <optional>

namespace lcr {
namespace log {

// ---------------------------------------------------------
// Log level
// ---------------------------------------------------------
enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off
};

// Human-readable severity names
[[nodiscard]]
inline constexpr std::string_view to_string(Level lvl) noexcept {
    switch (lvl) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
        case Level::Off:   return "OFF";
    }
    return "?????";
}

// Maps a command-line spelling ("trace", "debug", ...) to a level.
[[nodiscard]]
inline std::optional<Level> parse_level(std::string_view text) noexcept {
    if (text == "trace") return Level::Trace;
    if (text == "debug") return Level::Debug;
    if (text == "info")  return Level::Info;
    if (text == "warn")  return Level::Warn;
    if (text == "error") return Level::Error;
    if (text == "fatal") return Level::Fatal;
    if (text == "off")   return Level::Off;
    return std::nullopt;
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = lvl;
    }

    [[nodiscard]]
    Level level() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept {
        return lvl != Level::Off && lvl >= level();
    }

    // Enable or disable colored output
    void enable_color(bool on) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        color_enabled_ = on;
    }

    // Thread-safe sink setter (stderr by default, stdout is left to the program output)
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os ? os : &std::cerr;
    }

    // ---------------------------------------------------------
    // Core logging function (thread-safe)
    // ---------------------------------------------------------
    void log(Level lvl, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lvl == Level::Off || lvl < level_) return;
        auto& os = *out_;
        if (color_enabled_) os << color_code_(lvl);
        os << timestamp_() << " [" << to_string(lvl) << "] " << msg;
        if (color_enabled_) os << "\033[0m"; // reset
        os << '\n';
        if (lvl >= Level::Warn) os.flush();
    }

private:
    Logger()
        : out_(&std::cerr)
        , level_(Level::Info)
        , color_enabled_(false)
    {}

    // ANSI color mappings
    static constexpr const char* color_code_(Level lvl) noexcept {
        switch (lvl) {
            case Level::Trace: return "\033[37m";     // light gray
            case Level::Debug: return "\033[36m";     // cyan
            case Level::Info:  return "\033[32m";     // green
            case Level::Warn:  return "\033[33m";     // yellow
            case Level::Error: return "\033[31m";     // red
            case Level::Fatal: return "\033[1;31m";   // bold bright red
            default:           return "\033[0m";
        }
    }

    // Wall-clock timestamp with millisecond resolution
    static std::string timestamp_() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto t = system_clock::to_time_t(now);
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
    #ifdef _WIN32
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        char out[40];
        std::snprintf(out, sizeof(out), "%s.%03d", buf, static_cast<int>(ms));
        return out;
    }

private:
    std::ostream* out_;
    Level level_;
    bool color_enabled_;
    mutable std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
// ---------------------------------------------------------
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

    ~LogStream() {
        Logger::instance().log(lvl_, ss_.str());
    }

private:
    Level lvl_;
    std::ostringstream ss_;
};

} // namespace log
} // namespace lcr


// ---------------------------------------------------------
// Macros for easy logging
// ---------------------------------------------------------
// The level check happens before the message is formatted, so disabled
// levels cost a single lock-protected load.
#define WC_LOG_LEVEL(lvl) \
    if (!::lcr::log::Logger::instance().enabled((lvl))) {} else ::lcr::log::LogStream((lvl))

#define WC_TRACE(msg)  WC_LOG_LEVEL(::lcr::log::Level::Trace) << msg
#define WC_DEBUG(msg)  WC_LOG_LEVEL(::lcr::log::Level::Debug) << msg
#define WC_INFO(msg)   WC_LOG_LEVEL(::lcr::log::Level::Info)  << msg
#define WC_WARN(msg)   WC_LOG_LEVEL(::lcr::log::Level::Warn)  << msg
#define WC_ERROR(msg)  WC_LOG_LEVEL(::lcr::log::Level::Error) << msg
#define WC_FATAL(msg)  WC_LOG_LEVEL(::lcr::log::Level::Fatal) << msg
