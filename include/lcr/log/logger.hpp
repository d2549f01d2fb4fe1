#pragma once

#include <mutex>
#include <atomic>
#include <cstdint>
#include <ctime>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>

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

// CLI-friendly level names: trace | debug | info | warn | error | fatal | off
// Unknown names fall back to Info.
[[nodiscard]]
inline constexpr Level parse_level(std::string_view name) noexcept {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    if (name == "off")   return Level::Off;
    return Level::Info;
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

    void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }

    [[nodiscard]]
    Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    // Cheap pre-check used by the AW_* macros so disabled levels never format
    [[nodiscard]]
    bool enabled(Level lvl) const noexcept {
        return lvl != Level::Off && lvl >= level();
    }

    // Enable or disable colored output
    void enable_color(bool on) noexcept { color_enabled_ = on; }

    // Thread-safe sink setter (stdout by default, nullptr restores stdout)
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os ? os : &std::cout;
    }

    // ---------------------------------------------------------
    // Core logging function (thread-safe)
    // ---------------------------------------------------------
    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        if (color_enabled_) os << color_code(lvl);
        os << timestamp() << " [" << to_string(lvl) << "] " << msg;
        if (color_enabled_) os << "\033[0m"; // reset
        os << std::endl;
    }

private:
    Logger()
        : out_(&std::cout),
          level_(Level::Info),
          color_enabled_(true)
    {}

    // ANSI color mappings
    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";     // light gray
            case Level::Debug: return "\033[36m";     // cyan
            case Level::Info:  return "\033[32m";     // green
            case Level::Warn:  return "\033[33m";     // yellow
            case Level::Error: return "\033[31m";     // red
            case Level::Fatal: return "\033[1;31m";   // bold bright red
            default:           break;
        }
        return "\033[0m";
    }

    // Timestamp generation (local time, millisecond resolution)
    static std::string timestamp() {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto t = system_clock::to_time_t(now);
        auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
    #ifdef _WIN32
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[64];
        std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
        return buf;
    }

private:
    std::ostream* out_;
    std::atomic<Level> level_;
    bool color_enabled_;
    std::mutex mutex_;
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
// The if/else form keeps the macro safe inside unbraced if statements
// and skips message formatting when the level is disabled.
// ---------------------------------------------------------
#define AW_LOG_LEVEL(lvl) \
    if (!::lcr::log::Logger::instance().enabled((lvl))) {} else ::lcr::log::LogStream((lvl))

#define AW_TRACE(msg)  AW_LOG_LEVEL(::lcr::log::Level::Trace) << msg
#define AW_DEBUG(msg)  AW_LOG_LEVEL(::lcr::log::Level::Debug) << msg
#define AW_INFO(msg)   AW_LOG_LEVEL(::lcr::log::Level::Info)  << msg
#define AW_WARN(msg)   AW_LOG_LEVEL(::lcr::log::Level::Warn)  << msg
#define AW_ERROR(msg)  AW_LOG_LEVEL(::lcr::log::Level::Error) << msg
#define AW_FATAL(msg)  AW_LOG_LEVEL(::lcr::log::Level::Fatal) << msg
