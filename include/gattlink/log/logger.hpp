#pragma once

#include <mutex>
#include <atomic>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <thread>


namespace gattlink {
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
    Fatal
};

[[nodiscard]]
inline constexpr std::string_view to_string(Level lvl) noexcept {
    switch (lvl) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

// Accepts "trace" | "debug" | "info" | "warn" | "error" | "fatal".
// Anything else maps to Info.
[[nodiscard]]
inline Level parse_level(std::string_view name) noexcept {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    return Level::Info;
}

// ---------------------------------------------------------
// Thread-safe global logger
//
// Session callbacks arrive on the transport worker and on the
// timer thread, so every line carries the emitting thread id.
// ---------------------------------------------------------
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }

    Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept { return lvl >= level(); }

    void enable_color(bool on) noexcept { color_enabled_ = on; }

    // Thread-safe sink setter (stderr by default)
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os;
    }

    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        if (color_enabled_) os << color_code(lvl);
        os << timestamp() << " [" << to_string(lvl) << "] <" << std::this_thread::get_id() << "> " << msg;
        if (color_enabled_) os << "\033[0m";
        os << std::endl;
    }

private:
    Logger()
        : out_(&std::cerr),
          level_(Level::Info),
          color_enabled_(false)
    {}

    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";
            case Level::Debug: return "\033[36m";
            case Level::Info:  return "\033[32m";
            case Level::Warn:  return "\033[33m";
            case Level::Error: return "\033[31m";
            case Level::Fatal: return "\033[1;31m";
        }
        return "\033[0m";
    }

    // Wall clock with millisecond resolution
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

inline void set_level(std::string_view name) noexcept {
    Logger::instance().set_level(parse_level(name));
}

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
// ---------------------------------------------------------
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}

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
} // namespace gattlink


// ---------------------------------------------------------
// Macros
//
// The level check happens before the message is formatted,
// so disabled trace lines cost one comparison.
// ---------------------------------------------------------
#define GL_LOG_LEVEL(lvl) \
    if (!::gattlink::log::Logger::instance().enabled((lvl))) {} else ::gattlink::log::LogStream((lvl))

#define GL_TRACE(msg)  GL_LOG_LEVEL(::gattlink::log::Level::Trace) << msg
#define GL_DEBUG(msg)  GL_LOG_LEVEL(::gattlink::log::Level::Debug) << msg
#define GL_INFO(msg)   GL_LOG_LEVEL(::gattlink::log::Level::Info)  << msg
#define GL_WARN(msg)   GL_LOG_LEVEL(::gattlink::log::Level::Warn)  << msg
#define GL_ERROR(msg)  GL_LOG_LEVEL(::gattlink::log::Level::Error) << msg
#define GL_FATAL(msg)  GL_LOG_LEVEL(::gattlink::log::Level::Fatal) << msg
