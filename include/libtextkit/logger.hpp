#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <format>
#include <string_view>
#include <utility>

#ifndef _WIN32
#include <syslog.h>
#endif

// NOLINTBEGIN

namespace textkit {

// Log levels - higher value = more verbose
enum class LogLevel : uint8_t { NONE = 0, ERROR = 1, WARN = 2, INFO = 3, DEBUG = 4, TRACE = 5 };

enum class LogBackend { STDOUT, SYSLOG };

enum class LogFormat {
    TEXT, // [timestamp] [LEVEL] message
    JSON  // one JSON object per line
};

#ifdef NDEBUG
#ifndef ENABLE_TRACE_LOGS
#define ENABLE_TRACE_LOGS 0
#endif
#ifndef ENABLE_DEBUG_LOGS
#define ENABLE_DEBUG_LOGS 0
#endif
#else
#ifndef ENABLE_TRACE_LOGS
#define ENABLE_TRACE_LOGS 1
#endif
#ifndef ENABLE_DEBUG_LOGS
#define ENABLE_DEBUG_LOGS 1
#endif
#endif

namespace detail {

constexpr size_t TIMESTAMP_BUFFER_SIZE = 64;
constexpr size_t MAX_LOG_MESSAGE_SIZE = 4096;

inline thread_local char timestamp_buffer[TIMESTAMP_BUFFER_SIZE];

// ISO 8601, UTC, millisecond precision
inline void format_timestamp(char* buffer, size_t buffer_size) {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    struct tm timeinfo;
#ifdef _WIN32
    gmtime_s(&timeinfo, &seconds);
#else
    gmtime_r(&seconds, &timeinfo);
#endif

    auto result = std::format_to_n(
        buffer, buffer_size - 1, "{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
        timeinfo.tm_year + 1900, timeinfo.tm_mon + 1, timeinfo.tm_mday, timeinfo.tm_hour,
        timeinfo.tm_min, timeinfo.tm_sec, static_cast<int>(ms.count()));
    *result.out = '\0';
}

inline constexpr const char* level_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::WARN:
            return "WARN";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::TRACE:
            return "TRACE";
        default:
            return "UNKNOWN";
    }
}

inline constexpr const char* level_string_lower(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR:
            return "error";
        case LogLevel::WARN:
            return "warn";
        case LogLevel::INFO:
            return "info";
        case LogLevel::DEBUG:
            return "debug";
        case LogLevel::TRACE:
            return "trace";
        default:
            return "unknown";
    }
}

inline constexpr int syslog_priority(LogLevel level) {
#ifdef _WIN32
    switch (level) {
        case LogLevel::ERROR:
            return 3;
        case LogLevel::WARN:
            return 4;
        case LogLevel::DEBUG:
        case LogLevel::TRACE:
            return 7;
        default:
            return 6;
    }
#else
    switch (level) {
        case LogLevel::ERROR:
            return LOG_ERR;
        case LogLevel::WARN:
            return LOG_WARNING;
        case LogLevel::DEBUG:
        case LogLevel::TRACE:
            return LOG_DEBUG;
        default:
            return LOG_INFO;
    }
#endif
}

// Appends `input` to `output` with JSON string escaping; stops when full
inline void json_escape(std::string_view input, char* output, size_t& offset, size_t max_size) {
    for (char c : input) {
        if (offset + 7 >= max_size) {
            break;
        }
        switch (c) {
            case '"':
                output[offset++] = '\\';
                output[offset++] = '"';
                break;
            case '\\':
                output[offset++] = '\\';
                output[offset++] = '\\';
                break;
            case '\n':
                output[offset++] = '\\';
                output[offset++] = 'n';
                break;
            case '\r':
                output[offset++] = '\\';
                output[offset++] = 'r';
                break;
            case '\t':
                output[offset++] = '\\';
                output[offset++] = 't';
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    auto result = std::format_to_n(output + offset, max_size - offset,
                                                   "\\u{:04x}", static_cast<unsigned char>(c));
                    offset += result.size;
                } else {
                    output[offset++] = c;
                }
                break;
        }
    }
}

template <typename Formatter>
inline void format_json(LogLevel level, const char* timestamp, const Formatter& formatter,
                        char* buffer, size_t buffer_size, size_t& offset) {
    offset = 0;
    auto head = std::format_to_n(buffer, buffer_size - 1,
                                 R"({{"timestamp":"{}","level":"{}","message":")", timestamp,
                                 level_string_lower(level));
    offset += head.size;

    char raw[MAX_LOG_MESSAGE_SIZE];
    size_t raw_offset = 0;
    formatter(raw, sizeof(raw), raw_offset);

    json_escape(std::string_view(raw, raw_offset), buffer, offset, buffer_size - 2);

    auto tail = std::format_to_n(buffer + offset, buffer_size - offset - 1, "\"}}");
    offset += tail.size;
}

template <typename Formatter>
inline void format_text(LogLevel level, const char* timestamp, const Formatter& formatter,
                        char* buffer, size_t buffer_size, size_t& offset) {
    offset = 0;
    auto result = std::format_to_n(buffer, buffer_size - 1, "[{}] [{}] ", timestamp,
                                   level_string(level));
    offset += result.size;
    formatter(buffer, buffer_size - 1, offset);
}

} // namespace detail

// Process-wide logger. Configure once with initialize() before logging from
// multiple threads; log() itself only reads configuration.
class Logger {
  public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void initialize(LogLevel level = LogLevel::INFO, LogBackend backend = LogBackend::STDOUT,
                    LogFormat format = LogFormat::TEXT, const char* ident = "libtextkit") {
#ifndef _WIN32
        if (backend_ == LogBackend::SYSLOG) {
            closelog();
        }
#endif
        level_ = level;
        backend_ = backend;
        format_ = format;
        ident_ = ident;

        if (backend_ == LogBackend::SYSLOG) {
#ifdef _WIN32
            backend_ = LogBackend::STDOUT;
#else
            openlog(ident_, LOG_PID | LOG_CONS, LOG_USER);
#endif
        }
    }

    void set_level(LogLevel level) {
        level_ = level;
    }

    LogLevel get_level() const {
        return level_;
    }

    // STDOUT when SYSLOG was requested on a platform without syslog
    LogBackend get_backend() const {
        return backend_;
    }

    LogFormat get_format() const {
        return format_;
    }

    bool should_log(LogLevel level) const {
        return level != LogLevel::NONE &&
               static_cast<uint8_t>(level) <= static_cast<uint8_t>(level_);
    }

    // Formatter: void(char* buffer, size_t buffer_size, size_t& offset)
    template <typename Formatter> void log(LogLevel level, const Formatter& formatter) {
        if (!should_log(level)) {
            return;
        }

        detail::format_timestamp(detail::timestamp_buffer, detail::TIMESTAMP_BUFFER_SIZE);

        char message_buffer[detail::MAX_LOG_MESSAGE_SIZE];
        size_t message_offset = 0;

        if (format_ == LogFormat::JSON) {
            detail::format_json(level, detail::timestamp_buffer, formatter, message_buffer,
                                detail::MAX_LOG_MESSAGE_SIZE, message_offset);
        } else {
            detail::format_text(level, detail::timestamp_buffer, formatter, message_buffer,
                                detail::MAX_LOG_MESSAGE_SIZE, message_offset);
        }

        message_offset = std::min(message_offset, detail::MAX_LOG_MESSAGE_SIZE - 2);
        message_buffer[message_offset++] = '\n';
        message_buffer[message_offset] = '\0';

        if (backend_ == LogBackend::SYSLOG) {
#ifndef _WIN32
            syslog(detail::syslog_priority(level), "%s", message_buffer);
#endif
            return;
        }

        FILE* stream = (level == LogLevel::ERROR || level == LogLevel::WARN) ? stderr : stdout;
        std::fwrite(message_buffer, 1, message_offset, stream);
        std::fflush(stream);
    }

  private:
    Logger() = default;
    ~Logger() {
#ifndef _WIN32
        if (backend_ == LogBackend::SYSLOG) {
            closelog();
        }
#endif
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_ = LogLevel::INFO;
    LogBackend backend_ = LogBackend::STDOUT;
    LogFormat format_ = LogFormat::TEXT;
    const char* ident_ = "libtextkit";
};

// Formats with std::format syntax ({} placeholders) only when the level is enabled
#define TEXTKIT_LOG(level, fmt, ...)                                                               \
    do {                                                                                           \
        auto& textkit_logger = textkit::Logger::instance();                                        \
        if (textkit_logger.should_log(level)) {                                                    \
            textkit_logger.log(level, [&](char* buf, size_t buf_size, size_t& off) {               \
                auto result =                                                                      \
                    std::format_to_n(buf + off, buf_size - off, fmt __VA_OPT__(, ) __VA_ARGS__);   \
                off += std::min(static_cast<size_t>(result.size), buf_size - off);                 \
            });                                                                                    \
        }                                                                                          \
    } while (0)

#define TEXTKIT_ERROR(...) TEXTKIT_LOG(textkit::LogLevel::ERROR, __VA_ARGS__)
#define TEXTKIT_WARN(...) TEXTKIT_LOG(textkit::LogLevel::WARN, __VA_ARGS__)
#define TEXTKIT_INFO(...) TEXTKIT_LOG(textkit::LogLevel::INFO, __VA_ARGS__)

#if ENABLE_DEBUG_LOGS
#define TEXTKIT_DEBUG(...) TEXTKIT_LOG(textkit::LogLevel::DEBUG, __VA_ARGS__)
#else
#define TEXTKIT_DEBUG(...)                                                                         \
    do {                                                                                           \
    } while (0)
#endif

#if ENABLE_TRACE_LOGS
#define TEXTKIT_TRACE(...) TEXTKIT_LOG(textkit::LogLevel::TRACE, __VA_ARGS__)
#else
#define TEXTKIT_TRACE(...)                                                                         \
    do {                                                                                           \
    } while (0)
#endif

} // namespace textkit

// NOLINTEND
