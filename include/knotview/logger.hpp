#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace knotview
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

namespace detail
{

template <typename T>
std::string log_arg(const T& v)
{
    if constexpr (std::is_pointer_v<T> && std::is_convertible_v<T, const char*>)
        return v ? std::string(v) : std::string("(null)");
    else if constexpr (std::is_convertible_v<const T&, std::string_view>)
        return std::string(std::string_view(v));
    else if constexpr (std::is_same_v<T, bool>)
        return v ? "true" : "false";
    else
        return std::to_string(v);
}

// Substitutes each "{}" in order; surplus arguments are dropped.
template <typename... Args>
std::string format_log(std::string_view format, const Args&... args)
{
    std::string out(format);
    size_t      from = 0;
    auto        fill = [&](std::string text)
    {
        auto pos = out.find("{}", from);
        if (pos == std::string::npos)
            return;
        out.replace(pos, 2, text);
        from = pos + text.size();
    };
    (fill(log_arg(args)), ...);
    return out;
}

}   // namespace detail

// Process-wide, level-filtered logger. Entries fan out to every sink under a
// single lock.
class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;
    bool     is_enabled(LogLevel level) const;

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel level, std::string_view category, std::string_view format,
                       const Args&... args)
    {
        if (is_enabled(level))
            log(level, category, detail::format_log(format, args...));
    }

    static std::string             level_to_string(LogLevel level);
    static std::optional<LogLevel> level_from_string(std::string_view name);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

   private:
    Logger()                         = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;
};

namespace sinks
{
// Colored lines on stderr.
Logger::LogSink console_sink();
// Appends plain lines; a file that cannot be opened drops entries.
Logger::LogSink file_sink(const std::string& filename);
}   // namespace sinks

}   // namespace knotview

#define KNOTVIEW_LOG_AT(lvl, category, ...)                                              \
    do                                                                                   \
    {                                                                                    \
        auto& knotview_logger_ = ::knotview::Logger::instance();                         \
        if (knotview_logger_.is_enabled(lvl))                                            \
            knotview_logger_.log_formatted(lvl, category, __VA_ARGS__);                  \
    } while (0)

#define KNOTVIEW_LOG_TRACE(category, ...) \
    KNOTVIEW_LOG_AT(::knotview::LogLevel::Trace, category, __VA_ARGS__)
#define KNOTVIEW_LOG_DEBUG(category, ...) \
    KNOTVIEW_LOG_AT(::knotview::LogLevel::Debug, category, __VA_ARGS__)
#define KNOTVIEW_LOG_INFO(category, ...) \
    KNOTVIEW_LOG_AT(::knotview::LogLevel::Info, category, __VA_ARGS__)
#define KNOTVIEW_LOG_WARN(category, ...) \
    KNOTVIEW_LOG_AT(::knotview::LogLevel::Warning, category, __VA_ARGS__)
#define KNOTVIEW_LOG_ERROR(category, ...) \
    KNOTVIEW_LOG_AT(::knotview::LogLevel::Error, category, __VA_ARGS__)
#define KNOTVIEW_LOG_CRITICAL(category, ...) \
    KNOTVIEW_LOG_AT(::knotview::LogLevel::Critical, category, __VA_ARGS__)
