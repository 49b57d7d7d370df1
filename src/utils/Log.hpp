#pragma once

#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace tr::log
{

enum class Level
{
    Debug,
    Info,
    Warn,
    Error,
};

// "debug", "info", "warn"/"warning" or "error", any case.
std::optional<Level> parse_level(std::string_view text);

// Lines below `level` are dropped; the default is Info.
void set_min_level(Level level);
bool enabled(Level level);

// Mirrors every line into `path`; an empty path turns the file off.
void set_log_file(std::filesystem::path path);

// Writes "[L HH:MM:SS.mmm] message" to stderr and the log file.
void emit(Level level, std::string const &message);

// TR_ENABLE_LOGGING=1 wins over TR_BUILD_MINIMAL.
#if (defined(TR_ENABLE_LOGGING) && TR_ENABLE_LOGGING) || \
    !defined(TR_BUILD_MINIMAL)
template <typename... Args>
void write(Level level, std::string_view fmt, Args &&...args)
{
    if (!enabled(level))
    {
        return;
    }
    emit(level, std::vformat(fmt, std::make_format_args(args...)));
}
#else
template <typename... Args>
void write(Level, std::string_view, Args &&...) noexcept
{
}
#endif

} // namespace tr::log

#define TR_LOG_DEBUG(fmt, ...)                                                 \
    tr::log::write(tr::log::Level::Debug, fmt, ##__VA_ARGS__)
#define TR_LOG_INFO(fmt, ...)                                                  \
    tr::log::write(tr::log::Level::Info, fmt, ##__VA_ARGS__)
#define TR_LOG_WARN(fmt, ...)                                                  \
    tr::log::write(tr::log::Level::Warn, fmt, ##__VA_ARGS__)
#define TR_LOG_ERROR(fmt, ...)                                                 \
    tr::log::write(tr::log::Level::Error, fmt, ##__VA_ARGS__)
