#include "utils/Log.hpp"

#include "utils/Text.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>
#include <utility>

namespace tr::log
{

namespace
{

std::atomic<Level> g_min_level{Level::Info};

struct Sinks
{
    std::mutex mutex;
    std::filesystem::path path;
    std::ofstream file;
};

Sinks &sinks()
{
    static Sinks s_sinks;
    return s_sinks;
}

char level_letter(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return 'D';
    case Level::Info:
        return 'I';
    case Level::Warn:
        return 'W';
    case Level::Error:
        return 'E';
    }
    return '?';
}

std::string timestamp()
{
    auto const now = std::chrono::system_clock::now();
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch())
                            .count() %
                        1000;
    auto const time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    char clock[16]{};
    std::strftime(clock, sizeof(clock), "%H:%M:%S", &tm);
    return std::format("{}.{:03}", clock, millis);
}

} // namespace

std::optional<Level> parse_level(std::string_view text)
{
    auto value = utils::to_lower(utils::trim(text));
    if (value == "debug")
    {
        return Level::Debug;
    }
    if (value == "info")
    {
        return Level::Info;
    }
    if (value == "warn" || value == "warning")
    {
        return Level::Warn;
    }
    if (value == "error")
    {
        return Level::Error;
    }
    return std::nullopt;
}

void set_min_level(Level level)
{
    g_min_level.store(level, std::memory_order_relaxed);
}

bool enabled(Level level)
{
    return level >= g_min_level.load(std::memory_order_relaxed);
}

void set_log_file(std::filesystem::path path)
{
    auto &s = sinks();
    std::lock_guard<std::mutex> lk(s.mutex);
    if (s.file.is_open())
    {
        s.file.close();
    }
    s.path = std::move(path);
}

void emit(Level level, std::string const &message)
{
    auto line = std::format("[{} {}] {}", level_letter(level), timestamp(),
                            message);
    auto &s = sinks();
    std::lock_guard<std::mutex> lk(s.mutex);
    std::fprintf(stderr, "%s\n", line.c_str());
    std::fflush(stderr);
    if (s.path.empty())
    {
        return;
    }
    if (!s.file.is_open())
    {
        s.file.open(s.path, std::ios::app | std::ios::out);
    }
    if (s.file.is_open())
    {
        s.file << line << '\n';
        s.file.flush();
    }
}

} // namespace tr::log
