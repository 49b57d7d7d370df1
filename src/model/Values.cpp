#include "model/Values.hpp"

#include "utils/Url.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <format>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace tr::model
{

namespace
{

struct PrefixStep
{
    std::string_view symbol;
    double size;
};

constexpr std::array<PrefixStep, 4> kBinaryPrefixes = {{
    {"Ti", 1024.0 * 1024 * 1024 * 1024},
    {"Gi", 1024.0 * 1024 * 1024},
    {"Mi", 1024.0 * 1024},
    {"Ki", 1024.0},
}};

constexpr std::array<PrefixStep, 4> kMetricPrefixes = {{
    {"T", 1e12},
    {"G", 1e9},
    {"M", 1e6},
    {"k", 1e3},
}};

std::array<PrefixStep, 4> const &steps_for(Prefix prefix)
{
    return prefix == Prefix::Binary ? kBinaryPrefixes : kMetricPrefixes;
}

std::optional<double> multiplier_for(std::string_view symbol)
{
    std::string lowered(symbol);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    for (auto const *table : {&kBinaryPrefixes, &kMetricPrefixes})
    {
        for (auto const &step : *table)
        {
            std::string candidate(step.symbol);
            std::transform(candidate.begin(), candidate.end(),
                           candidate.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            if (candidate == lowered)
            {
                return step.size;
            }
        }
    }
    return std::nullopt;
}

std::string ascii_lower(std::string_view text)
{
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return lowered;
}

std::size_t utf8_length(std::string_view text)
{
    return static_cast<std::size_t>(
        std::count_if(text.begin(), text.end(), [](unsigned char ch)
                      { return (ch & 0xC0) != 0x80; }));
}

bool all_digits(std::string_view text)
{
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char ch)
                       { return std::isdigit(ch) != 0; });
}

std::uint64_t digits_value(std::string_view text)
{
    std::uint64_t value = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc::result_out_of_range)
    {
        return std::numeric_limits<std::uint64_t>::max();
    }
    return value;
}

template <typename T> int three_way(T const &a, T const &b)
{
    if (a < b)
    {
        return -1;
    }
    return b < a ? 1 : 0;
}

std::string format_local_time(double seconds, char const *format)
{
    auto time = static_cast<std::time_t>(seconds);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    char buffer[32]{};
    std::strftime(buffer, sizeof(buffer), format, &tm);
    return buffer;
}

struct DurationUnit
{
    char symbol;
    std::int64_t seconds;
};

constexpr std::array<DurationUnit, 6> kDurationUnits = {{
    {'y', 31557600},
    {'M', 2592000},
    {'d', 86400},
    {'h', 3600},
    {'m', 60},
    {'s', 1},
}};

} // namespace

std::string pretty_float(double value)
{
    if (std::isinf(value))
    {
        return "\xE2\x88\x9E";
    }
    std::string text;
    auto magnitude = std::fabs(value);
    if (value == std::floor(value) || magnitude >= 100)
    {
        return std::format("{:.0f}", value);
    }
    if (magnitude < 10)
    {
        text = std::format("{:.2f}", value);
    }
    else
    {
        text = std::format("{:.1f}", value);
    }
    while (!text.empty() && text.back() == '0')
    {
        text.pop_back();
    }
    if (!text.empty() && text.back() == '.')
    {
        text.pop_back();
    }
    return text;
}

Quantity::Quantity(double value, Prefix prefix, std::string unit)
    : value_(value), prefix_(prefix), unit_(std::move(unit))
{
}

std::optional<Quantity> Quantity::parse(std::string_view text,
                                        Prefix default_prefix,
                                        std::string default_unit)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
    {
        text.remove_prefix(1);
    }
    std::size_t pos = 0;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
    {
        ++pos;
    }
    auto const digits_begin = pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
    {
        ++pos;
    }
    if (pos == digits_begin)
    {
        return std::nullopt;
    }
    if (pos + 1 < text.size() && text[pos] == '.' &&
        std::isdigit(static_cast<unsigned char>(text[pos + 1])))
    {
        ++pos;
        while (pos < text.size() &&
               std::isdigit(static_cast<unsigned char>(text[pos])))
        {
            ++pos;
        }
    }
    double number = 0;
    {
        auto begin = text.data();
        if (*begin == '+')
        {
            ++begin;
        }
        auto [ptr, ec] = std::from_chars(begin, text.data() + pos, number);
        if (ec != std::errc())
        {
            return std::nullopt;
        }
    }
    auto rest = text.substr(pos);
    if (!rest.empty() && rest.front() == ' ')
    {
        rest.remove_prefix(1);
    }

    Prefix prefix = default_prefix;
    std::string_view symbol;
    if (rest.size() >= 2 && (rest[1] == 'i' || rest[1] == 'I') &&
        multiplier_for(rest.substr(0, 2)))
    {
        symbol = rest.substr(0, 2);
        prefix = Prefix::Binary;
    }
    else if (!rest.empty() && multiplier_for(rest.substr(0, 1)))
    {
        symbol = rest.substr(0, 1);
        prefix = Prefix::Metric;
    }
    if (!symbol.empty())
    {
        number *= *multiplier_for(symbol);
        rest.remove_prefix(symbol.size());
    }
    std::string unit = rest.empty() ? std::move(default_unit) : std::string(rest);
    return Quantity(number, prefix, std::move(unit));
}

Quantity Quantity::with_prefix(Prefix prefix) const
{
    return Quantity(value_, prefix, unit_);
}

Quantity Quantity::converted(double factor, std::string unit) const
{
    if (is_unknown() || is_infinite())
    {
        return Quantity(value_, prefix_, std::move(unit));
    }
    return Quantity(value_ * factor, prefix_, std::move(unit));
}

std::string Quantity::without_unit() const
{
    if (is_unknown())
    {
        return "?";
    }
    if (is_infinite())
    {
        return "\xE2\x88\x9E";
    }
    for (auto const &step : steps_for(prefix_))
    {
        if (value_ >= step.size)
        {
            return pretty_float(value_ / step.size) + std::string(step.symbol);
        }
    }
    return pretty_float(value_);
}

std::string Quantity::with_unit() const
{
    auto text = without_unit();
    if (!is_unknown() && !is_infinite())
    {
        text += unit_;
    }
    return text;
}

std::string_view to_string(Status status)
{
    switch (status)
    {
    case Status::Verifying:
        return "verifying";
    case Status::VerifyPending:
        return "verifying pending";
    case Status::Leeching:
        return "leeching";
    case Status::LeechPending:
        return "leeching pending";
    case Status::Seeding:
        return "seeding";
    case Status::SeedPending:
        return "seeding pending";
    case Status::Stopped:
        return "stopped";
    }
    return "unknown";
}

std::optional<Status> status_from_token(std::string_view token)
{
    for (auto status : {Status::Verifying, Status::VerifyPending,
                        Status::Leeching, Status::LeechPending,
                        Status::Seeding, Status::SeedPending, Status::Stopped})
    {
        if (to_string(status) == token)
        {
            return status;
        }
    }
    return std::nullopt;
}

std::optional<Status> status_from_code(std::int64_t code)
{
    switch (code)
    {
    case 0:
        return Status::Stopped;
    case 1:
        return Status::VerifyPending;
    case 2:
        return Status::Verifying;
    case 3:
        return Status::LeechPending;
    case 4:
        return Status::Leeching;
    case 5:
        return Status::SeedPending;
    case 6:
        return Status::Seeding;
    default:
        return std::nullopt;
    }
}

SmartString::SmartString(std::string value) : value_(std::move(value)) {}

std::size_t SmartString::length() const noexcept
{
    return utf8_length(value_);
}

bool SmartString::equals(std::string_view probe) const
{
    if (probe == ascii_lower(probe))
    {
        return ascii_lower(value_) == probe;
    }
    return value_ == probe;
}

bool SmartString::contains(std::string_view probe) const
{
    if (probe == ascii_lower(probe))
    {
        return ascii_lower(value_).find(probe) != std::string::npos;
    }
    return value_.find(probe) != std::string::npos;
}

int SmartString::compare(std::string_view probe) const
{
    auto const self =
        probe == ascii_lower(probe) ? ascii_lower(value_) : value_;
    if (all_digits(value_))
    {
        return three_way<std::uint64_t>(digits_value(value_),
                                        utf8_length(probe));
    }
    if (all_digits(probe))
    {
        return three_way<std::uint64_t>(utf8_length(self),
                                        digits_value(probe));
    }
    auto const result = std::string_view(self).compare(probe);
    return result < 0 ? -1 : (result > 0 ? 1 : 0);
}

std::string format_duration(std::int64_t seconds)
{
    auto const magnitude = seconds < 0 ? -seconds : seconds;
    if (magnitude < kTimeNowThreshold)
    {
        return "now";
    }
    for (auto const &unit : kDurationUnits)
    {
        if (magnitude >= unit.seconds)
        {
            return std::to_string(seconds / unit.seconds) + unit.symbol;
        }
    }
    return "now";
}

std::string Timedelta::to_string() const
{
    if (seconds_ == kUnknown)
    {
        return "?";
    }
    if (seconds_ == kNotApplicable)
    {
        return {};
    }
    return format_duration(seconds_);
}

Timedelta Timestamp::delta(std::time_t now) const
{
    if (!is_known())
    {
        return Timedelta(static_cast<std::int64_t>(seconds_));
    }
    return Timedelta(std::llround(seconds_ - static_cast<double>(now)));
}

std::string Timestamp::to_string(std::time_t now) const
{
    if (seconds_ == kUnknown)
    {
        return "?";
    }
    if (!is_known())
    {
        return {};
    }
    auto const distance = std::fabs(seconds_ - static_cast<double>(now));
    if (distance <= 86400)
    {
        return format_local_time(seconds_, "%H:%M:%S");
    }
    if (distance <= 2 * 86400)
    {
        return format_local_time(seconds_, "%Y-%m-%d %H:%M:%S");
    }
    return format_local_time(seconds_, "%Y-%m-%d");
}

std::string Timestamp::to_string() const
{
    return to_string(std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now()));
}

std::string_view to_string(FilePriority priority)
{
    switch (priority)
    {
    case FilePriority::Low:
        return "low";
    case FilePriority::Normal:
        return "normal";
    case FilePriority::High:
        return "high";
    }
    return "normal";
}

std::optional<FilePriority> file_priority_from_code(std::int64_t code)
{
    switch (code)
    {
    case -1:
        return FilePriority::Low;
    case 0:
        return FilePriority::Normal;
    case 1:
        return FilePriority::High;
    default:
        return std::nullopt;
    }
}

std::string Tracker::domain() const
{
    return net::url_domain(announce);
}

Percent TorrentFile::progress() const
{
    if (size_total.value() <= 0)
    {
        return Percent{100};
    }
    return Percent{size_downloaded.value() / size_total.value() * 100};
}

std::string to_string(Value const &value)
{
    struct Visitor
    {
        std::string operator()(std::monostate) const { return {}; }
        std::string operator()(bool flag) const { return flag ? "yes" : "no"; }
        std::string operator()(std::int64_t number) const
        {
            return std::to_string(number);
        }
        std::string operator()(std::string const &text) const { return text; }
        std::string operator()(Quantity const &quantity) const
        {
            return quantity.with_unit();
        }
        std::string operator()(Percent const &percent) const
        {
            return percent.to_string();
        }
        std::string operator()(Status status) const
        {
            return std::string(tr::model::to_string(status));
        }
        std::string operator()(SmartString const &text) const
        {
            return text.str();
        }
        std::string operator()(Timestamp const &timestamp) const
        {
            return timestamp.to_string();
        }
        std::string operator()(Timedelta const &delta) const
        {
            return delta.to_string();
        }
        std::string operator()(TrackerList const &trackers) const
        {
            std::string joined;
            for (auto const &tracker : trackers)
            {
                if (!joined.empty())
                {
                    joined += ", ";
                }
                joined += tracker.announce;
            }
            return joined;
        }
        std::string operator()(FileList const &files) const
        {
            return std::to_string(files.size()) +
                   (files.size() == 1 ? " file" : " files");
        }
    };
    return std::visit(Visitor{}, value);
}

} // namespace tr::model
