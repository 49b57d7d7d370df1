#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tr::model
{

enum class Prefix
{
    Metric,
    Binary,
};

// Renders numbers the way every column does: up to two decimals below 10,
// one below 100, none above; trailing zeros are dropped.
std::string pretty_float(double value);

class Quantity
{
  public:
    static constexpr double kUnknown = -1;
    static constexpr double kInfinite = -2;

    Quantity() = default;
    explicit Quantity(double value, Prefix prefix = Prefix::Metric,
                      std::string unit = {});

    // "123", "1.5k", "10Mi", "5 MB", "100kb". A one-letter prefix selects
    // metric, a two-letter one binary; trailing text becomes the unit.
    static std::optional<Quantity> parse(std::string_view text,
                                         Prefix default_prefix = Prefix::Metric,
                                         std::string default_unit = {});

    double value() const noexcept { return value_; }
    Prefix prefix() const noexcept { return prefix_; }
    std::string const &unit() const noexcept { return unit_; }

    bool is_unknown() const noexcept { return value_ == kUnknown; }
    bool is_infinite() const noexcept { return value_ == kInfinite; }

    Quantity with_prefix(Prefix prefix) const;
    Quantity converted(double factor, std::string unit) const;

    std::string without_unit() const;
    std::string with_unit() const;

    bool operator==(Quantity const &other) const noexcept
    {
        return value_ == other.value_;
    }
    bool operator<(Quantity const &other) const noexcept
    {
        return value_ < other.value_;
    }

  private:
    double value_ = 0;
    Prefix prefix_ = Prefix::Metric;
    std::string unit_;
};

struct Percent
{
    double value = 0;

    std::string to_string() const { return pretty_float(value); }
    bool operator==(Percent const &other) const noexcept
    {
        return value == other.value;
    }
    bool operator<(Percent const &other) const noexcept
    {
        return value < other.value;
    }
};

// Lifecycle states in display order; comparisons follow this order.
enum class Status
{
    Verifying,
    VerifyPending,
    Leeching,
    LeechPending,
    Seeding,
    SeedPending,
    Stopped,
};

std::string_view to_string(Status status);
std::optional<Status> status_from_token(std::string_view token);
std::optional<Status> status_from_code(std::int64_t code);

// String with "smart" comparison: equality and containment ignore case
// unless the probe contains uppercase letters, and ordering against a
// number compares lengths ("abc" > "2" because it has more than two
// characters).
class SmartString
{
  public:
    SmartString() = default;
    explicit SmartString(std::string value);

    std::string const &str() const noexcept { return value_; }
    std::size_t length() const noexcept;

    bool equals(std::string_view probe) const;
    bool contains(std::string_view probe) const;
    int compare(std::string_view probe) const;

    bool operator==(std::string_view probe) const { return equals(probe); }
    bool operator<(std::string_view probe) const { return compare(probe) < 0; }
    bool operator>(std::string_view probe) const { return compare(probe) > 0; }
    bool operator<=(std::string_view probe) const { return compare(probe) <= 0; }
    bool operator>=(std::string_view probe) const { return compare(probe) >= 0; }

  private:
    std::string value_;
};

inline constexpr std::int64_t kTimeNowThreshold = 5;

class Timedelta
{
  public:
    static constexpr std::int64_t kNotApplicable = -1;
    static constexpr std::int64_t kUnknown = -2;

    Timedelta() = default;
    explicit Timedelta(std::int64_t seconds) : seconds_(seconds) {}

    std::int64_t seconds() const noexcept { return seconds_; }
    bool is_known() const noexcept { return seconds_ >= 0; }
    std::string to_string() const;

    bool operator==(Timedelta const &other) const noexcept
    {
        return seconds_ == other.seconds_;
    }
    bool operator<(Timedelta const &other) const noexcept
    {
        return seconds_ < other.seconds_;
    }

  private:
    std::int64_t seconds_ = kNotApplicable;
};

// Signed duration text without the sentinel handling ("now", "3h", "-2d").
std::string format_duration(std::int64_t seconds);

class Timestamp
{
  public:
    static constexpr double kNotApplicable = -1;
    static constexpr double kUnknown = -2;

    Timestamp() = default;
    explicit Timestamp(double seconds) : seconds_(seconds) {}

    double seconds() const noexcept { return seconds_; }
    bool is_known() const noexcept { return seconds_ >= 0; }

    // Seconds from `now` until this timestamp (negative when in the past).
    Timedelta delta(std::time_t now) const;
    bool in_future(std::time_t now) const noexcept
    {
        return is_known() && seconds_ > static_cast<double>(now);
    }
    std::string to_string(std::time_t now) const;
    std::string to_string() const;

    bool operator==(Timestamp const &other) const noexcept
    {
        return seconds_ == other.seconds_;
    }
    bool operator<(Timestamp const &other) const noexcept
    {
        return seconds_ < other.seconds_;
    }

  private:
    double seconds_ = kNotApplicable;
};

enum class FilePriority
{
    Low = -1,
    Normal = 0,
    High = 1,
};

std::string_view to_string(FilePriority priority);
std::optional<FilePriority> file_priority_from_code(std::int64_t code);

struct Tracker
{
    int id = 0;
    int tier = 0;
    std::string announce;
    std::string scrape;

    std::string domain() const;
};

using TrackerList = std::vector<Tracker>;

struct TorrentFile
{
    int torrent_id = 0;
    // Index of the file inside its torrent; the daemon addresses files by it.
    int id = 0;
    SmartString name;
    Quantity size_total;
    Quantity size_downloaded;
    bool wanted = true;
    FilePriority priority = FilePriority::Normal;

    Percent progress() const;
};

using FileList = std::vector<TorrentFile>;

using Value = std::variant<std::monostate, bool, std::int64_t, std::string,
                           Quantity, Percent, Status, SmartString, Timestamp,
                           Timedelta, TrackerList, FileList>;

std::string to_string(Value const &value);

} // namespace tr::model
