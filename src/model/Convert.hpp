#pragma once

#include "model/Values.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace tr::model
{

enum class BandwidthUnit
{
    Byte,
    Bit,
};

// How sizes and bandwidths are shown; typed values always hold bytes.
struct UnitOptions
{
    BandwidthUnit bandwidth_unit = BandwidthUnit::Byte;
    Prefix bandwidth_prefix = Prefix::Metric;
    Prefix size_prefix = Prefix::Metric;
};

std::optional<BandwidthUnit> parse_bandwidth_unit(std::string_view text);
std::optional<Prefix> parse_prefix(std::string_view text);

Quantity bytes(double value);
Quantity size_for_display(Quantity const &size, UnitOptions const &units);
Quantity bandwidth_for_display(Quantity const &rate, UnitOptions const &units);

// Rate limit argument as typed by a user: "100k", "1.5MB", "8Mb" (bits),
// "+=100k", "-=50k". Values are normalized to bytes per second.
struct RateLimit
{
    enum class Mode
    {
        Set,
        Add,
        Subtract,
    };

    Mode mode = Mode::Set;
    double bytes_per_second = 0;
};

std::optional<RateLimit> parse_rate_limit(std::string_view text);

// Target limit in bytes per second for a torrent currently limited to
// `current` (infinite when unlimited); nullopt means unlimited.
std::optional<double> resolve_rate_limit(RateLimit const &limit,
                                         Quantity const &current);

// Largest speed limit the daemon stores, in kB/s.
inline constexpr std::int64_t kMaxDaemonKilobytes = 2147483647;

// The daemon takes limits in kB/s. Results are clamped to
// [0, kMaxDaemonKilobytes]; NaN gives 0.
std::int64_t to_daemon_kilobytes(double bytes_per_second);

} // namespace tr::model
