#include "model/Convert.hpp"

#include "utils/Text.hpp"

#include <cmath>
#include <string>

namespace tr::model
{

namespace
{

std::string lowered(std::string_view text)
{
    return utils::to_lower(utils::trim(text));
}

} // namespace

std::optional<BandwidthUnit> parse_bandwidth_unit(std::string_view text)
{
    auto value = lowered(text);
    if (value == "byte" || value == "bytes" || value == "b")
    {
        return BandwidthUnit::Byte;
    }
    if (value == "bit" || value == "bits")
    {
        return BandwidthUnit::Bit;
    }
    return std::nullopt;
}

std::optional<Prefix> parse_prefix(std::string_view text)
{
    auto value = lowered(text);
    if (value == "metric")
    {
        return Prefix::Metric;
    }
    if (value == "binary")
    {
        return Prefix::Binary;
    }
    return std::nullopt;
}

Quantity bytes(double value)
{
    return Quantity(value, Prefix::Metric, "B");
}

Quantity size_for_display(Quantity const &size, UnitOptions const &units)
{
    return Quantity(size.value(), units.size_prefix, "B");
}

Quantity bandwidth_for_display(Quantity const &rate, UnitOptions const &units)
{
    auto display = rate.with_prefix(units.bandwidth_prefix);
    if (units.bandwidth_unit == BandwidthUnit::Bit)
    {
        return display.converted(8, "b");
    }
    return display.converted(1, "B");
}

std::optional<RateLimit> parse_rate_limit(std::string_view text)
{
    auto trimmed = utils::trim(text);
    RateLimit limit;
    if (trimmed.starts_with("+="))
    {
        limit.mode = RateLimit::Mode::Add;
        trimmed.remove_prefix(2);
    }
    else if (trimmed.starts_with("-="))
    {
        limit.mode = RateLimit::Mode::Subtract;
        trimmed.remove_prefix(2);
    }
    auto quantity = Quantity::parse(trimmed, Prefix::Metric, "B");
    if (!quantity)
    {
        return std::nullopt;
    }
    std::string_view unit = quantity->unit();
    if (unit.ends_with("/s"))
    {
        unit.remove_suffix(2);
    }
    if (unit == "B" || unit == "Bps")
    {
        limit.bytes_per_second = quantity->value();
    }
    else if (unit == "b" || unit == "bps")
    {
        limit.bytes_per_second = quantity->value() / 8;
    }
    else
    {
        return std::nullopt;
    }
    if (limit.mode != RateLimit::Mode::Set && limit.bytes_per_second < 0)
    {
        return std::nullopt;
    }
    if (!std::isfinite(limit.bytes_per_second) ||
        std::abs(limit.bytes_per_second) / 1000 >
            static_cast<double>(kMaxDaemonKilobytes))
    {
        return std::nullopt;
    }
    return limit;
}

std::optional<double> resolve_rate_limit(RateLimit const &limit,
                                         Quantity const &current)
{
    auto const unlimited = current.is_infinite() || current.is_unknown();
    double target = limit.bytes_per_second;
    switch (limit.mode)
    {
    case RateLimit::Mode::Set:
        break;
    case RateLimit::Mode::Add:
        target = (unlimited ? 0 : current.value()) + limit.bytes_per_second;
        break;
    case RateLimit::Mode::Subtract:
        if (unlimited)
        {
            return std::nullopt;
        }
        target = current.value() - limit.bytes_per_second;
        break;
    }
    if (target <= 0)
    {
        return std::nullopt;
    }
    return target;
}

std::int64_t to_daemon_kilobytes(double bytes_per_second)
{
    auto const kilobytes = bytes_per_second / 1000;
    if (!(kilobytes > 0))
    {
        return 0;
    }
    if (kilobytes >= static_cast<double>(kMaxDaemonKilobytes))
    {
        return kMaxDaemonKilobytes;
    }
    return static_cast<std::int64_t>(kilobytes);
}

} // namespace tr::model
