#include "model/Convert.hpp"

#include <cmath>
#include <limits>

#include <doctest/doctest.h>

using namespace tr::model;

TEST_CASE("parse_rate_limit normalizes to bytes per second")
{
    auto plain = parse_rate_limit("100k");
    REQUIRE(plain);
    CHECK(plain->mode == RateLimit::Mode::Set);
    CHECK(plain->bytes_per_second == doctest::Approx(100000));

    auto bytes_unit = parse_rate_limit("1.5MB");
    REQUIRE(bytes_unit);
    CHECK(bytes_unit->bytes_per_second == doctest::Approx(1.5e6));

    auto per_second = parse_rate_limit(" 100 kB/s ");
    REQUIRE(per_second);
    CHECK(per_second->bytes_per_second == doctest::Approx(100000));
}

TEST_CASE("parse_rate_limit divides bit rates by eight")
{
    auto bits = parse_rate_limit("8Mb");
    REQUIRE(bits);
    CHECK(bits->bytes_per_second == doctest::Approx(1e6));

    auto bps = parse_rate_limit("100kbps");
    REQUIRE(bps);
    CHECK(bps->bytes_per_second == doctest::Approx(12500));
}

TEST_CASE("parse_rate_limit reads relative adjustments")
{
    auto add = parse_rate_limit("+=100k");
    REQUIRE(add);
    CHECK(add->mode == RateLimit::Mode::Add);
    CHECK(add->bytes_per_second == doctest::Approx(100000));

    auto subtract = parse_rate_limit("-=50k");
    REQUIRE(subtract);
    CHECK(subtract->mode == RateLimit::Mode::Subtract);
    CHECK(subtract->bytes_per_second == doctest::Approx(50000));
}

TEST_CASE("parse_rate_limit rejects unknown units and garbage")
{
    CHECK_FALSE(parse_rate_limit("fast"));
    CHECK_FALSE(parse_rate_limit("100 parsecs"));
    CHECK_FALSE(parse_rate_limit("+=-5k"));
    CHECK_FALSE(parse_rate_limit(""));
}

TEST_CASE("resolve_rate_limit adds to an unlimited torrent from zero")
{
    auto add = parse_rate_limit("+=100k");
    REQUIRE(add);
    auto target = resolve_rate_limit(*add, bytes(Quantity::kInfinite));
    REQUIRE(target);
    CHECK(*target == doctest::Approx(100000));
    CHECK(to_daemon_kilobytes(*target) == 100);
}

TEST_CASE("resolve_rate_limit keeps unlimited torrents unlimited when lowering")
{
    auto subtract = parse_rate_limit("-=50k");
    REQUIRE(subtract);
    CHECK_FALSE(resolve_rate_limit(*subtract, bytes(Quantity::kInfinite)));

    auto lowered = resolve_rate_limit(*subtract, bytes(80000));
    REQUIRE(lowered);
    CHECK(*lowered == doctest::Approx(30000));

    // Going below zero removes the limit.
    CHECK_FALSE(resolve_rate_limit(*subtract, bytes(20000)));
}

TEST_CASE("resolve_rate_limit treats non-positive absolute limits as unlimited")
{
    auto zero = parse_rate_limit("0");
    REQUIRE(zero);
    CHECK_FALSE(resolve_rate_limit(*zero, bytes(5000)));

    auto negative = parse_rate_limit("-1k");
    REQUIRE(negative);
    CHECK_FALSE(resolve_rate_limit(*negative, bytes(5000)));
}

TEST_CASE("parse_rate_limit rejects rates the daemon cannot store")
{
    CHECK_FALSE(parse_rate_limit("99999999999999999999999T"));
    CHECK_FALSE(parse_rate_limit("+=99999999999999999999999T"));
    CHECK(parse_rate_limit("2000GB"));
}

TEST_CASE("to_daemon_kilobytes clamps to the daemon's range")
{
    CHECK(to_daemon_kilobytes(150000) == 150);
    CHECK(to_daemon_kilobytes(1e35) == kMaxDaemonKilobytes);
    CHECK(to_daemon_kilobytes(std::numeric_limits<double>::infinity()) ==
          kMaxDaemonKilobytes);
    CHECK(to_daemon_kilobytes(-5000) == 0);
    CHECK(to_daemon_kilobytes(std::nan("")) == 0);

    // Repeated raises may pass the maximum; the limit stays set.
    auto add = parse_rate_limit("+=2000GB");
    REQUIRE(add);
    auto target = resolve_rate_limit(*add, bytes(2e12));
    REQUIRE(target);
    CHECK(to_daemon_kilobytes(*target) == kMaxDaemonKilobytes);
}

TEST_CASE("display helpers follow the unit options")
{
    UnitOptions units;
    units.bandwidth_unit = BandwidthUnit::Bit;
    CHECK(bandwidth_for_display(bytes(1000), units).with_unit() == "8kb");

    units.size_prefix = Prefix::Binary;
    CHECK(size_for_display(bytes(1024 * 1024), units).with_unit() == "1MiB");

    CHECK(parse_bandwidth_unit("Bits") == BandwidthUnit::Bit);
    CHECK(parse_bandwidth_unit("byte") == BandwidthUnit::Byte);
    CHECK_FALSE(parse_bandwidth_unit("nibble"));
    CHECK(parse_prefix("binary") == Prefix::Binary);
    CHECK_FALSE(parse_prefix("imperial"));
}
