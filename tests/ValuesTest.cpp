#include "model/Convert.hpp"
#include "model/Values.hpp"

#include <string>

#include <doctest/doctest.h>

using namespace tr::model;

TEST_CASE("Quantity::parse accepts metric and binary prefixes")
{
    auto plain = Quantity::parse("123");
    REQUIRE(plain);
    CHECK(plain->value() == doctest::Approx(123));

    auto metric = Quantity::parse("1.5k");
    REQUIRE(metric);
    CHECK(metric->value() == doctest::Approx(1500));
    CHECK(metric->prefix() == Prefix::Metric);

    auto binary = Quantity::parse("10Mi");
    REQUIRE(binary);
    CHECK(binary->value() == doctest::Approx(10.0 * 1024 * 1024));
    CHECK(binary->prefix() == Prefix::Binary);

    auto spaced = Quantity::parse("5 MB");
    REQUIRE(spaced);
    CHECK(spaced->value() == doctest::Approx(5e6));
    CHECK(spaced->unit() == "B");
}

TEST_CASE("Quantity::parse falls back to the default unit and rejects junk")
{
    auto defaulted = Quantity::parse("42", Prefix::Metric, "B");
    REQUIRE(defaulted);
    CHECK(defaulted->unit() == "B");

    CHECK_FALSE(Quantity::parse("fast"));
    CHECK_FALSE(Quantity::parse(""));
}

TEST_CASE("Quantity renders prefixes and sentinel values")
{
    CHECK(Quantity(1500, Prefix::Metric, "B").with_unit() == "1.5kB");
    CHECK(Quantity(2048, Prefix::Binary, "B").with_unit() == "2KiB");
    CHECK(Quantity(999, Prefix::Metric, "B").with_unit() == "999B");
    CHECK(Quantity(Quantity::kUnknown).with_unit() == "?");
    CHECK(Quantity(Quantity::kInfinite).with_unit() == "\xE2\x88\x9E");
}

TEST_CASE("pretty_float trims decimals by magnitude")
{
    CHECK(pretty_float(1.25) == "1.25");
    CHECK(pretty_float(12.34) == "12.3");
    CHECK(pretty_float(123.4) == "123");
    CHECK(pretty_float(2.0) == "2");
}

TEST_CASE("Status seeding orders between leeching and stopped")
{
    CHECK(Status::Leeching < Status::Seeding);
    CHECK(Status::Seeding < Status::Stopped);
    CHECK(status_from_code(6) == Status::Seeding);
    CHECK(status_from_code(0) == Status::Stopped);
    CHECK_FALSE(status_from_code(42));
    CHECK(status_from_token("verifying pending") == Status::VerifyPending);
    CHECK(to_string(Status::LeechPending) == "leeching pending");
}

TEST_CASE("SmartString ignores case only for lowercase probes")
{
    SmartString name("Ubuntu Desktop");
    CHECK(name == "ubuntu desktop");
    CHECK_FALSE(name == "UBUNTU desktop");
    CHECK(name.contains("desk"));
    CHECK_FALSE(name.contains("DESK"));
    CHECK(name.contains("Desk"));
}

TEST_CASE("SmartString compares against numbers by length")
{
    SmartString name("abc");
    CHECK(name > "2");
    CHECK(name < "4");
    CHECK(name >= "3");
    CHECK(name.length() == 3);
    CHECK(SmartString("\xC3\xA4pfel").length() == 5);
}

TEST_CASE("Timedelta formats the largest whole unit")
{
    CHECK(Timedelta(3).to_string() == "now");
    CHECK(Timedelta(90).to_string() == "1m");
    CHECK(Timedelta(7200).to_string() == "2h");
    CHECK(Timedelta(-2 * 86400).to_string() == "-2d");
    CHECK(Timedelta(Timedelta::kUnknown).to_string() == "?");
    CHECK(Timedelta(Timedelta::kNotApplicable).to_string().empty());
}

TEST_CASE("Timestamp delta and future checks are relative to now")
{
    Timestamp later(1000);
    CHECK(later.in_future(900));
    CHECK_FALSE(later.in_future(1000));
    CHECK(later.delta(900).seconds() == 100);
    CHECK_FALSE(Timestamp(Timestamp::kNotApplicable).in_future(0));
    CHECK(Timestamp(Timestamp::kNotApplicable).to_string(0).empty());
}

TEST_CASE("TorrentFile progress handles empty files")
{
    TorrentFile file;
    file.size_total = bytes(200);
    file.size_downloaded = bytes(50);
    CHECK(file.progress().value == doctest::Approx(25));

    TorrentFile empty;
    empty.size_total = bytes(0);
    CHECK(empty.progress().value == doctest::Approx(100));
}

TEST_CASE("Tracker domain keeps the registrable part of the host")
{
    Tracker tracker;
    tracker.announce = "http://tracker.example.org:6969/announce";
    CHECK(tracker.domain() == "example.org");

    tracker.announce = "udp://10.0.0.1:80/announce";
    CHECK(tracker.domain() == "10.0.0.1");
}

TEST_CASE("Value to_string covers lists and flags")
{
    CHECK(to_string(Value{true}) == "yes");
    CHECK(to_string(Value{std::int64_t{7}}) == "7");
    CHECK(to_string(Value{FileList(2)}) == "2 files");

    TrackerList trackers(2);
    trackers[0].announce = "http://a/announce";
    trackers[1].announce = "http://b/announce";
    CHECK(to_string(Value{trackers}) == "http://a/announce, http://b/announce");
}
