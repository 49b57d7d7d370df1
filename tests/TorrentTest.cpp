#include "TestTransport.hpp"

#include "model/Errors.hpp"
#include "model/FieldRegistry.hpp"
#include "model/Filter.hpp"
#include "model/Torrent.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <doctest/doctest.h>

using namespace tr;
using namespace tr::model;

namespace
{

Torrent make_torrent(std::string const &record)
{
    auto document = tests::parse_shared(record);
    auto id = json::get_int(json::member(document->root(), "id")).value_or(0);
    Torrent torrent(static_cast<int>(id));
    torrent.update(document, document->root());
    return torrent;
}

} // namespace

TEST_CASE("expand_keys resolves all and rejects unknown keys")
{
    auto expanded = expand_keys({"all"});
    CHECK(expanded.size() == all_fields().size());
    CHECK(expand_keys({"name", "name", "id"}) ==
          std::vector<std::string>{"name", "id"});
    CHECK_THROWS_AS(expand_keys({"colour"}), std::invalid_argument);
}

TEST_CASE("rpc_fields_for puts id first and leaves out static companions")
{
    auto fields = rpc_fields_for({"name", "files", "rate-limit-up"});
    REQUIRE_FALSE(fields.empty());
    CHECK(fields.front() == "id");
    CHECK(fields == std::vector<std::string>{"id", "name", "fileStats",
                                             "uploadLimited", "uploadLimit"});
    CHECK(static_companion("fileStats") == std::string_view("files"));
    CHECK_FALSE(static_companion("name"));
}

TEST_CASE("every registered key has a converter and daemon fields")
{
    for (auto const &spec : all_fields())
    {
        CHECK(static_cast<bool>(spec.convert));
        CHECK_FALSE(spec.rpc_fields.empty());
    }
    REQUIRE(find_field("size-total") != nullptr);
    CHECK(find_field("size-total")->rendering == Rendering::Size);
    CHECK(find_field("peers-connected")->rendering == Rendering::Plain);

    auto torrent = make_torrent(R"({"id":4,"peersConnected":3,
        "totalSize":5000,"dateCreated":1700000000,"recheckProgress":0.25})");
    CHECK(torrent.get_as<Quantity>("peers-connected").value() ==
          doctest::Approx(3));
    CHECK(torrent.format("size-total") == "5kB");
    CHECK(torrent.get_as<Timestamp>("timestamp-created").is_known());
    CHECK(torrent.get_as<Percent>("%verified").value == doctest::Approx(25));
}

TEST_CASE("Torrent converts raw fields lazily")
{
    auto torrent = make_torrent(R"({"id":3,"name":"Debian ISO","status":4,
        "percentDone":0.5,"sizeWhenDone":2000000,"addedDate":0,
        "uploadLimited":false,"uploadLimit":100,
        "downloadLimited":true,"downloadLimit":250})");

    CHECK(torrent.name() == "Debian ISO");
    CHECK(torrent.get_as<Status>("status") == Status::Leeching);
    CHECK(torrent.get_as<Percent>("%downloaded").value == doctest::Approx(50));
    CHECK(torrent.get_as<Quantity>("size-final").value() ==
          doctest::Approx(2e6));
    CHECK_FALSE(torrent.get_as<Timestamp>("timestamp-added").is_known());
    CHECK(torrent.get_as<Quantity>("rate-limit-up").is_infinite());
    CHECK(torrent.get_as<Quantity>("rate-limit-down").value() ==
          doctest::Approx(250000));
    CHECK(torrent.format("size-final") == "2MB");
    CHECK(torrent.format("rate-limit-down") == "250kB");
}

TEST_CASE("Torrent reports missing and unknown keys")
{
    auto torrent = make_torrent(R"({"id":1,"name":"x"})");
    CHECK(torrent.has("name"));
    CHECK_FALSE(torrent.has("status"));
    CHECK_THROWS_AS(torrent.get("status"), std::out_of_range);
    CHECK_THROWS_AS(torrent.has("colour"), std::invalid_argument);
}

TEST_CASE("Torrent rejects raw values of the wrong type")
{
    auto torrent = make_torrent(R"({"id":1,"name":17,"status":"sleeping"})");
    CHECK_THROWS_AS(torrent.get("name"), tr::ProtocolError);
    CHECK_THROWS_AS(torrent.get("status"), tr::ProtocolError);
}

TEST_CASE("Torrent rejects integers outside the 64-bit range")
{
    auto torrent = make_torrent(
        R"({"id":1,"peersConnected":1e300,"eta":18446744073709551615})");
    CHECK_THROWS_AS(torrent.get("peers-connected"), tr::ProtocolError);
    CHECK_THROWS_AS(torrent.get("timespan-eta"), tr::ProtocolError);
    CHECK_FALSE(json::get_int(torrent.raw("peersConnected")));
}

TEST_CASE("Torrent drops typed values when their raw field changes")
{
    auto document = tests::parse_shared(R"({"id":1,"status":0})");
    Torrent torrent(1);
    torrent.update(document, document->root());
    CHECK(torrent.get_as<Status>("status") == Status::Stopped);

    auto next = tests::parse_shared(R"({"id":1,"status":6})");
    torrent.update(next, next->root());
    CHECK(torrent.get_as<Status>("status") == Status::Seeding);
}

TEST_CASE("Torrent values read earlier survive an overwrite of their fields")
{
    auto document = tests::parse_shared(R"({"id":1,"name":"old",
        "files":[{"name":"a.iso","length":100}],
        "fileStats":[{"bytesCompleted":50,"wanted":true,"priority":0}]})");
    Torrent torrent(1);
    torrent.update(document, document->root());

    auto const &files = torrent.get_as<FileList>("files");
    auto const name = torrent.get("name");

    auto next = tests::parse_shared(R"({"id":1,"name":"new",
        "fileStats":[{"bytesCompleted":100,"wanted":true,"priority":0}]})");
    torrent.update(next, next->root());

    REQUIRE(files.size() == 1);
    CHECK(files.front().progress().value == doctest::Approx(50));
    CHECK(to_string(name) == "old");
    CHECK(torrent.get_as<FileList>("files").front().progress().value ==
          doctest::Approx(100));
    CHECK(torrent.name() == "new");
}

TEST_CASE("Torrent combines files with their stats")
{
    auto torrent = make_torrent(R"({"id":9,
        "files":[{"name":"a.mkv","length":1000},{"name":"b.nfo","length":0}],
        "fileStats":[{"bytesCompleted":250,"wanted":true,"priority":1},
                     {"bytesCompleted":0,"wanted":false,"priority":0}]})");
    auto const &files = torrent.get_as<FileList>("files");
    REQUIRE(files.size() == 2);
    CHECK(files[0].torrent_id == 9);
    CHECK(files[0].id == 0);
    CHECK(files[0].name.str() == "a.mkv");
    CHECK(files[0].priority == FilePriority::High);
    CHECK(files[0].progress().value == doctest::Approx(25));
    CHECK(files[1].id == 1);
    CHECK_FALSE(files[1].wanted);

    auto mismatched = make_torrent(R"({"id":9,
        "files":[{"name":"a.mkv","length":1000}],"fileStats":[]})");
    CHECK_THROWS_AS(mismatched.get("files"), tr::ProtocolError);
}

TEST_CASE("Torrent reads tracker lists")
{
    auto torrent = make_torrent(R"({"id":2,"trackers":[
        {"id":0,"tier":0,"announce":"http://tracker.example.org/announce",
         "scrape":"http://tracker.example.org/scrape"},
        {"id":4,"tier":1,"announce":"udp://open.example.net:1337"}]})");
    auto const &trackers = torrent.get_as<TrackerList>("trackers");
    REQUIRE(trackers.size() == 2);
    CHECK(trackers[1].id == 4);
    CHECK(trackers[1].tier == 1);
    CHECK(trackers[0].domain() == "example.org");
}

TEST_CASE("PredicateFilter applies its predicate and keeps its keys")
{
    auto first = std::make_shared<Torrent const>(make_torrent(
        R"({"id":1,"name":"alpha","status":0})"));
    auto second = std::make_shared<Torrent const>(make_torrent(
        R"({"id":2,"name":"beta","status":6})"));

    PredicateFilter filter("stopped", {"status"}, [](Torrent const &torrent)
                           { return torrent.get_as<Status>("status") ==
                                    Status::Stopped; });
    CHECK(filter.describe() == "stopped");
    CHECK(filter.needed_keys() == std::vector<std::string>{"status"});
    auto matched = filter.apply({first, second});
    REQUIRE(matched.size() == 1);
    CHECK(matched.front()->id() == 1);
}
