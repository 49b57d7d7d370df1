#include "TestTransport.hpp"

#include "client/TorrentCache.hpp"
#include "model/Errors.hpp"

#include <string>
#include <vector>

#include <doctest/doctest.h>

using namespace tr;
using tr::client::TorrentCache;

namespace
{

std::vector<int> merge(TorrentCache &cache, std::string const &records)
{
    auto document = tests::parse_shared(records);
    return cache.merge(document, document->root());
}

std::vector<int> cached_ids(TorrentCache const &cache)
{
    std::vector<int> ids;
    for (auto const &torrent : cache.select())
    {
        ids.push_back(torrent->id());
    }
    return ids;
}

} // namespace

TEST_CASE("TorrentCache creates torrents and overlays later fields")
{
    TorrentCache cache;
    CHECK(merge(cache, R"([{"id":2,"name":"two"},{"id":1,"name":"one"}])") ==
          std::vector<int>{2, 1});
    CHECK(cache.size() == 2);

    merge(cache, R"([{"id":1,"status":6}])");
    auto selected = cache.select({1});
    REQUIRE(selected.size() == 1);
    CHECK(selected.front()->name() == "one");
    CHECK(selected.front()->get_as<model::Status>("status") ==
          model::Status::Seeding);
}

TEST_CASE("TorrentCache merge gives the same fields in either order")
{
    std::string const names = R"([{"id":1,"name":"one"}])";
    std::string const rates = R"([{"id":1,"rateDownload":500}])";

    TorrentCache forward;
    merge(forward, names);
    merge(forward, rates);

    TorrentCache backward;
    merge(backward, rates);
    merge(backward, names);

    auto a = forward.select({1}).front();
    auto b = backward.select({1}).front();
    CHECK(a->raw_fields() == b->raw_fields());
    CHECK(a->name() == b->name());
    CHECK(a->get_as<model::Quantity>("rate-down") ==
          b->get_as<model::Quantity>("rate-down"));
}

TEST_CASE("TorrentCache merge is all or nothing")
{
    TorrentCache cache;
    merge(cache, R"([{"id":1,"name":"one"}])");

    CHECK_THROWS_AS(merge(cache, R"([{"id":1,"name":"renamed"},{"name":"x"}])"),
                    tr::ProtocolError);
    CHECK_THROWS_AS(merge(cache, R"([{"id":"7"}])"), tr::ProtocolError);
    CHECK_THROWS_AS(merge(cache, R"({"id":1})"), tr::ProtocolError);

    CHECK(cache.size() == 1);
    CHECK(cache.select({1}).front()->name() == "one");
}

TEST_CASE("TorrentCache purge removes exactly the torrents not kept")
{
    TorrentCache cache;
    merge(cache, R"([{"id":1},{"id":2},{"id":3},{"id":4}])");
    cache.purge({2, 4, 99});
    CHECK(cached_ids(cache) == std::vector<int>{2, 4});
    CHECK_FALSE(cache.contains(99));
}

TEST_CASE("TorrentCache select keeps ID order and skips unknown IDs")
{
    TorrentCache cache;
    merge(cache, R"([{"id":5},{"id":3},{"id":8}])");
    CHECK(cached_ids(cache) == std::vector<int>{3, 5, 8});

    std::vector<int> picked;
    for (auto const &torrent : cache.select({8, 42, 3}))
    {
        picked.push_back(torrent->id());
    }
    CHECK(picked == std::vector<int>{3, 8});
}

TEST_CASE("TorrentCache fields_initialized waits for every listed torrent")
{
    TorrentCache cache;
    merge(cache, R"([{"id":1},{"id":2}])");
    CHECK_FALSE(cache.fields_initialized("files", std::vector<int>{1, 2}));

    merge(cache, R"([{"id":1,"files":[]}])");
    CHECK(cache.fields_initialized("files", std::vector<int>{1}));
    CHECK_FALSE(cache.fields_initialized("files", std::vector<int>{1, 2}));
    CHECK_FALSE(cache.fields_initialized("files"));

    merge(cache, R"([{"id":2,"files":[]}])");
    CHECK(cache.fields_initialized("files", std::vector<int>{1, 2}));
    CHECK(cache.fields_initialized("files"));
}
