#include "utils/Base64.hpp"
#include "utils/FS.hpp"
#include "utils/InfoHash.hpp"
#include "utils/Text.hpp"
#include "utils/Url.hpp"

#include <string>

#include <doctest/doctest.h>

using namespace tr;

TEST_CASE("urls_equal ignores scheme and host case and default ports")
{
    CHECK(net::urls_equal("http://Tracker.Example.org/announce",
                          "HTTP://tracker.example.org:80/announce"));
    CHECK(net::urls_equal("tracker.example.org/announce",
                          "http://tracker.example.org/announce"));
    CHECK(net::urls_equal("https://example.org", "https://example.org:443/"));
}

TEST_CASE("urls_equal keeps path, query and non-default ports significant")
{
    CHECK_FALSE(net::urls_equal("http://example.org/announce",
                                "http://example.org/announce/"));
    CHECK_FALSE(net::urls_equal("http://example.org/Announce",
                                "http://example.org/announce"));
    CHECK_FALSE(net::urls_equal("http://example.org/announce?key=1",
                                "http://example.org/announce"));
    CHECK_FALSE(net::urls_equal("udp://example.org:80/announce",
                                "udp://example.org/announce"));
}

TEST_CASE("parse_url splits bracketed IPv6 hosts")
{
    auto url = net::parse_url("http://[::1]:9091/transmission/rpc");
    CHECK(url.scheme == "http");
    CHECK(url.host == "::1");
    CHECK(url.port == "9091");
    CHECK(url.path == "/transmission/rpc");
    CHECK(net::normalize_url("http://[::1]:80/") == "http://[::1]/");
}

TEST_CASE("authority brackets IPv6 hosts and drops empty ports")
{
    auto url = net::parse_url("https://user:pw@LocalHost:9091");
    CHECK(url.host == "localhost");
    CHECK(url.port == "9091");
    CHECK(url.path == "/");
    CHECK(net::authority("::1", "80") == "[::1]:80");
    CHECK(net::authority("nas", "") == "nas");
    CHECK(utils::trim("  spaced \n") == "spaced");
    CHECK(utils::trim(" \t").empty());
}

TEST_CASE("remote paths are normalized and joined")
{
    CHECK(utils::is_absolute_remote_path("/srv/data"));
    CHECK_FALSE(utils::is_absolute_remote_path("data"));
    CHECK(utils::normalize_remote_path("/srv//data/./movies/") ==
          "/srv/data/movies");
    CHECK(utils::join_remote_path("/srv/downloads", "../music") ==
          "/srv/music");
    CHECK(utils::join_remote_path("/srv/downloads", "/abs/path") == "/abs/path");
}

TEST_CASE("encode_base64 pads the output")
{
    CHECK(utils::encode_base64(std::string_view("d4:")) == "ZDQ6");
    CHECK(utils::encode_base64(std::string_view("ab")) == "YWI=");
    CHECK(utils::encode_base64(std::string_view("a")) == "YQ==");
}

TEST_CASE("magnet_from_info_hash builds a btih magnet link")
{
    std::string const hash = "0123456789abcdef0123456789ABCDEF01234567";
    auto magnet = utils::magnet_from_info_hash(hash);
    REQUIRE(magnet);
    CHECK(magnet->starts_with("magnet:?xt=urn:btih:"));
    CHECK(magnet->find("0123456789abcdef0123456789abcdef01234567") !=
          std::string::npos);

    CHECK_FALSE(utils::magnet_from_info_hash("not-a-hash"));
    CHECK_FALSE(utils::magnet_from_info_hash(
        "0123456789abcdef0123456789abcdef0123456z"));
}
