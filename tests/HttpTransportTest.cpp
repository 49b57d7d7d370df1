#include "client/HttpTransport.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <doctest/doctest.h>
#include <mongoose.h>

using namespace tr;
using namespace tr::client;
using namespace std::chrono_literals;

namespace
{

struct FakeDaemon
{
    enum class Mode
    {
        Normal,
        Unauthorized,
        Rejected,
        Garbage,
        Silent,
    };

    Mode mode = Mode::Normal;
    std::string session = "session-1";
    int requests = 0;
    int conflicts = 0;
    std::string last_body;
    std::string last_authorization;
};

void daemon_handler(struct mg_connection *conn, int ev, void *ev_data)
{
    if (ev != MG_EV_HTTP_MSG)
    {
        return;
    }
    auto *daemon = static_cast<FakeDaemon *>(conn->fn_data);
    auto *hm = static_cast<struct mg_http_message *>(ev_data);
    ++daemon->requests;
    daemon->last_body.assign(hm->body.buf, hm->body.len);
    if (auto *auth = mg_http_get_header(hm, "Authorization"))
    {
        daemon->last_authorization.assign(auth->buf, auth->len);
    }

    switch (daemon->mode)
    {
    case FakeDaemon::Mode::Silent:
        return;
    case FakeDaemon::Mode::Unauthorized:
        mg_http_reply(conn, 401, "", "%s", "Unauthorized");
        return;
    default:
        break;
    }

    auto *token = mg_http_get_header(hm, "X-Transmission-Session-Id");
    if (token == nullptr ||
        std::string_view(token->buf, token->len) != daemon->session)
    {
        ++daemon->conflicts;
        auto headers = "X-Transmission-Session-Id: " + daemon->session + "\r\n";
        mg_http_reply(conn, 409, headers.c_str(), "%s", "");
        return;
    }

    char const *json = "Content-Type: application/json\r\n";
    switch (daemon->mode)
    {
    case FakeDaemon::Mode::Rejected:
        mg_http_reply(conn, 200, json, "%s", R"({"result":"no such method"})");
        break;
    case FakeDaemon::Mode::Garbage:
        mg_http_reply(conn, 200, json, "%s", "<html>");
        break;
    default:
        mg_http_reply(conn, 200, json, "%s",
                      R"({"result":"success","arguments":{"download-dir":"/srv/dl"}})");
        break;
    }
}

class Harness
{
  public:
    Harness()
    {
        mg_mgr_init(&mgr_);
        auto *listener = mg_http_listen(&mgr_, "http://127.0.0.1:0",
                                        daemon_handler, &daemon);
        if (listener == nullptr)
        {
            mg_mgr_free(&mgr_);
            throw std::runtime_error("cannot listen on 127.0.0.1");
        }
        port_ = mg_ntohs(listener->loc.port);
    }

    ~Harness() { mg_mgr_free(&mgr_); }

    Harness(Harness const &) = delete;
    Harness &operator=(Harness const &) = delete;

    ClientSettings settings() const
    {
        ClientSettings settings;
        settings.rpc_url = "http://127.0.0.1:" + std::to_string(port_) +
                           "/transmission/rpc";
        settings.timeout = 3000ms;
        return settings;
    }

    // Drives both sides until `reply` is filled or the rounds run out.
    void run(HttpTransport &transport, std::optional<RpcReply> const &reply)
    {
        for (int round = 0; round < 600 && !reply; ++round)
        {
            mg_mgr_poll(&mgr_, 5);
            transport.poll(5);
        }
    }

    FakeDaemon daemon;

  private:
    mg_mgr mgr_;
    std::uint16_t port_ = 0;
};

ReplyCallback store(std::optional<RpcReply> &target)
{
    return [&target](RpcReply reply) { target = std::move(reply); };
}

json::MutableDocument session_fields()
{
    auto arguments = json::MutableDocument::object();
    yyjson_mut_obj_add_str(arguments.doc(), arguments.root(), "format",
                           "object");
    return arguments;
}

} // namespace

TEST_CASE("HttpTransport renews the session id once and retries")
{
    Harness harness;
    HttpTransport transport(harness.settings());

    std::optional<RpcReply> reply;
    transport.call(method::kSessionGet, session_fields(), store(reply));
    harness.run(transport, reply);

    REQUIRE(reply);
    CHECK(reply->ok());
    CHECK(json::get_string(json::member(reply->arguments, "download-dir")) ==
          std::string_view("/srv/dl"));
    CHECK(harness.daemon.conflicts == 1);
    CHECK(harness.daemon.requests == 2);
    CHECK(transport.session_id() == "session-1");
    CHECK(harness.daemon.last_body.find(R"("method":"session-get")") !=
          std::string::npos);
    CHECK(harness.daemon.last_body.find(R"("format":"object")") !=
          std::string::npos);

    std::optional<RpcReply> again;
    transport.call(method::kSessionGet, json::MutableDocument::object(),
                   store(again));
    harness.run(transport, again);
    REQUIRE(again);
    CHECK(again->ok());
    CHECK(harness.daemon.conflicts == 1);
    CHECK_FALSE(transport.busy());
}

TEST_CASE("HttpTransport sends basic auth credentials")
{
    Harness harness;
    auto settings = harness.settings();
    settings.user = "admin";
    settings.password = "secret";
    HttpTransport transport(settings);

    std::optional<RpcReply> reply;
    transport.call(method::kSessionGet, json::MutableDocument::object(),
                   store(reply));
    harness.run(transport, reply);

    REQUIRE(reply);
    CHECK(reply->ok());
    CHECK(harness.daemon.last_authorization == "Basic YWRtaW46c2VjcmV0");
}

TEST_CASE("HttpTransport turns HTTP and daemon errors into failed replies")
{
    Harness harness;
    HttpTransport transport(harness.settings());

    SUBCASE("unauthorized")
    {
        harness.daemon.mode = FakeDaemon::Mode::Unauthorized;
        std::optional<RpcReply> reply;
        transport.call(method::kTorrentGet, json::MutableDocument::object(),
                       store(reply));
        harness.run(transport, reply);
        REQUIRE(reply);
        CHECK(reply->error == std::string("authentication failed"));
    }

    SUBCASE("rejected by the daemon")
    {
        harness.daemon.mode = FakeDaemon::Mode::Rejected;
        std::optional<RpcReply> reply;
        transport.call("torrent-frobnicate", json::MutableDocument::object(),
                       store(reply));
        harness.run(transport, reply);
        REQUIRE(reply);
        CHECK(reply->error == std::string("no such method"));
    }

    SUBCASE("not JSON")
    {
        harness.daemon.mode = FakeDaemon::Mode::Garbage;
        std::optional<RpcReply> reply;
        transport.call(method::kTorrentGet, json::MutableDocument::object(),
                       store(reply));
        harness.run(transport, reply);
        REQUIRE(reply);
        CHECK(reply->error == std::string("invalid JSON in daemon reply"));
    }
}

TEST_CASE("HttpTransport expires calls after the configured timeout")
{
    Harness harness;
    harness.daemon.mode = FakeDaemon::Mode::Silent;
    auto settings = harness.settings();
    settings.timeout = 200ms;
    HttpTransport transport(settings);

    std::optional<RpcReply> reply;
    transport.call(method::kTorrentGet, json::MutableDocument::object(),
                   store(reply));
    harness.run(transport, reply);

    REQUIRE(reply);
    CHECK(reply->timed_out);
    CHECK(reply->error == std::string("request timed out after 200 ms"));
    CHECK_FALSE(transport.busy());
}

TEST_CASE("HttpTransport completes cancelled calls on the next poll")
{
    Harness harness;
    harness.daemon.mode = FakeDaemon::Mode::Silent;
    HttpTransport transport(harness.settings());

    std::optional<RpcReply> reply;
    auto id = transport.call(method::kTorrentGet,
                             json::MutableDocument::object(), store(reply));
    transport.poll(5);
    transport.cancel(id);
    CHECK_FALSE(reply);

    transport.poll(0);
    REQUIRE(reply);
    CHECK(reply->cancelled);
    CHECK(reply->error == std::string(kCancelledMessage));

    // A second cancel of a finished call changes nothing.
    transport.cancel(id);
    transport.poll(0);
    CHECK(reply->cancelled);
}

TEST_CASE("HttpTransport never completes a call from inside call()")
{
    ClientSettings settings;
    settings.rpc_url = "http://127.0.0.1:1/transmission/rpc";
    settings.timeout = 1000ms;
    HttpTransport transport(settings);

    std::optional<RpcReply> reply;
    transport.call(method::kSessionGet, json::MutableDocument::object(),
                   store(reply));
    CHECK_FALSE(reply);
    CHECK(transport.busy());

    for (int round = 0; round < 400 && !reply; ++round)
    {
        transport.poll(5);
    }
    REQUIRE(reply);
    CHECK_FALSE(reply->ok());
    CHECK_FALSE(reply->cancelled);
}
