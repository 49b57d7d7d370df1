#pragma once

#include "client/ClientSettings.hpp"
#include "client/Transport.hpp"

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <utility>

#include <mongoose.h>

namespace tr::client
{

// Transmission RPC over HTTP. Handles the X-Transmission-Session-Id
// handshake and basic auth; everything, completions included, happens
// inside poll() on the caller's thread. Calls still pending when the
// transport is destroyed are dropped without completion.
class HttpTransport : public Transport
{
  public:
    explicit HttpTransport(ClientSettings settings);
    ~HttpTransport() override;

    HttpTransport(HttpTransport const &) = delete;
    HttpTransport &operator=(HttpTransport const &) = delete;

    CallId call(std::string_view method, json::MutableDocument arguments,
                ReplyCallback callback) override;
    void cancel(CallId id) override;

    // Runs the event loop for up to `timeout_ms`, expires overdue calls and
    // then invokes the callbacks of every call that completed.
    void poll(int timeout_ms);
    bool busy() const noexcept { return !calls_.empty() || !completed_.empty(); }

    std::string const &session_id() const noexcept { return session_id_; }

  private:
    struct PendingCall
    {
        HttpTransport *owner = nullptr;
        CallId id = 0;
        std::string method;
        std::string body;
        ReplyCallback callback;
        std::chrono::steady_clock::time_point deadline;
        struct mg_connection *conn = nullptr;
        bool retried = false;
    };

    static void handle_event(struct mg_connection *conn, int ev, void *ev_data);

    bool open(PendingCall &pending);
    void send_request(struct mg_connection *conn, PendingCall &pending);
    void handle_reply(struct mg_connection *conn, PendingCall &pending,
                      struct mg_http_message *hm);
    void finish(CallId id, RpcReply reply);
    void dispatch_completed();

    ClientSettings settings_;
    std::string host_header_;
    std::string target_;
    std::string authorization_;
    std::string session_id_;
    CallId next_id_ = 1;
    std::map<CallId, std::unique_ptr<PendingCall>> calls_;
    std::deque<std::pair<ReplyCallback, RpcReply>> completed_;
    mg_mgr mgr_;
};

} // namespace tr::client
