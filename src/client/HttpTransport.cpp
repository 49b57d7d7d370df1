#include "client/HttpTransport.hpp"

#include "utils/Base64.hpp"
#include "utils/Log.hpp"
#include "utils/Url.hpp"
#include "utils/Version.hpp"

#include <format>
#include <vector>

namespace tr::client
{

namespace
{

constexpr char const kSessionHeader[] = "X-Transmission-Session-Id";

std::string header_value(struct mg_http_message *hm, char const *name)
{
    if (auto *header = mg_http_get_header(hm, name))
    {
        return std::string(header->buf, header->len);
    }
    return {};
}

} // namespace

HttpTransport::HttpTransport(ClientSettings settings)
    : settings_(std::move(settings))
{
    auto const url = net::parse_url(settings_.rpc_url);
    host_header_ = net::authority(url.host, url.port);
    target_ = url.path;
    if (settings_.user)
    {
        authorization_ = "Basic " + utils::encode_base64(std::format(
                                        "{}:{}", *settings_.user,
                                        settings_.password.value_or("")));
    }
    mg_mgr_init(&mgr_);
}

HttpTransport::~HttpTransport()
{
    // mg_mgr_free emits MG_EV_CLOSE; detach every connection first
    for (auto &[id, pending] : calls_)
    {
        if (pending->conn != nullptr)
        {
            pending->conn->fn_data = nullptr;
        }
    }
    mg_mgr_free(&mgr_);
}

CallId HttpTransport::call(std::string_view method,
                           json::MutableDocument arguments,
                           ReplyCallback callback)
{
    auto const id = next_id_++;

    auto envelope = json::MutableDocument::object();
    auto *doc = envelope.doc();
    auto *root = envelope.root();
    yyjson_mut_obj_add_strncpy(doc, root, "method", method.data(), method.size());
    auto *args = arguments.root() != nullptr
                     ? yyjson_mut_val_mut_copy(doc, arguments.root())
                     : yyjson_mut_obj(doc);
    yyjson_mut_obj_add_val(doc, root, "arguments", args);
    yyjson_mut_obj_add_uint(doc, root, "tag", id);

    auto pending = std::make_unique<PendingCall>();
    pending->owner = this;
    pending->id = id;
    pending->method = std::string(method);
    pending->body = envelope.write();
    pending->callback = std::move(callback);
    pending->deadline = std::chrono::steady_clock::now() + settings_.timeout;
    auto &ref = *pending;
    calls_.emplace(id, std::move(pending));

    TR_LOG_DEBUG("rpc #{} {} -> {}", id, ref.method, settings_.rpc_url);
    if (!open(ref))
    {
        finish(id, RpcReply::failure(
                       std::format("cannot connect to {}", settings_.rpc_url)));
    }
    return id;
}

void HttpTransport::cancel(CallId id)
{
    if (calls_.find(id) == calls_.end())
    {
        return;
    }
    TR_LOG_DEBUG("rpc #{} cancelled", id);
    auto reply = RpcReply::failure(kCancelledMessage);
    reply.cancelled = true;
    finish(id, std::move(reply));
}

void HttpTransport::poll(int timeout_ms)
{
    mg_mgr_poll(&mgr_, timeout_ms);

    auto const now = std::chrono::steady_clock::now();
    std::vector<CallId> expired;
    for (auto const &[id, pending] : calls_)
    {
        if (pending->deadline <= now)
        {
            expired.push_back(id);
        }
    }
    for (auto id : expired)
    {
        TR_LOG_WARN("rpc #{} timed out after {} ms", id,
                    settings_.timeout.count());
        auto reply = RpcReply::failure(std::format(
            "request timed out after {} ms", settings_.timeout.count()));
        reply.timed_out = true;
        finish(id, std::move(reply));
    }
    dispatch_completed();
}

bool HttpTransport::open(PendingCall &pending)
{
    pending.conn = mg_http_connect(&mgr_, settings_.rpc_url.c_str(),
                                   &HttpTransport::handle_event, &pending);
    return pending.conn != nullptr;
}

void HttpTransport::handle_event(struct mg_connection *conn, int ev,
                                 void *ev_data)
{
    if (conn == nullptr)
    {
        return;
    }
    auto *pending = static_cast<PendingCall *>(conn->fn_data);
    if (pending == nullptr)
    {
        return;
    }
    auto *self = pending->owner;

    switch (ev)
    {
    case MG_EV_CONNECT:
        self->send_request(conn, *pending);
        break;
    case MG_EV_HTTP_MSG:
        self->handle_reply(conn, *pending,
                           static_cast<struct mg_http_message *>(ev_data));
        break;
    case MG_EV_ERROR:
        TR_LOG_WARN("rpc #{} connection error: {}", pending->id,
                    static_cast<char const *>(ev_data));
        self->finish(pending->id,
                     RpcReply::failure(std::format(
                         "connection error: {}",
                         static_cast<char const *>(ev_data))));
        break;
    case MG_EV_CLOSE:
        self->finish(pending->id,
                     RpcReply::failure("connection closed before reply"));
        break;
    default:
        break;
    }
}

void HttpTransport::send_request(struct mg_connection *conn,
                                 PendingCall &pending)
{
    if (mg_url_is_ssl(settings_.rpc_url.c_str()))
    {
        struct mg_tls_opts opts = {};
        opts.name = mg_url_host(settings_.rpc_url.c_str());
        mg_tls_init(conn, &opts);
    }
    auto request = std::format("POST {} HTTP/1.1\r\n"
                               "Host: {}\r\n"
                               "Content-Type: application/json\r\n"
                               "Content-Length: {}\r\n"
                               "User-Agent: {}\r\n",
                               target_, host_header_, pending.body.size(),
                               tr::version::kUserAgentVersion);
    if (!session_id_.empty())
    {
        request += std::format("{}: {}\r\n", kSessionHeader, session_id_);
    }
    if (!authorization_.empty())
    {
        request += std::format("Authorization: {}\r\n", authorization_);
    }
    request += "\r\n";
    request += pending.body;
    mg_send(conn, request.data(), request.size());
}

void HttpTransport::handle_reply(struct mg_connection *conn,
                                 PendingCall &pending,
                                 struct mg_http_message *hm)
{
    auto const status = mg_http_status(hm);
    auto const id = pending.id;

    if (status == 409)
    {
        auto token = header_value(hm, kSessionHeader);
        if (pending.retried || token.empty())
        {
            finish(id, RpcReply::failure("HTTP 409"));
            return;
        }
        TR_LOG_INFO("rpc session id renewed");
        session_id_ = std::move(token);
        pending.retried = true;
        conn->fn_data = nullptr;
        conn->is_closing = 1;
        if (!open(pending))
        {
            finish(id, RpcReply::failure(std::format("cannot connect to {}",
                                                     settings_.rpc_url)));
        }
        return;
    }
    if (status == 401)
    {
        finish(id, RpcReply::failure("authentication failed"));
        return;
    }
    if (status != 200)
    {
        finish(id, RpcReply::failure(std::format("HTTP {}", status)));
        return;
    }

    auto document =
        json::Document::parse(std::string_view(hm->body.buf, hm->body.len));
    if (!document.is_valid() || !yyjson_is_obj(document.root()))
    {
        finish(id, RpcReply::failure("invalid JSON in daemon reply"));
        return;
    }
    auto result = json::get_string(json::member(document.root(), "result"));
    if (!result)
    {
        finish(id, RpcReply::failure("daemon reply has no result"));
        return;
    }
    if (*result != "success")
    {
        TR_LOG_WARN("rpc #{} {} rejected: {}", id, pending.method, *result);
        finish(id, RpcReply::failure(std::string(*result)));
        return;
    }
    RpcReply reply;
    reply.arguments = json::member(document.root(), "arguments");
    reply.document = json::share(std::move(document));
    finish(id, std::move(reply));
}

void HttpTransport::finish(CallId id, RpcReply reply)
{
    auto it = calls_.find(id);
    if (it == calls_.end())
    {
        return;
    }
    auto pending = std::move(it->second);
    calls_.erase(it);
    if (pending->conn != nullptr)
    {
        pending->conn->fn_data = nullptr;
        pending->conn->is_closing = 1;
    }
    completed_.emplace_back(std::move(pending->callback), std::move(reply));
}

void HttpTransport::dispatch_completed()
{
    // Callbacks may issue or cancel calls; those land in the queue too.
    while (!completed_.empty())
    {
        auto [callback, reply] = std::move(completed_.front());
        completed_.pop_front();
        if (callback)
        {
            callback(std::move(reply));
        }
    }
}

} // namespace tr::client
