#pragma once

#include "utils/Json.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace tr::client
{

namespace method
{
inline constexpr char const kSessionGet[] = "session-get";
inline constexpr char const kTorrentGet[] = "torrent-get";
inline constexpr char const kTorrentAdd[] = "torrent-add";
inline constexpr char const kTorrentRemove[] = "torrent-remove";
inline constexpr char const kTorrentStart[] = "torrent-start";
inline constexpr char const kTorrentStartNow[] = "torrent-start-now";
inline constexpr char const kTorrentStop[] = "torrent-stop";
inline constexpr char const kTorrentVerify[] = "torrent-verify";
inline constexpr char const kTorrentReannounce[] = "torrent-reannounce";
inline constexpr char const kTorrentSet[] = "torrent-set";
inline constexpr char const kTorrentSetLocation[] = "torrent-set-location";
} // namespace method

using CallId = std::uint64_t;

struct RpcReply
{
    std::optional<std::string> error;
    bool cancelled = false;
    bool timed_out = false;
    // Keeps `arguments` alive.
    json::SharedDocument document;
    yyjson_val *arguments = nullptr;

    bool ok() const noexcept { return !error.has_value(); }

    static RpcReply failure(std::string message)
    {
        RpcReply reply;
        reply.error = std::move(message);
        return reply;
    }
};

using ReplyCallback = std::function<void(RpcReply)>;

// One daemon connection. Implementations complete every call exactly once,
// from the thread that drives them, and never from inside call() itself.
class Transport
{
  public:
    virtual ~Transport() = default;

    virtual CallId call(std::string_view method, json::MutableDocument arguments,
                        ReplyCallback callback) = 0;
    // Completes the call with a "request cancelled" failure; unknown or
    // finished calls are ignored.
    virtual void cancel(CallId id) = 0;
};

inline constexpr char const kCancelledMessage[] = "request cancelled";

} // namespace tr::client
