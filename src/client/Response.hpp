#pragma once

#include "model/Torrent.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace tr::client
{

struct Message
{
    enum class Kind
    {
        Info,
        Error,
    };

    Kind kind = Kind::Info;
    std::string text;

    static Message info(std::string text)
    {
        return Message{Kind::Info, std::move(text)};
    }
    static Message error(std::string text)
    {
        return Message{Kind::Error, std::move(text)};
    }

    bool is_error() const noexcept { return kind == Kind::Error; }
};

using Messages = std::vector<Message>;

inline void append_messages(Messages &target, Messages const &source)
{
    target.insert(target.end(), source.begin(), source.end());
}

// Outcome of every client operation. Failures the caller can act on are
// error messages here; only contract violations are thrown.
template <typename T> struct Response
{
    bool success = false;
    T result{};
    Messages messages;

    static Response failed(Messages messages)
    {
        Response response;
        response.messages = std::move(messages);
        return response;
    }
};

using TorrentsResponse = Response<model::TorrentList>;
using TorrentResponse = Response<model::TorrentPtr>;
using PathResponse = Response<std::string>;
using IdsResponse = Response<std::vector<int>>;

using TorrentsCallback = std::function<void(TorrentsResponse)>;
using TorrentCallback = std::function<void(TorrentResponse)>;
using PathCallback = std::function<void(PathResponse)>;
using IdsCallback = std::function<void(IdsResponse)>;

} // namespace tr::client
