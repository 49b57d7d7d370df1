#include "client/RequestCoordinator.hpp"

#include "model/Errors.hpp"
#include "model/FieldRegistry.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>

namespace tr::client
{

namespace
{

std::string join_ids(std::vector<int> const &ids)
{
    std::string joined;
    for (auto id : ids)
    {
        if (!joined.empty())
        {
            joined += ",";
        }
        joined += std::to_string(id);
    }
    return joined;
}

template <typename... Ts> struct Overloaded : Ts...
{
    using Ts::operator()...;
};
template <typename... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

RequestCoordinator::RequestCoordinator(Transport &transport,
                                       TorrentCache &cache,
                                       model::FilterCompiler compiler)
    : transport_(transport), cache_(cache), compiler_(std::move(compiler))
{
}

void RequestCoordinator::fetch_raw(std::vector<std::string> fields,
                                   std::optional<std::vector<int>> ids,
                                   IdsCallback callback)
{
    if (ids && ids->empty())
    {
        IdsResponse response;
        response.success = true;
        callback(std::move(response));
        return;
    }
    if (std::find(fields.begin(), fields.end(), "id") == fields.end())
    {
        fields.insert(fields.begin(), "id");
    }

    auto arguments = json::MutableDocument::object();
    auto *doc = arguments.doc();
    auto *root = arguments.root();
    yyjson_mut_obj_add_val(doc, root, "fields", json::string_array(doc, fields));
    if (ids)
    {
        yyjson_mut_obj_add_val(doc, root, "ids", json::int_array(doc, *ids));
    }
    TR_LOG_DEBUG("torrent-get ids=[{}] fields={}",
                 ids ? join_ids(*ids) : std::string("all"), fields.size());

    transport_.call(
        method::kTorrentGet, std::move(arguments),
        [this, callback = std::move(callback)](RpcReply reply)
        {
            if (!reply.ok())
            {
                callback(IdsResponse::failed({Message::error(*reply.error)}));
                return;
            }
            IdsResponse response;
            response.result = cache_.merge(
                reply.document, json::member(reply.arguments, "torrents"));
            response.success = true;
            callback(std::move(response));
        });
}

void RequestCoordinator::get_by_ids(std::vector<std::string> keys,
                                    std::optional<std::vector<int>> ids,
                                    TorrentsCallback callback)
{
    if (ids && ids->empty())
    {
        callback(TorrentsResponse{});
        return;
    }
    auto fields = model::rpc_fields_for(keys);

    // Static companions are requested once; afterwards the cache holds them.
    std::vector<std::string> companions;
    for (auto const &field : fields)
    {
        if (auto companion = model::static_companion(field))
        {
            companions.emplace_back(*companion);
        }
    }
    bool prefetch = false;
    for (auto const &companion : companions)
    {
        prefetch = prefetch || !cache_.fields_initialized(companion, ids);
    }
    if (!companions.empty() && ids)
    {
        prefetch = prefetch ||
                   !std::all_of(ids->begin(), ids->end(), [this](int id)
                                { return cache_.contains(id); });
    }

    auto fetch_fields =
        [this, fields = std::move(fields), ids, companions,
         callback]() mutable
    {
        fetch_raw(std::move(fields), ids,
                  [this, ids, companions = std::move(companions),
                   callback = std::move(callback)](IdsResponse fetched) mutable
                  {
                      if (!fetched.success)
                      {
                          callback(TorrentsResponse::failed(
                              std::move(fetched.messages)));
                          return;
                      }
                      finish_get_by_ids(std::move(companions), std::move(ids),
                                        std::move(fetched.result),
                                        std::move(callback));
                  });
    };

    if (!prefetch)
    {
        fetch_fields();
        return;
    }
    TR_LOG_DEBUG("initializing static fields for torrents: {}",
                 ids ? join_ids(*ids) : std::string("all"));
    fetch_raw(companions, ids,
              [fetch_fields = std::move(fetch_fields),
               callback = std::move(callback)](IdsResponse prepared) mutable
              {
                  if (!prepared.success)
                  {
                      callback(
                          TorrentsResponse::failed(std::move(prepared.messages)));
                      return;
                  }
                  fetch_fields();
              });
}

void RequestCoordinator::finish_get_by_ids(std::vector<std::string> companions,
                                           std::optional<std::vector<int>> ids,
                                           std::vector<int> fetched,
                                           TorrentsCallback callback)
{
    TorrentsResponse response;
    if (ids)
    {
        response.result = cache_.select(*ids);
        for (auto id : *ids)
        {
            if (!cache_.contains(id))
            {
                response.messages.push_back(
                    Message::error(std::format("No torrent with ID: {}", id)));
            }
        }
        response.success = !response.result.empty();
    }
    else
    {
        cache_.purge(fetched);
        response.result = cache_.select();
        response.success = true;
    }
    TR_LOG_DEBUG("found {} torrents", response.result.size());

    // Torrents that showed up after the companions were requested.
    std::vector<int> missing;
    for (auto const &torrent : response.result)
    {
        for (auto const &companion : companions)
        {
            if (!torrent->has_raw(companion))
            {
                missing.push_back(torrent->id());
                break;
            }
        }
    }
    if (missing.empty())
    {
        callback(std::move(response));
        return;
    }
    fetch_raw(std::move(companions), std::move(missing),
              [response = std::move(response),
               callback = std::move(callback)](IdsResponse completed) mutable
              {
                  if (!completed.success)
                  {
                      append_messages(response.messages, completed.messages);
                      callback(
                          TorrentsResponse::failed(std::move(response.messages)));
                      return;
                  }
                  callback(std::move(response));
              });
}

void RequestCoordinator::get_by_filter(std::vector<std::string> keys,
                                       model::TorrentFilterPtr filter,
                                       TorrentsCallback callback)
{
    if (!filter)
    {
        get_by_ids(std::move(keys), std::nullopt, std::move(callback));
        return;
    }
    auto description = filter->describe();
    TR_LOG_DEBUG("looking for {} torrents", description);

    get_by_ids(
        filter->needed_keys(), std::nullopt,
        [this, keys = std::move(keys), filter, description,
         callback = std::move(callback)](TorrentsResponse listing) mutable
        {
            auto no_match = Message::error(
                std::format("No matching torrents: {}", description));
            if (!listing.success)
            {
                listing.messages.push_back(std::move(no_match));
                callback(TorrentsResponse::failed(std::move(listing.messages)));
                return;
            }
            std::vector<int> wanted;
            for (auto const &torrent : filter->apply(listing.result))
            {
                wanted.push_back(torrent->id());
            }
            if (wanted.empty())
            {
                callback(TorrentsResponse::failed({std::move(no_match)}));
                return;
            }
            get_by_ids(
                std::move(keys), std::move(wanted),
                [description, no_match = std::move(no_match),
                 callback = std::move(callback)](
                    TorrentsResponse selected) mutable
                {
                    if (selected.result.empty())
                    {
                        selected.messages.push_back(std::move(no_match));
                        callback(TorrentsResponse::failed(
                            std::move(selected.messages)));
                        return;
                    }
                    auto const count = selected.result.size();
                    selected.success = true;
                    selected.messages.push_back(Message::info(
                        std::format("Found {} {} torrent{}", count, description,
                                    count == 1 ? "" : "s")));
                    callback(std::move(selected));
                });
        });
}

void RequestCoordinator::resolve(Selector const &selector,
                                 std::vector<std::string> keys,
                                 TorrentsCallback callback)
{
    std::visit(
        Overloaded{
            [&](AllTorrents)
            {
                get_by_ids(std::move(keys), std::nullopt, std::move(callback));
            },
            [&](model::TorrentFilterPtr const &filter)
            {
                if (!filter)
                {
                    throw std::invalid_argument("torrent filter is null");
                }
                get_by_filter(std::move(keys), filter, std::move(callback));
            },
            [&](std::string const &text)
            {
                if (!compiler_)
                {
                    throw std::invalid_argument(
                        "filter text given but no filter compiler configured");
                }
                model::TorrentFilterPtr filter;
                try
                {
                    filter = compiler_(text);
                }
                catch (FilterError const &ex)
                {
                    TR_LOG_DEBUG("invalid filter '{}': {}", text, ex.what());
                    callback(TorrentsResponse::failed({Message::error(ex.what())}));
                    return;
                }
                if (!filter)
                {
                    throw std::invalid_argument(
                        std::format("filter compiler returned nothing for '{}'",
                                    text));
                }
                get_by_filter(std::move(keys), std::move(filter),
                              std::move(callback));
            },
            [&](std::vector<int> const &ids)
            { get_by_ids(std::move(keys), ids, std::move(callback)); },
        },
        selector);
}

void RequestCoordinator::absolute_download_path(std::string path,
                                                PathCallback callback)
{
    if (utils::is_absolute_remote_path(path))
    {
        PathResponse response;
        response.success = true;
        response.result = utils::normalize_remote_path(path);
        callback(std::move(response));
        return;
    }
    auto arguments = json::MutableDocument::object();
    std::vector<std::string> const fields{"download-dir"};
    yyjson_mut_obj_add_val(arguments.doc(), arguments.root(), "fields",
                           json::string_array(arguments.doc(), fields));
    transport_.call(
        method::kSessionGet, std::move(arguments),
        [path = std::move(path), callback = std::move(callback)](RpcReply reply)
        {
            if (!reply.ok())
            {
                callback(PathResponse::failed({Message::error(*reply.error)}));
                return;
            }
            auto download_dir =
                json::get_string(json::member(reply.arguments, "download-dir"));
            if (!download_dir)
            {
                throw ProtocolError("session-get reply has no download-dir");
            }
            PathResponse response;
            response.success = true;
            response.result = utils::join_remote_path(*download_dir, path);
            callback(std::move(response));
        });
}

std::string describe_selector(Selector const &selector)
{
    return std::visit(
        Overloaded{
            [](AllTorrents) -> std::string { return "all torrents"; },
            [](model::TorrentFilterPtr const &filter) -> std::string
            { return filter ? filter->describe() : std::string("<no filter>"); },
            [](std::string const &text) -> std::string { return text; },
            [](std::vector<int> const &ids) -> std::string
            { return "IDs " + join_ids(ids); },
        },
        selector);
}

} // namespace tr::client
