#pragma once

#include "client/Response.hpp"
#include "client/TorrentCache.hpp"
#include "client/Transport.hpp"
#include "model/Filter.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tr::client
{

struct AllTorrents
{
};

// Which torrents an operation applies to: every torrent, a filter, filter
// text for the injected compiler, or explicit IDs.
using Selector = std::variant<AllTorrents, model::TorrentFilterPtr, std::string,
                              std::vector<int>>;

// Decides which daemon fields to request, keeps the cache current and turns
// selectors into torrent lists. Must outlive every call it has in flight.
class RequestCoordinator
{
  public:
    RequestCoordinator(Transport &transport, TorrentCache &cache,
                       model::FilterCompiler compiler = {});

    // Plain torrent-get of daemon `fields` ("id" is always added). No `ids`
    // lists every torrent; an empty list succeeds without asking the daemon.
    // The result holds the IDs the daemon returned.
    void fetch_raw(std::vector<std::string> fields,
                   std::optional<std::vector<int>> ids, IdsCallback callback);

    void get_by_ids(std::vector<std::string> keys,
                    std::optional<std::vector<int>> ids,
                    TorrentsCallback callback);

    // A null filter lists every torrent.
    void get_by_filter(std::vector<std::string> keys,
                       model::TorrentFilterPtr filter, TorrentsCallback callback);

    // Throws std::invalid_argument for a null filter, or for filter text
    // when no compiler was given.
    void resolve(Selector const &selector, std::vector<std::string> keys,
                 TorrentsCallback callback);

    // Relative paths are taken relative to the daemon's download-dir.
    void absolute_download_path(std::string path, PathCallback callback);

    Transport &transport() noexcept { return transport_; }
    TorrentCache const &cache() const noexcept { return cache_; }

  private:
    void fetch_companions(std::vector<std::string> companions,
                          std::vector<int> ids, std::function<void()> done,
                          TorrentsCallback fail);
    void finish_get_by_ids(std::vector<std::string> companions,
                           std::optional<std::vector<int>> ids,
                           std::vector<int> fetched, TorrentsCallback callback);

    Transport &transport_;
    TorrentCache &cache_;
    model::FilterCompiler compiler_;
};

std::string describe_selector(Selector const &selector);

} // namespace tr::client
