#pragma once

#include "model/Torrent.hpp"
#include "utils/Json.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace tr::client
{

// Torrents of one daemon keyed by ID. Entries are created when the daemon
// first reports them and only disappear through purge().
class TorrentCache
{
  public:
    // Applies a torrent-get "torrents" array. The batch is validated first:
    // a non-array or a record without an integer "id" throws
    // tr::ProtocolError and leaves the cache untouched. Returns the IDs in
    // reply order.
    std::vector<int> merge(json::SharedDocument const &document,
                           yyjson_val *records);

    // `keep_ids` must be the complete set of IDs the daemon currently has.
    void purge(std::vector<int> const &keep_ids);

    model::TorrentList select() const;
    // Unknown IDs are skipped; the result is in ID order.
    model::TorrentList select(std::vector<int> const &ids) const;

    // Whether every cached torrent among `ids` (all when omitted) has the
    // daemon field. IDs that are not cached do not count.
    bool fields_initialized(std::string_view field,
                            std::optional<std::vector<int>> const &ids = {}) const;

    bool contains(int id) const;
    std::size_t size() const noexcept { return torrents_.size(); }

  private:
    std::map<int, std::shared_ptr<model::Torrent>> torrents_;
};

} // namespace tr::client
