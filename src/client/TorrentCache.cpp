#include "client/TorrentCache.hpp"

#include "model/Errors.hpp"

#include <algorithm>
#include <format>
#include <set>

namespace tr::client
{

std::vector<int> TorrentCache::merge(json::SharedDocument const &document,
                                     yyjson_val *records)
{
    if (records == nullptr || !yyjson_is_arr(records))
    {
        throw ProtocolError("torrent list is not an array");
    }
    std::vector<int> ids;
    ids.reserve(yyjson_arr_size(records));
    size_t index = 0;
    size_t count = 0;
    yyjson_val *record = nullptr;
    yyjson_arr_foreach(records, index, count, record)
    {
        auto *id_value = json::member(record, "id");
        if (id_value == nullptr || !yyjson_is_int(id_value))
        {
            throw ProtocolError(std::format(
                "torrent record {} has no integer id: {}", index,
                json::write(record)));
        }
        ids.push_back(static_cast<int>(yyjson_get_sint(id_value)));
    }

    yyjson_arr_foreach(records, index, count, record)
    {
        auto id = ids[index];
        auto &torrent = torrents_[id];
        if (!torrent)
        {
            torrent = std::make_shared<model::Torrent>(id);
        }
        torrent->update(document, record);
    }
    return ids;
}

void TorrentCache::purge(std::vector<int> const &keep_ids)
{
    std::set<int> const keep(keep_ids.begin(), keep_ids.end());
    for (auto it = torrents_.begin(); it != torrents_.end();)
    {
        if (keep.count(it->first) == 0)
        {
            it = torrents_.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

model::TorrentList TorrentCache::select() const
{
    model::TorrentList selected;
    selected.reserve(torrents_.size());
    for (auto const &[id, torrent] : torrents_)
    {
        selected.push_back(torrent);
    }
    return selected;
}

model::TorrentList TorrentCache::select(std::vector<int> const &ids) const
{
    std::set<int> const wanted(ids.begin(), ids.end());
    model::TorrentList selected;
    for (auto id : wanted)
    {
        if (auto it = torrents_.find(id); it != torrents_.end())
        {
            selected.push_back(it->second);
        }
    }
    return selected;
}

bool TorrentCache::fields_initialized(
    std::string_view field, std::optional<std::vector<int>> const &ids) const
{
    if (!ids)
    {
        return std::all_of(torrents_.begin(), torrents_.end(),
                           [field](auto const &entry)
                           { return entry.second->has_raw(field); });
    }
    return std::all_of(ids->begin(), ids->end(),
                       [this, field](int id)
                       {
                           auto it = torrents_.find(id);
                           return it == torrents_.end() ||
                                  it->second->has_raw(field);
                       });
}

bool TorrentCache::contains(int id) const
{
    return torrents_.find(id) != torrents_.end();
}

} // namespace tr::client
