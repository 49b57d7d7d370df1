#include "model/Filter.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace tr::model
{

TorrentList TorrentFilter::apply(TorrentList const &torrents) const
{
    TorrentList matching;
    std::copy_if(torrents.begin(), torrents.end(), std::back_inserter(matching),
                 [this](TorrentPtr const &torrent)
                 { return torrent && matches(*torrent); });
    return matching;
}

FileList FileFilter::apply(FileList const &files) const
{
    FileList matching;
    std::copy_if(files.begin(), files.end(), std::back_inserter(matching),
                 [this](TorrentFile const &file) { return matches(file); });
    return matching;
}

PredicateFilter::PredicateFilter(std::string description,
                                 std::vector<std::string> keys,
                                 Predicate predicate)
    : description_(std::move(description)), keys_(std::move(keys)),
      predicate_(std::move(predicate))
{
}

bool PredicateFilter::matches(Torrent const &torrent) const
{
    return predicate_ && predicate_(torrent);
}

FilePredicateFilter::FilePredicateFilter(std::string description,
                                         Predicate predicate)
    : description_(std::move(description)), predicate_(std::move(predicate))
{
}

bool FilePredicateFilter::matches(TorrentFile const &file) const
{
    return predicate_ && predicate_(file);
}

} // namespace tr::model
