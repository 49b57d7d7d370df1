#pragma once

#include "model/Torrent.hpp"
#include "model/Values.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tr::model
{

class TorrentFilter
{
  public:
    virtual ~TorrentFilter() = default;

    // Keys that must be fetched before matches() can be called.
    virtual std::vector<std::string> needed_keys() const = 0;
    virtual bool matches(Torrent const &torrent) const = 0;
    virtual std::string describe() const = 0;

    TorrentList apply(TorrentList const &torrents) const;
};

class FileFilter
{
  public:
    virtual ~FileFilter() = default;

    virtual bool matches(TorrentFile const &file) const = 0;
    virtual std::string describe() const = 0;

    FileList apply(FileList const &files) const;
};

using TorrentFilterPtr = std::shared_ptr<TorrentFilter const>;
using FileFilterPtr = std::shared_ptr<FileFilter const>;

// Turn filter text into a filter; throw tr::FilterError on malformed text.
using FilterCompiler = std::function<TorrentFilterPtr(std::string_view)>;
using FileFilterCompiler = std::function<FileFilterPtr(std::string_view)>;

class PredicateFilter : public TorrentFilter
{
  public:
    using Predicate = std::function<bool(Torrent const &)>;

    PredicateFilter(std::string description, std::vector<std::string> keys,
                    Predicate predicate);

    std::vector<std::string> needed_keys() const override { return keys_; }
    bool matches(Torrent const &torrent) const override;
    std::string describe() const override { return description_; }

  private:
    std::string description_;
    std::vector<std::string> keys_;
    Predicate predicate_;
};

class FilePredicateFilter : public FileFilter
{
  public:
    using Predicate = std::function<bool(TorrentFile const &)>;

    FilePredicateFilter(std::string description, Predicate predicate);

    bool matches(TorrentFile const &file) const override;
    std::string describe() const override { return description_; }

  private:
    std::string description_;
    Predicate predicate_;
};

} // namespace tr::model
