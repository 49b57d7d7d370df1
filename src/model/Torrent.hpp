#pragma once

#include "model/Convert.hpp"
#include "model/Values.hpp"
#include "utils/Json.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tr::model
{

// One remote torrent: the raw daemon fields seen so far plus typed values
// converted from them on first read. A typed value is dropped as soon as one
// of the daemon fields it was derived from is overwritten; readers get copies,
// so values they hold stay valid across later merges.
class Torrent
{
  public:
    explicit Torrent(int id);

    int id() const noexcept { return id_; }

    // Overlays every member of `record` (a daemon torrent object that lives
    // in `document`). Members missing from `record` keep their old value.
    void update(json::SharedDocument const &document, yyjson_val *record);

    bool has_raw(std::string_view field) const;
    // nullptr when the field was never fetched.
    yyjson_val *raw(std::string_view field) const;
    std::vector<std::string> raw_fields() const;

    // Throws std::invalid_argument for keys that are not registered.
    bool has(std::string_view key) const;
    // Throws std::out_of_range when the key's daemon fields are missing.
    Value get(std::string_view key) const;

    template <typename T> T get_as(std::string_view key) const
    {
        return std::get<T>(get(key));
    }

    std::string format(std::string_view key, UnitOptions const &units = {}) const;

    // Empty until "name" was fetched.
    std::string name() const;

  private:
    struct RawSlot
    {
        json::SharedDocument document;
        yyjson_val *value = nullptr;
    };

    int id_;
    std::map<std::string, RawSlot, std::less<>> raw_;
    mutable std::map<std::string, Value, std::less<>> typed_;
};

using TorrentPtr = std::shared_ptr<Torrent const>;
using TorrentList = std::vector<TorrentPtr>;

} // namespace tr::model
