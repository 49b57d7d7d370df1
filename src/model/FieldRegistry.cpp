#include "model/FieldRegistry.hpp"

#include "model/Convert.hpp"
#include "model/Errors.hpp"
#include "model/Torrent.hpp"
#include "utils/Json.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <string>

namespace tr::model
{

namespace
{

[[noreturn]] void bad_field(Torrent const &torrent, std::string_view field,
                            char const *expected)
{
    throw ProtocolError(std::format("torrent {}: field '{}' is not {}",
                                    torrent.id(), field, expected));
}

std::int64_t int_field(Torrent const &torrent, std::string_view field)
{
    auto value = json::get_int(torrent.raw(field));
    if (!value)
    {
        bad_field(torrent, field, "a number");
    }
    return *value;
}

double real_field(Torrent const &torrent, std::string_view field)
{
    auto value = json::get_real(torrent.raw(field));
    if (!value)
    {
        bad_field(torrent, field, "a number");
    }
    return *value;
}

bool bool_field(Torrent const &torrent, std::string_view field)
{
    auto value = json::get_bool(torrent.raw(field));
    if (!value)
    {
        bad_field(torrent, field, "a boolean");
    }
    return *value;
}

std::string string_field(Torrent const &torrent, std::string_view field)
{
    auto value = json::get_string(torrent.raw(field));
    if (!value)
    {
        bad_field(torrent, field, "a string");
    }
    return std::string(*value);
}

yyjson_val *array_field(Torrent const &torrent, std::string_view field)
{
    auto *value = torrent.raw(field);
    if (value == nullptr || !yyjson_is_arr(value))
    {
        bad_field(torrent, field, "an array");
    }
    return value;
}

Value convert_status(Torrent const &torrent)
{
    auto *raw = torrent.raw("status");
    if (auto code = json::get_int(raw))
    {
        if (auto status = status_from_code(*code))
        {
            return *status;
        }
    }
    else if (auto token = json::get_string(raw))
    {
        if (auto status = status_from_token(*token))
        {
            return *status;
        }
    }
    throw ProtocolError(std::format("torrent {}: unknown status {}",
                                    torrent.id(), json::write(raw)));
}

// Zero means the event never happened.
Value timestamp_of(Torrent const &torrent, std::string_view field)
{
    auto seconds = real_field(torrent, field);
    if (seconds == 0)
    {
        return Timestamp(Timestamp::kNotApplicable);
    }
    return Timestamp(seconds);
}

Value rate_limit_of(Torrent const &torrent, std::string_view limited_field,
                    std::string_view limit_field)
{
    if (!bool_field(torrent, limited_field))
    {
        return bytes(Quantity::kInfinite);
    }
    return bytes(static_cast<double>(int_field(torrent, limit_field)) * 1000);
}

Value convert_trackers(Torrent const &torrent)
{
    TrackerList trackers;
    auto *array = array_field(torrent, "trackers");
    size_t index = 0;
    size_t count = 0;
    yyjson_val *item = nullptr;
    yyjson_arr_foreach(array, index, count, item)
    {
        Tracker tracker;
        tracker.id = static_cast<int>(
            json::get_int(json::member(item, "id")).value_or(0));
        tracker.tier = static_cast<int>(
            json::get_int(json::member(item, "tier")).value_or(0));
        auto announce = json::get_string(json::member(item, "announce"));
        if (!announce)
        {
            bad_field(torrent, "trackers", "a list of trackers with announce URLs");
        }
        tracker.announce = std::string(*announce);
        tracker.scrape = std::string(
            json::get_string(json::member(item, "scrape")).value_or(""));
        trackers.push_back(std::move(tracker));
    }
    return trackers;
}

// "files" carries name and length, "fileStats" the changing parts; both
// are ordered by file index.
Value convert_files(Torrent const &torrent)
{
    auto *files = array_field(torrent, "files");
    auto *stats = array_field(torrent, "fileStats");
    if (yyjson_arr_size(files) != yyjson_arr_size(stats))
    {
        bad_field(torrent, "fileStats", "as long as files");
    }
    FileList list;
    list.reserve(yyjson_arr_size(files));
    size_t index = 0;
    size_t count = 0;
    yyjson_val *item = nullptr;
    yyjson_arr_foreach(files, index, count, item)
    {
        auto *stat = yyjson_arr_get(stats, index);
        TorrentFile file;
        file.torrent_id = torrent.id();
        file.id = static_cast<int>(index);
        file.name = SmartString(std::string(
            json::get_string(json::member(item, "name")).value_or("")));
        file.size_total = bytes(static_cast<double>(
            json::get_int(json::member(item, "length")).value_or(0)));
        file.size_downloaded = bytes(static_cast<double>(
            json::get_int(json::member(stat, "bytesCompleted")).value_or(0)));
        file.wanted =
            json::get_bool(json::member(stat, "wanted")).value_or(true);
        file.priority =
            file_priority_from_code(
                json::get_int(json::member(stat, "priority")).value_or(0))
                .value_or(FilePriority::Normal);
        list.push_back(std::move(file));
    }
    return list;
}

FieldSpec size_field(std::string_view key, std::string_view field)
{
    return {key, {field}, {}, Rendering::Size,
            [field](Torrent const &t) -> Value
            { return bytes(real_field(t, field)); }};
}

FieldSpec timestamp_field(std::string_view key, std::string_view field)
{
    return {key, {field}, {}, Rendering::Plain,
            [field](Torrent const &t) -> Value { return timestamp_of(t, field); }};
}

// The daemon reports fractions in [0, 1].
FieldSpec percent_field(std::string_view key, std::string_view field)
{
    return {key, {field}, {}, Rendering::Plain,
            [field](Torrent const &t) -> Value
            { return Percent{real_field(t, field) * 100}; }};
}

FieldSpec count_field(std::string_view key, std::string_view field)
{
    return {key, {field}, {}, Rendering::Plain,
            [field](Torrent const &t) -> Value
            { return Quantity(static_cast<double>(int_field(t, field))); }};
}

std::vector<FieldSpec> build_registry()
{
    return {
        {"id", {"id"}, {}, Rendering::Plain,
         [](Torrent const &t) -> Value { return int_field(t, "id"); }},
        {"hash", {"hashString"}, {}, Rendering::Plain,
         [](Torrent const &t) -> Value { return string_field(t, "hashString"); }},
        {"name", {"name"}, {}, Rendering::Plain,
         [](Torrent const &t) -> Value
         { return SmartString(string_field(t, "name")); }},
        {"status", {"status"}, {}, Rendering::Plain, &convert_status},
        {"path", {"downloadDir"}, {}, Rendering::Plain,
         [](Torrent const &t) -> Value
         { return SmartString(string_field(t, "downloadDir")); }},
        {"error", {"errorString"}, {}, Rendering::Plain,
         [](Torrent const &t) -> Value { return string_field(t, "errorString"); }},
        {"ratio", {"uploadRatio"}, {}, Rendering::Plain,
         [](Torrent const &t) -> Value
         { return Quantity(real_field(t, "uploadRatio")); }},
        {"private", {"isPrivate"}, {}, Rendering::Plain,
         [](Torrent const &t) -> Value { return bool_field(t, "isPrivate"); }},
        {"stalled", {"isStalled"}, {}, Rendering::Plain,
         [](Torrent const &t) -> Value { return bool_field(t, "isStalled"); }},
        percent_field("%downloaded", "percentDone"),
        percent_field("%verified", "recheckProgress"),
        percent_field("%metadata", "metadataPercentComplete"),
        count_field("peers-connected", "peersConnected"),
        count_field("peers-uploading", "peersSendingToUs"),
        count_field("peers-downloading", "peersGettingFromUs"),
        timestamp_field("timestamp-created", "dateCreated"),
        timestamp_field("timestamp-added", "addedDate"),
        timestamp_field("timestamp-started", "startDate"),
        timestamp_field("timestamp-active", "activityDate"),
        timestamp_field("timestamp-done", "doneDate"),
        timestamp_field("time-manual-announce-allowed", "manualAnnounceTime"),
        {"timespan-eta", {"eta"}, {}, Rendering::Plain,
         [](Torrent const &t) -> Value { return Timedelta(int_field(t, "eta")); }},
        {"rate-down", {"rateDownload"}, {}, Rendering::Bandwidth,
         [](Torrent const &t) -> Value
         { return bytes(real_field(t, "rateDownload")); }},
        {"rate-up", {"rateUpload"}, {}, Rendering::Bandwidth,
         [](Torrent const &t) -> Value
         { return bytes(real_field(t, "rateUpload")); }},
        {"rate-limit-down", {"downloadLimited", "downloadLimit"}, {},
         Rendering::Bandwidth,
         [](Torrent const &t) -> Value
         { return rate_limit_of(t, "downloadLimited", "downloadLimit"); }},
        {"rate-limit-up", {"uploadLimited", "uploadLimit"}, {},
         Rendering::Bandwidth,
         [](Torrent const &t) -> Value
         { return rate_limit_of(t, "uploadLimited", "uploadLimit"); }},
        size_field("size-final", "sizeWhenDone"),
        size_field("size-total", "totalSize"),
        size_field("size-downloaded", "downloadedEver"),
        size_field("size-uploaded", "uploadedEver"),
        size_field("size-available", "desiredAvailable"),
        size_field("size-corrupt", "corruptEver"),
        {"trackers", {"trackers"}, {}, Rendering::Plain, &convert_trackers},
        {"files", {"fileStats"}, {"files"}, Rendering::Plain, &convert_files},
    };
}

void add_unique(std::vector<std::string> &fields, std::string_view field)
{
    if (std::find(fields.begin(), fields.end(), field) == fields.end())
    {
        fields.emplace_back(field);
    }
}

} // namespace

std::vector<FieldSpec> const &all_fields()
{
    static std::vector<FieldSpec> const registry = build_registry();
    return registry;
}

FieldSpec const *find_field(std::string_view key)
{
    auto const &registry = all_fields();
    auto it = std::find_if(registry.begin(), registry.end(),
                           [key](FieldSpec const &spec)
                           { return spec.key == key; });
    return it == registry.end() ? nullptr : &*it;
}

std::vector<std::string> expand_keys(std::vector<std::string> const &keys)
{
    std::vector<std::string> expanded;
    for (auto const &key : keys)
    {
        if (key == kAllKeys)
        {
            for (auto const &spec : all_fields())
            {
                add_unique(expanded, spec.key);
            }
            continue;
        }
        if (find_field(key) == nullptr)
        {
            throw std::invalid_argument(
                std::format("unknown torrent key: {}", key));
        }
        add_unique(expanded, key);
    }
    return expanded;
}

std::vector<std::string> rpc_fields_for(std::vector<std::string> const &keys)
{
    std::vector<std::string> fields{"id"};
    for (auto const &key : expand_keys(keys))
    {
        for (auto field : find_field(key)->rpc_fields)
        {
            add_unique(fields, field);
        }
    }
    return fields;
}

std::optional<std::string_view> static_companion(std::string_view rpc_field)
{
    for (auto const &spec : all_fields())
    {
        if (!spec.static_fields.empty() &&
            std::find(spec.rpc_fields.begin(), spec.rpc_fields.end(),
                      rpc_field) != spec.rpc_fields.end())
        {
            return spec.static_fields.front();
        }
    }
    return std::nullopt;
}

std::vector<std::string_view> keys_depending_on(std::string_view rpc_field)
{
    std::vector<std::string_view> keys;
    for (auto const &spec : all_fields())
    {
        auto const &rpc = spec.rpc_fields;
        auto const &companions = spec.static_fields;
        if (std::find(rpc.begin(), rpc.end(), rpc_field) != rpc.end() ||
            std::find(companions.begin(), companions.end(), rpc_field) !=
                companions.end())
        {
            keys.push_back(spec.key);
        }
    }
    return keys;
}

} // namespace tr::model
