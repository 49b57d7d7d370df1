#pragma once

#include "model/Values.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tr::model
{

class Torrent;

enum class Rendering
{
    Plain,
    Size,
    Bandwidth,
};

struct FieldSpec
{
    std::string_view key;
    // Daemon fields requested whenever the key is.
    std::vector<std::string_view> rpc_fields;
    // Daemon fields that never change and are requested once per torrent.
    std::vector<std::string_view> static_fields;
    Rendering rendering = Rendering::Plain;
    std::function<Value(Torrent const &torrent)> convert;
};

inline constexpr std::string_view kAllKeys = "all";

std::vector<FieldSpec> const &all_fields();
FieldSpec const *find_field(std::string_view key);

// Throws std::invalid_argument for unknown keys; "all" expands to every key.
std::vector<std::string> expand_keys(std::vector<std::string> const &keys);

// Daemon fields for `keys` without static companions, "id" first, no
// duplicates.
std::vector<std::string> rpc_fields_for(std::vector<std::string> const &keys);

std::optional<std::string_view> static_companion(std::string_view rpc_field);

// Keys whose typed value is derived from `rpc_field`.
std::vector<std::string_view> keys_depending_on(std::string_view rpc_field);

} // namespace tr::model
