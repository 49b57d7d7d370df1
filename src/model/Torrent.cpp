#include "model/Torrent.hpp"

#include "model/FieldRegistry.hpp"

#include <format>
#include <stdexcept>
#include <string>

namespace tr::model
{

namespace
{

FieldSpec const &require_field(std::string_view key)
{
    auto const *spec = find_field(key);
    if (spec == nullptr)
    {
        throw std::invalid_argument(std::format("unknown torrent key: {}", key));
    }
    return *spec;
}

} // namespace

Torrent::Torrent(int id) : id_(id) {}

void Torrent::update(json::SharedDocument const &document, yyjson_val *record)
{
    if (record == nullptr || !yyjson_is_obj(record))
    {
        return;
    }
    yyjson_obj_iter iter;
    yyjson_obj_iter_init(record, &iter);
    yyjson_val *key = nullptr;
    while ((key = yyjson_obj_iter_next(&iter)) != nullptr)
    {
        std::string field(yyjson_get_str(key), yyjson_get_len(key));
        for (auto dependent : keys_depending_on(field))
        {
            if (auto it = typed_.find(dependent); it != typed_.end())
            {
                typed_.erase(it);
            }
        }
        raw_[std::move(field)] =
            RawSlot{document, yyjson_obj_iter_get_val(key)};
    }
}

bool Torrent::has_raw(std::string_view field) const
{
    return raw_.find(field) != raw_.end();
}

yyjson_val *Torrent::raw(std::string_view field) const
{
    auto it = raw_.find(field);
    return it == raw_.end() ? nullptr : it->second.value;
}

std::vector<std::string> Torrent::raw_fields() const
{
    std::vector<std::string> fields;
    fields.reserve(raw_.size());
    for (auto const &[field, slot] : raw_)
    {
        fields.push_back(field);
    }
    return fields;
}

bool Torrent::has(std::string_view key) const
{
    auto const &spec = require_field(key);
    for (auto field : spec.rpc_fields)
    {
        if (!has_raw(field))
        {
            return false;
        }
    }
    for (auto field : spec.static_fields)
    {
        if (!has_raw(field))
        {
            return false;
        }
    }
    return true;
}

Value Torrent::get(std::string_view key) const
{
    if (auto it = typed_.find(key); it != typed_.end())
    {
        return it->second;
    }
    auto const &spec = require_field(key);
    if (!has(key))
    {
        throw std::out_of_range(
            std::format("torrent {} has no value for '{}'", id_, key));
    }
    auto [it, inserted] = typed_.emplace(std::string(key), spec.convert(*this));
    return it->second;
}

std::string Torrent::format(std::string_view key, UnitOptions const &units) const
{
    auto const &spec = require_field(key);
    auto const value = get(key);
    if (auto const *quantity = std::get_if<Quantity>(&value))
    {
        switch (spec.rendering)
        {
        case Rendering::Size:
            return size_for_display(*quantity, units).with_unit();
        case Rendering::Bandwidth:
            return bandwidth_for_display(*quantity, units).with_unit();
        case Rendering::Plain:
            break;
        }
    }
    return to_string(value);
}

std::string Torrent::name() const
{
    if (!has_raw("name"))
    {
        return {};
    }
    return get_as<SmartString>("name").str();
}

} // namespace tr::model
