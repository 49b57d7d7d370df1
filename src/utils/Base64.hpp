#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace tr::utils
{

// RFC 4648 base64 with padding, as torrent-add expects for "metainfo".
inline std::string encode_base64(std::span<std::uint8_t const> data)
{
    constexpr std::string_view kDigits =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);
    for (std::size_t i = 0; i < data.size(); i += 3)
    {
        auto const left = data.size() - i;
        std::uint32_t group = std::uint32_t{data[i]} << 16;
        if (left > 1)
        {
            group |= std::uint32_t{data[i + 1]} << 8;
        }
        if (left > 2)
        {
            group |= data[i + 2];
        }
        out += kDigits[(group >> 18) & 0x3F];
        out += kDigits[(group >> 12) & 0x3F];
        out += left > 1 ? kDigits[(group >> 6) & 0x3F] : '=';
        out += left > 2 ? kDigits[group & 0x3F] : '=';
    }
    return out;
}

inline std::string encode_base64(std::string_view text)
{
    return encode_base64(std::span<std::uint8_t const>(
        reinterpret_cast<std::uint8_t const *>(text.data()), text.size()));
}

} // namespace tr::utils
