#pragma once

#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/info_hash.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/sha1_hash.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tr::utils {

constexpr int kSha1Bytes = static_cast<int>(libtorrent::sha1_hash::size());

inline int hex_digit_value(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

inline std::optional<libtorrent::sha1_hash> sha1_from_hex(std::string_view value) {
  if (value.size() != static_cast<std::size_t>(kSha1Bytes * 2)) {
    return std::nullopt;
  }
  libtorrent::sha1_hash result;
  for (int i = 0; i < kSha1Bytes; ++i) {
    int high = hex_digit_value(value[2 * i]);
    int low = hex_digit_value(value[2 * i + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    result[i] = static_cast<std::uint8_t>((high << 4) | low);
  }
  return result;
}

// "magnet:?xt=urn:btih:<hash>" for a 40 character hex info hash.
inline std::optional<std::string> magnet_from_info_hash(std::string_view hex) {
  auto hash = sha1_from_hex(hex);
  if (!hash) {
    return std::nullopt;
  }
  libtorrent::add_torrent_params params;
  params.info_hashes = libtorrent::info_hash_t(*hash);
  return libtorrent::make_magnet_uri(params);
}

} // namespace tr::utils
