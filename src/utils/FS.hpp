#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tr::utils
{

// Local paths (files handed to torrent-add).
std::filesystem::path expand_user(std::string_view path);
std::optional<std::vector<std::uint8_t>>
read_file_bytes(std::filesystem::path const &path, std::error_code &ec);

// Daemon-side paths are POSIX paths regardless of the local platform.
bool is_absolute_remote_path(std::string_view path);
std::string normalize_remote_path(std::string_view path);
std::string join_remote_path(std::string_view base, std::string_view relative);

} // namespace tr::utils
