#include "utils/FS.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace tr::utils
{

namespace
{
std::optional<std::filesystem::path> home_directory()
{
#if defined(_WIN32)
    char const *home = std::getenv("USERPROFILE");
#else
    char const *home = std::getenv("HOME");
#endif
    if (home == nullptr || *home == '\0')
    {
        return std::nullopt;
    }
    return std::filesystem::path(home);
}
} // namespace

std::filesystem::path expand_user(std::string_view path)
{
    if (path.empty() || path.front() != '~')
    {
        return std::filesystem::path(path);
    }
    if (path.size() > 1 && path[1] != '/' && path[1] != '\\')
    {
        // ~user is left for the shell to interpret
        return std::filesystem::path(path);
    }
    auto home = home_directory();
    if (!home)
    {
        return std::filesystem::path(path);
    }
    auto remainder = path.substr(1);
    while (!remainder.empty() &&
           (remainder.front() == '/' || remainder.front() == '\\'))
    {
        remainder.remove_prefix(1);
    }
    return remainder.empty() ? *home : *home / std::filesystem::path(remainder);
}

std::optional<std::vector<std::uint8_t>>
read_file_bytes(std::filesystem::path const &path, std::error_code &ec)
{
    ec.clear();
    std::ifstream input(path, std::ios::binary);
    if (!input)
    {
        ec = std::error_code(errno != 0 ? errno : EIO, std::generic_category());
        return std::nullopt;
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(input)),
                                    std::istreambuf_iterator<char>());
    if (input.bad())
    {
        ec = std::make_error_code(std::errc::io_error);
        return std::nullopt;
    }
    return bytes;
}

bool is_absolute_remote_path(std::string_view path)
{
    return !path.empty() && path.front() == '/';
}

std::string normalize_remote_path(std::string_view path)
{
    if (path.empty())
    {
        return {};
    }
    auto normalized =
        std::filesystem::path(std::string(path)).lexically_normal().generic_string();
    while (normalized.size() > 1 && normalized.back() == '/')
    {
        normalized.pop_back();
    }
    return normalized;
}

std::string join_remote_path(std::string_view base, std::string_view relative)
{
    if (is_absolute_remote_path(relative) || base.empty())
    {
        return normalize_remote_path(relative);
    }
    std::string joined(base);
    if (joined.back() != '/')
    {
        joined.push_back('/');
    }
    joined.append(relative);
    return normalize_remote_path(joined);
}

} // namespace tr::utils
