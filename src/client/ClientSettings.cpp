#include "client/ClientSettings.hpp"

#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Text.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>
#include <utility>

namespace tr::client
{

namespace
{

std::optional<std::string> read_env(char const *key)
{
    auto value = std::getenv(key);
    if (value == nullptr)
    {
        return std::nullopt;
    }
    auto trimmed = tr::utils::trim(value);
    if (trimmed.empty())
    {
        return std::nullopt;
    }
    return std::string(trimmed);
}

std::optional<long long> parse_int_value(std::string_view value)
{
    long long parsed = 0;
    auto [ptr, ec] =
        std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size())
    {
        return std::nullopt;
    }
    return parsed;
}

void apply_prefix(char const *key, model::Prefix &target)
{
    if (auto env = read_env(key); env)
    {
        if (auto prefix = model::parse_prefix(*env))
        {
            target = *prefix;
        }
        else
        {
            TR_LOG_WARN("ignoring {}={}: expected metric or binary", key, *env);
        }
    }
}

} // namespace

ClientSettings settings_from_environment(ClientSettings base)
{
    auto settings = std::move(base);
    if (auto env = read_env("TR_RPC_URL"); env)
    {
        settings.rpc_url = *env;
    }
    if (auto env = read_env("TR_RPC_USER"); env)
    {
        settings.user = *env;
    }
    if (auto env = read_env("TR_RPC_PASSWORD"); env)
    {
        settings.password = *env;
    }
    if (auto env = read_env("TR_RPC_TIMEOUT_MS"); env)
    {
        auto timeout = parse_int_value(*env);
        if (timeout && *timeout > 0)
        {
            settings.timeout = std::chrono::milliseconds(*timeout);
        }
        else
        {
            TR_LOG_WARN("ignoring TR_RPC_TIMEOUT_MS={}: expected a positive "
                        "number of milliseconds",
                        *env);
        }
    }
    if (auto env = read_env("TR_LOG_FILE"); env)
    {
        settings.log_file = tr::utils::expand_user(*env);
    }
    if (auto env = read_env("TR_LOG_LEVEL"); env)
    {
        if (auto level = log::parse_level(*env))
        {
            settings.log_level = *level;
        }
        else
        {
            TR_LOG_WARN("ignoring TR_LOG_LEVEL={}: expected debug, info, warn "
                        "or error",
                        *env);
        }
    }
    if (auto env = read_env("TR_BANDWIDTH_UNIT"); env)
    {
        if (auto unit = model::parse_bandwidth_unit(*env))
        {
            settings.units.bandwidth_unit = *unit;
        }
        else
        {
            TR_LOG_WARN("ignoring TR_BANDWIDTH_UNIT={}: expected byte or bit",
                        *env);
        }
    }
    apply_prefix("TR_BANDWIDTH_PREFIX", settings.units.bandwidth_prefix);
    apply_prefix("TR_SIZE_PREFIX", settings.units.size_prefix);
    return settings;
}

void apply_logging(ClientSettings const &settings)
{
    tr::log::set_min_level(settings.log_level);
    tr::log::set_log_file(settings.log_file);
    if (!settings.log_file.empty())
    {
        TR_LOG_INFO("logging to {}", settings.log_file.string());
    }
}

} // namespace tr::client
