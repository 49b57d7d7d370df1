#pragma once

#include "model/Convert.hpp"
#include "utils/Log.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace tr::client
{

struct ClientSettings
{
    std::string rpc_url = "http://localhost:9091/transmission/rpc";
    std::optional<std::string> user;
    std::optional<std::string> password;
    std::chrono::milliseconds timeout{10000};
    std::filesystem::path log_file;
    log::Level log_level = log::Level::Info;
    model::UnitOptions units;
};

// Overlays TR_RPC_URL, TR_RPC_USER, TR_RPC_PASSWORD, TR_RPC_TIMEOUT_MS,
// TR_LOG_FILE, TR_LOG_LEVEL, TR_BANDWIDTH_UNIT, TR_BANDWIDTH_PREFIX and TR_SIZE_PREFIX on
// `base`. Malformed values are logged and skipped.
ClientSettings settings_from_environment(ClientSettings base = {});

// Applies settings.log_level and points the log file at settings.log_file
// (no file when empty).
void apply_logging(ClientSettings const &settings);

} // namespace tr::client
