/*
 * Launcher configuration - upd-launcher
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <upd-launcher/exec/error.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace updlauncher {

// Launcher lives at <root>/python/upd_cli/<exe>.
constexpr int kDefaultRootLevels = 3;

struct LauncherConfig {
    std::filesystem::path project_root;
    std::string binary_name = "upd";
    std::string build_hint = "cargo build --release";
    int root_levels = kDefaultRootLevels;
    // UPD_LAUNCHER_DEBUG: trace lines on stderr. Diagnostics only, never
    // consulted by the search path or the invoker.
    bool debug = false;
};

using ConfigResult = std::variant<LauncherConfig, LaunchError>;

// argv[0] as a path when it has a directory part, otherwise its first
// regular-file match on PATH. Fallback for platforms without a self-path API.
std::optional<std::filesystem::path> executable_from_argv0(const std::string& argv0);

// Absolute path of the running launcher. argv0 is only used when the
// platform offers no better source.
std::optional<std::filesystem::path> current_executable_path(const std::string& argv0);

// Walk `levels` parents up from the executable path.
std::filesystem::path project_root_from(const std::filesystem::path& exe, int levels);

// "1", "true", "on" (any case) are true.
bool parse_bool(const std::string& v);

// Builds the startup configuration: root from the executable location,
// debug flag from the environment.
ConfigResult load_config(const std::string& argv0);

} // namespace updlauncher
