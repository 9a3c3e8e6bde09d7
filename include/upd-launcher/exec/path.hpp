/*
 * Native binary resolution - upd-launcher
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <upd-launcher/exec/config.hpp>
#include <upd-launcher/exec/error.hpp>
#include <string>
#include <variant>
#include <vector>

namespace updlauncher {

struct BinaryLocation {
    std::string path;
};

using LocateResult = std::variant<BinaryLocation, LaunchError>;

// Candidates in probe order: root/target/release/<name>, then <name>.exe on Windows.
std::vector<std::filesystem::path> search_path(const LauncherConfig& cfg);

// First candidate that exists and is not a directory.
LocateResult locate_native_binary(const LauncherConfig& cfg);

} // namespace updlauncher
