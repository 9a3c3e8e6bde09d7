/*
 * Native binary resolution implementation - upd-launcher
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <upd-launcher/exec/path.hpp>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace updlauncher {

std::vector<fs::path> search_path(const LauncherConfig& cfg) {
    fs::path release = cfg.project_root / "target" / "release";
    std::vector<fs::path> candidates;
    candidates.push_back(release / cfg.binary_name);
#ifdef _WIN32
    candidates.push_back(release / (cfg.binary_name + ".exe"));
#endif
    return candidates;
}

// Errors that mean "nothing usable here" rather than a broken filesystem:
// ENOTDIR when a parent is a plain file, ELOOP for a symlink cycle.
static bool is_absent(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory
        || ec == std::errc::not_a_directory
        || ec == std::errc::too_many_symbolic_link_levels
        || ec == std::errc::bad_file_descriptor;
}

LocateResult locate_native_binary(const LauncherConfig& cfg) {
    for (auto &candidate : search_path(cfg)) {
        std::error_code ec;
        fs::file_status st = fs::status(candidate, ec);
        if (ec) {
            if (is_absent(ec)) continue;
            return LaunchError{LaunchErrorKind::Unexpected, candidate.string() + ": " + ec.message()};
        }
        if (!fs::exists(st) || fs::is_directory(st)) continue;
        return BinaryLocation{candidate.string()};
    }
    return LaunchError{LaunchErrorKind::BinaryNotFound,
                       "Could not find the native " + cfg.binary_name + " binary. "
                       "Please ensure it was built with '" + cfg.build_hint + "'."};
}

} // namespace updlauncher
