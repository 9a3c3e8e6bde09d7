/*
 * Launcher configuration implementation - upd-launcher
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <upd-launcher/exec/config.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <system_error>
#include <vector>
#if defined(_WIN32)
#include <windows.h>
#elif defined(__APPLE__)
#include <mach-o/dyld.h>
#endif

namespace fs = std::filesystem;

namespace updlauncher {

static std::string getenv_or(const char* k, const std::string& def = "") {
    const char* v = std::getenv(k);
    return v ? std::string(v) : def;
}

static std::optional<fs::path> platform_executable_path() {
#if defined(_WIN32)
    std::vector<wchar_t> buf(MAX_PATH);
    while (true) {
        DWORD n = GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
        if (n == 0) return std::nullopt;
        if (n < buf.size()) return fs::path(std::wstring(buf.data(), n));
        buf.resize(buf.size() * 2);
    }
#elif defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::vector<char> buf(size + 1, '\0');
    if (_NSGetExecutablePath(buf.data(), &size) != 0) return std::nullopt;
    return fs::path(buf.data());
#elif defined(__linux__)
    std::error_code ec;
    fs::path p = fs::read_symlink("/proc/self/exe", ec);
    if (ec) return std::nullopt;
    return p;
#else
    return std::nullopt;
#endif
}

std::optional<fs::path> executable_from_argv0(const std::string& argv0) {
    if (argv0.empty()) return std::nullopt;
    std::error_code ec;
    fs::path given(argv0);
    if (given.has_parent_path()) {
        if (fs::is_regular_file(given, ec)) return given;
        return std::nullopt;
    }
    // A bare name means the caller's shell found us on PATH.
#ifdef _WIN32
    const char sep = ';';
#else
    const char sep = ':';
#endif
    std::istringstream dirs(getenv_or("PATH"));
    std::string dir;
    while (std::getline(dirs, dir, sep)) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / given;
        if (fs::is_regular_file(candidate, ec)) return candidate;
    }
    return std::nullopt;
}

std::optional<fs::path> current_executable_path(const std::string& argv0) {
    std::optional<fs::path> exe = platform_executable_path();
    if (!exe) exe = executable_from_argv0(argv0);
    if (!exe) return std::nullopt;
    std::error_code ec;
    fs::path abs = fs::absolute(*exe, ec);
    if (ec) return std::nullopt;
    fs::path canonical = fs::weakly_canonical(abs, ec);
    if (ec) return std::nullopt;
    return canonical;
}

fs::path project_root_from(const fs::path& exe, int levels) {
    fs::path p = exe;
    for (int i = 0; i < levels; ++i) p = p.parent_path();
    return p;
}

bool parse_bool(const std::string& v) {
    std::string s = v;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s == "1" || s == "true" || s == "on";
}

ConfigResult load_config(const std::string& argv0) {
    LauncherConfig cfg;
    cfg.debug = parse_bool(getenv_or("UPD_LAUNCHER_DEBUG"));
    auto exe = current_executable_path(argv0);
    if (!exe) {
        return LaunchError{LaunchErrorKind::Unexpected,
                           "Could not determine the launcher location (argv[0]='" + argv0 + "')"};
    }
    cfg.project_root = project_root_from(*exe, cfg.root_levels);
    return cfg;
}

} // namespace updlauncher
