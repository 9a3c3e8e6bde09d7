/*
 * Launcher entry point implementation - upd-launcher
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <upd-launcher/exec/launcher.hpp>
#include <upd-launcher/exec/path.hpp>
#include <exception>

namespace updlauncher {

static void trace(const LauncherConfig& cfg, std::ostream& err, const std::string& msg) {
    if (cfg.debug) err << "[upd-launcher] " << msg << '\n';
}

static int report(std::ostream& err, const std::string& msg) {
    err << "Error: " << msg << std::endl;
    return 1;
}

int run_launcher(const LauncherConfig& cfg, const std::vector<std::string>& args,
                 Invoker& invoker, std::ostream& err) {
    try {
        trace(cfg, err, "project root: " + cfg.project_root.string());
        LocateResult located = locate_native_binary(cfg);
        if (auto e = std::get_if<LaunchError>(&located)) return report(err, e->message);
        const std::string& path = std::get<BinaryLocation>(located).path;

        if (cfg.debug) {
            std::string line;
            for (auto &a : build_argv(path, args)) { line += ' '; line += a; }
            trace(cfg, err, std::string(invoker.name()) + ":" + line);
            err.flush();
        }
        InvokeResult outcome = invoker.invoke(path, args);
        if (auto e = std::get_if<LaunchError>(&outcome)) return report(err, e->message);
        return std::get<ExitOutcome>(outcome).code;
    } catch (const std::exception& ex) {
        return report(err, ex.what());
    }
}

} // namespace updlauncher
