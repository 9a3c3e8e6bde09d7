/*
 * Invoker selection - upd-launcher
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <upd-launcher/exec/invoker.hpp>

namespace updlauncher {

std::vector<std::string> build_argv(const std::string& path, const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(path);
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

std::unique_ptr<Invoker> make_invoker() {
    return std::make_unique<PlatformInvoker>();
}

} // namespace updlauncher
