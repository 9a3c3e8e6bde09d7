/*
 * Launcher entry point - upd-launcher
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <upd-launcher/exec/config.hpp>
#include <upd-launcher/exec/invoker.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace updlauncher {

// Resolve then invoke. Every failure ends up here as "Error: <message>" on
// err and exit code 1. With a replacing invoker this does not return on success.
int run_launcher(const LauncherConfig& cfg, const std::vector<std::string>& args,
                 Invoker& invoker, std::ostream& err);

} // namespace updlauncher
