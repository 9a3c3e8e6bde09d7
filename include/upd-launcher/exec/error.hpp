/*
 * Launch errors - upd-launcher
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace updlauncher {

enum class LaunchErrorKind {
    BinaryNotFound,     // nothing usable at the conventional location
    InvocationFailed,   // exec / process creation failed
    Unexpected          // filesystem or environment trouble
};

struct LaunchError {
    LaunchErrorKind kind = LaunchErrorKind::Unexpected;
    std::string message;
};

} // namespace updlauncher
