/*
 * Native binary invocation - upd-launcher
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <upd-launcher/exec/error.hpp>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace updlauncher {

struct ExitOutcome {
    int code = 0;
};

using InvokeResult = std::variant<ExitOutcome, LaunchError>;

// [path] ++ args, nothing added or dropped.
std::vector<std::string> build_argv(const std::string& path, const std::vector<std::string>& args);

class Invoker {
public:
    virtual ~Invoker() = default;
    virtual InvokeResult invoke(const std::string& path, const std::vector<std::string>& args) = 0;
    virtual const char* name() const = 0;
};

#ifndef _WIN32
// execv into the native binary. Returns only when the exec failed.
class ReplaceInvoker : public Invoker {
public:
    InvokeResult invoke(const std::string& path, const std::vector<std::string>& args) override;
    const char* name() const override { return "replace"; }
};
#endif

// Start a child with inherited stdio/environment and wait for it.
class SpawnInvoker : public Invoker {
public:
    InvokeResult invoke(const std::string& path, const std::vector<std::string>& args) override;
    const char* name() const override { return "spawn"; }
};

// The one place the strategy is tied to the platform.
#ifdef _WIN32
constexpr bool kSupportsProcessReplacement = false;
using PlatformInvoker = SpawnInvoker;
#else
constexpr bool kSupportsProcessReplacement = true;
using PlatformInvoker = ReplaceInvoker;
#endif

// Replacement where the platform has it, spawn-and-wait otherwise.
std::unique_ptr<Invoker> make_invoker();

#ifdef _WIN32
// Quote one argument for CreateProcess following the MSVC runtime parsing rules.
std::wstring quote_windows_arg(const std::wstring& arg);
#endif

} // namespace updlauncher
