/*
 * Windows invoker - upd-launcher
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#ifdef _WIN32
#include <upd-launcher/exec/invoker.hpp>
#include <windows.h>
#include <iostream>
#include <string>
#include <vector>

namespace updlauncher {

static std::wstring widen(const std::string& s) {
    if (s.empty()) return std::wstring();
    int n = MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), nullptr, 0);
    std::wstring out(n, L'\0');
    MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), out.data(), n);
    return out;
}

static std::string last_error_text(DWORD code) {
    char* buf = nullptr;
    DWORD len = FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                               nullptr, code, 0, reinterpret_cast<char*>(&buf), 0, nullptr);
    std::string msg = len ? std::string(buf, len) : "error " + std::to_string(code);
    if (buf) LocalFree(buf);
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r' || msg.back() == ' ')) msg.pop_back();
    return msg;
}

std::wstring quote_windows_arg(const std::wstring& arg) {
    if (!arg.empty() && arg.find_first_of(L" \t\n\v\"") == std::wstring::npos) return arg;
    std::wstring out = L"\"";
    for (auto it = arg.begin(); ; ++it) {
        size_t backslashes = 0;
        while (it != arg.end() && *it == L'\\') { ++it; ++backslashes; }
        if (it == arg.end()) {
            // Closing quote follows: every backslash must be doubled.
            out.append(backslashes * 2, L'\\');
            break;
        }
        if (*it == L'"') {
            out.append(backslashes * 2 + 1, L'\\');
            out.push_back(L'"');
        } else {
            out.append(backslashes, L'\\');
            out.push_back(*it);
        }
    }
    out.push_back(L'"');
    return out;
}

InvokeResult SpawnInvoker::invoke(const std::string& path, const std::vector<std::string>& args) {
    auto argv = build_argv(path, args);
    std::wstring cmdLine;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) cmdLine.push_back(L' ');
        cmdLine += quote_windows_arg(widen(argv[i]));
    }
    std::wstring app = widen(path);

    STARTUPINFOW si{}; si.cb = sizeof(si);
    PROCESS_INFORMATION pi{};
    std::cout.flush(); std::cerr.flush();
    BOOL ok = CreateProcessW(app.c_str(), cmdLine.data(), nullptr, nullptr, TRUE, 0, nullptr, nullptr, &si, &pi);
    if (!ok) {
        DWORD code = GetLastError();
        std::string msg = path + ": " + last_error_text(code);
        if (code == ERROR_ACCESS_DENIED) msg += " (the native binary is not executable)";
        return LaunchError{LaunchErrorKind::InvocationFailed, msg};
    }
    CloseHandle(pi.hThread);
    WaitForSingleObject(pi.hProcess, INFINITE);
    DWORD exitCode = 0;
    BOOL got = GetExitCodeProcess(pi.hProcess, &exitCode);
    DWORD err = GetLastError();
    CloseHandle(pi.hProcess);
    if (!got) return LaunchError{LaunchErrorKind::Unexpected, "GetExitCodeProcess: " + last_error_text(err)};
    return ExitOutcome{static_cast<int>(exitCode)};
}

} // namespace updlauncher
#endif // _WIN32
