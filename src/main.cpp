// upd launcher: finds target/release/upd under the project root and hands over to it.
#include <upd-launcher/exec/config.hpp>
#include <upd-launcher/exec/invoker.hpp>
#include <upd-launcher/exec/launcher.hpp>

#include <exception>
#include <iostream>
#include <string>
#include <vector>
#ifdef _WIN32
#include <windows.h>
#include <shellapi.h>
#endif

using namespace updlauncher;

#ifdef _WIN32
static std::string narrow(const wchar_t* w) {
    int n = WideCharToMultiByte(CP_UTF8, 0, w, -1, nullptr, 0, nullptr, nullptr);
    if (n <= 1) return std::string();
    std::string out(n - 1, '\0');
    WideCharToMultiByte(CP_UTF8, 0, w, -1, out.data(), n, nullptr, nullptr);
    return out;
}
#endif

// argv[1:], untouched. On Windows the narrow argv is lossy, so re-read the wide one.
static std::vector<std::string> forwarded_args(int argc, char* argv[]) {
#ifdef _WIN32
    (void)argc; (void)argv;
    std::vector<std::string> out;
    int wargc = 0;
    LPWSTR* wargv = CommandLineToArgvW(GetCommandLineW(), &wargc);
    if (!wargv) return out;
    for (int i = 1; i < wargc; ++i) out.push_back(narrow(wargv[i]));
    LocalFree(wargv);
    return out;
#else
    return std::vector<std::string>(argv + (argc > 0 ? 1 : 0), argv + argc);
#endif
}

int main(int argc, char* argv[]) {
    try {
        ConfigResult loaded = load_config(argc > 0 ? argv[0] : "");
        if (auto e = std::get_if<LaunchError>(&loaded)) {
            std::cerr << "Error: " << e->message << std::endl;
            return 1;
        }
        auto invoker = make_invoker();
        return run_launcher(std::get<LauncherConfig>(loaded), forwarded_args(argc, argv), *invoker, std::cerr);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
