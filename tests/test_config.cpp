#include <gtest/gtest.h>
#include <upd-launcher/exec/config.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace updlauncher;
namespace fs = std::filesystem;

TEST(ProjectRoot, ThreeLevelsUp) {
    fs::path exe = "/srv/proj/python/upd_cli/upd";
    EXPECT_EQ(project_root_from(exe, kDefaultRootLevels), fs::path("/srv/proj"));
    EXPECT_EQ(project_root_from(exe, 0), exe);
    EXPECT_EQ(project_root_from(exe, 1), fs::path("/srv/proj/python/upd_cli"));
}

TEST(ParseBool, AcceptedSpellings) {
    EXPECT_TRUE(parse_bool("1"));
    EXPECT_TRUE(parse_bool("true"));
    EXPECT_TRUE(parse_bool("ON"));
    EXPECT_FALSE(parse_bool(""));
    EXPECT_FALSE(parse_bool("0"));
    EXPECT_FALSE(parse_bool("yes please"));
}

TEST(ExecutablePath, PointsAtRunningBinary) {
    auto exe = current_executable_path("");
    ASSERT_TRUE(exe.has_value());
    EXPECT_TRUE(exe->is_absolute());
    EXPECT_TRUE(fs::is_regular_file(*exe));
}

TEST(LoadConfig, RootAndDebugFlag) {
    setenv("UPD_LAUNCHER_DEBUG", "true", 1);
    auto loaded = load_config("");
    ASSERT_TRUE(std::holds_alternative<LauncherConfig>(loaded));
    auto &cfg = std::get<LauncherConfig>(loaded);
    EXPECT_TRUE(cfg.debug);
    EXPECT_EQ(cfg.binary_name, "upd");
    EXPECT_EQ(cfg.project_root, project_root_from(*current_executable_path(""), kDefaultRootLevels));

    unsetenv("UPD_LAUNCHER_DEBUG");
    auto quiet = load_config("");
    ASSERT_TRUE(std::holds_alternative<LauncherConfig>(quiet));
    EXPECT_FALSE(std::get<LauncherConfig>(quiet).debug);
}

TEST(ExecutableFromArgv0, PathWithDirectory) {
    fs::path dir = fs::temp_directory_path() / ("upd_launcher_argv0_" + std::to_string(getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    fs::path exe = dir / "upd";
    std::ofstream(exe) << "x";
    auto found = executable_from_argv0(exe.string());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, exe);
    EXPECT_FALSE(executable_from_argv0((dir / "missing").string()).has_value());
    EXPECT_FALSE(executable_from_argv0(dir.string() + "/").has_value());
    fs::remove_all(dir);
}

TEST(ExecutableFromArgv0, BareNameSearchesPath) {
    fs::path dir = fs::temp_directory_path() / ("upd_launcher_argv0_path_" + std::to_string(getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir / "bin");
    std::ofstream(dir / "bin" / "upd-shim") << "x";
    std::string saved = std::getenv("PATH") ? std::getenv("PATH") : "";
    setenv("PATH", ("/nonexistent_xyz::" + (dir / "bin").string()).c_str(), 1);
    auto found = executable_from_argv0("upd-shim");
    auto missing = executable_from_argv0("no-such-shim");
    setenv("PATH", saved.c_str(), 1);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, dir / "bin" / "upd-shim");
    EXPECT_FALSE(missing.has_value());
    EXPECT_FALSE(executable_from_argv0("").has_value());
    fs::remove_all(dir);
}
