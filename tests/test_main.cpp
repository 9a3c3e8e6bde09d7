#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

// Lays out <root>/python/upd_cli/upd (the built launcher) and, optionally,
// <root>/target/release/upd (a shell script standing in for the native binary).
class LauncherExecutable : public ::testing::Test {
protected:
    void SetUp() override {
        m_root = fs::temp_directory_path() / ("upd_launcher_main_" + std::to_string(getpid()));
        fs::remove_all(m_root);
        fs::create_directories(m_root / "python" / "upd_cli");
        fs::create_directories(m_root / "target" / "release");
        m_launcher = m_root / "python" / "upd_cli" / "upd";
        fs::copy_file(UPD_LAUNCHER_EXE, m_launcher);
        fs::permissions(m_launcher, fs::perms::owner_all);
    }
    void TearDown() override { fs::remove_all(m_root); }

    void install_native(const std::string& body) {
        fs::path bin = m_root / "target" / "release" / "upd";
        std::ofstream(bin) << "#!/bin/sh\n" << body << "\n";
        fs::permissions(bin, fs::perms::owner_all);
    }

    // Runs the launcher with args (already shell-quoted); stderr goes to err.txt.
    int run(const std::string& args) {
        std::string cmd = "'" + m_launcher.string() + "' " + args + " 2>'" + (m_root / "err.txt").string() + "'";
        int st = std::system(cmd.c_str());
        return WIFEXITED(st) ? WEXITSTATUS(st) : -1;
    }

    std::string slurp(const fs::path& p) {
        std::ifstream in(p);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    fs::path m_root;
    fs::path m_launcher;
};

TEST_F(LauncherExecutable, ForwardsArgumentsAndExitCode) {
    fs::path out = m_root / "args.txt";
    install_native("printf '%s\\n' \"$@\" > '" + out.string() + "'; exit 7");
    EXPECT_EQ(run("status --verbose 'two words' ''"), 7);
    EXPECT_EQ(slurp(out), "status\n--verbose\ntwo words\n\n");
    EXPECT_EQ(slurp(m_root / "err.txt"), "");
}

TEST_F(LauncherExecutable, ExitCodesPassThrough) {
    for (int code : {0, 1, 127}) {
        install_native("exit " + std::to_string(code));
        EXPECT_EQ(run(""), code) << "code " << code;
    }
}

TEST_F(LauncherExecutable, MissingNativeBinary) {
    EXPECT_EQ(run("status"), 1);
    std::string err = slurp(m_root / "err.txt");
    EXPECT_EQ(err.rfind("Error: Could not find the native upd binary", 0), 0u);
    EXPECT_NE(err.find("cargo build --release"), std::string::npos);
}

TEST_F(LauncherExecutable, DebugTraceReportsLayoutRoot) {
    install_native("exit 0");
    setenv("UPD_LAUNCHER_DEBUG", "1", 1);
    int rc = run("x");
    unsetenv("UPD_LAUNCHER_DEBUG");
    EXPECT_EQ(rc, 0);
    std::string err = slurp(m_root / "err.txt");
    EXPECT_NE(err.find("[upd-launcher] project root: " + fs::weakly_canonical(m_root).string()), std::string::npos);
    EXPECT_NE(err.find("[upd-launcher] replace: "), std::string::npos);
}
