/*
 * POSIX invokers - upd-launcher
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#ifndef _WIN32
#include <upd-launcher/exec/invoker.hpp>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace updlauncher {

static LaunchError exec_failure(const std::string& path, int err) {
    std::string msg = path + ": " + std::strerror(err);
    if (err == EACCES) msg += " (the native binary is not executable)";
    return LaunchError{LaunchErrorKind::InvocationFailed, msg};
}

static LaunchError sys_failure(const char* what, int err) {
    return LaunchError{LaunchErrorKind::InvocationFailed, std::string(what) + ": " + std::strerror(err)};
}

// Pointers into argv; argv must outlive the result.
static std::vector<char*> to_cargv(std::vector<std::string>& argv) {
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (auto &s : argv) cargv.push_back(s.data());
    cargv.push_back(nullptr);
    return cargv;
}

// Pending output would be lost with the old image.
static void flush_streams() {
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);
}

InvokeResult ReplaceInvoker::invoke(const std::string& path, const std::vector<std::string>& args) {
    auto argv = build_argv(path, args);
    auto cargv = to_cargv(argv);
    flush_streams();
    execv(path.c_str(), cargv.data());
    return exec_failure(path, errno);
}

InvokeResult SpawnInvoker::invoke(const std::string& path, const std::vector<std::string>& args) {
    auto argv = build_argv(path, args);
    auto cargv = to_cargv(argv);

    // The child reports a failed execv through this pipe; a successful exec closes it.
    int errpipe[2];
    if (pipe(errpipe) != 0) return sys_failure("pipe", errno);
    fcntl(errpipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(errpipe[1], F_SETFD, FD_CLOEXEC);

    // Terminal interrupts belong to the child while we wait.
    struct sigaction ign{}, old_int{}, old_quit{};
    ign.sa_handler = SIG_IGN;
    sigemptyset(&ign.sa_mask);
    sigaction(SIGINT, &ign, &old_int);
    sigaction(SIGQUIT, &ign, &old_quit);
    auto restore_signals = [&]{
        sigaction(SIGINT, &old_int, nullptr);
        sigaction(SIGQUIT, &old_quit, nullptr);
    };

    flush_streams();
    pid_t pid = fork();
    if (pid < 0) {
        int e = errno;
        restore_signals();
        close(errpipe[0]); close(errpipe[1]);
        return sys_failure("fork", e);
    }
    if (pid == 0) {
        restore_signals();
        close(errpipe[0]);
        execv(path.c_str(), cargv.data());
        int e = errno;
        ssize_t w = write(errpipe[1], &e, sizeof(e));
        (void)w;
        _exit(127);
    }
    close(errpipe[1]);

    int child_errno = 0;
    ssize_t n;
    while ((n = read(errpipe[0], &child_errno, sizeof(child_errno))) < 0 && errno == EINTR) {}
    close(errpipe[0]);

    int st = 0;
    pid_t w;
    while ((w = waitpid(pid, &st, 0)) < 0 && errno == EINTR) {}
    int wait_errno = errno;
    restore_signals();

    if (n == static_cast<ssize_t>(sizeof(child_errno))) return exec_failure(path, child_errno);
    if (w < 0) return sys_failure("waitpid", wait_errno);
    if (WIFEXITED(st)) return ExitOutcome{WEXITSTATUS(st)};
    if (WIFSIGNALED(st)) return ExitOutcome{128 + WTERMSIG(st)};
    return ExitOutcome{1};
}

} // namespace updlauncher
#endif // !_WIN32
