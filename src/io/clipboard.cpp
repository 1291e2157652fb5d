/*
 * TPipe Clipboard Access Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <tpipe/io/clipboard.hpp>
#include <tpipe/error.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

namespace tpipe {

static std::vector<std::string> helper_command(bool write) {
    const char* over = std::getenv(write ? "TPIPE_CLIP_WRITE" : "TPIPE_CLIP_READ");
    if (over && *over) return {"/bin/sh", "-c", over};
    const char* wl = std::getenv("WAYLAND_DISPLAY");
    if (wl && *wl) return write ? std::vector<std::string>{"wl-copy"} : std::vector<std::string>{"wl-paste", "--no-newline"};
    if (write) return {"xclip", "-selection", "clipboard", "-i"};
    return {"xclip", "-selection", "clipboard", "-o"};
}

static std::string join_cmd(const std::vector<std::string>& cmd) {
    std::string s; for (auto& a : cmd) s += (s.empty() ? "" : " ") + a;
    return s;
}

[[noreturn]] static void exec_helper(const std::vector<std::string>& cmd) {
    std::vector<char*> argv;
    for (auto& a : cmd) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    execvp(argv[0], argv.data());
    _exit(127);
}

static int wait_child(pid_t pid) {
    int st = 0; while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
    return WIFEXITED(st) ? WEXITSTATUS(st) : 128 + (WIFSIGNALED(st) ? WTERMSIG(st) : 0);
}

std::string read_clipboard() {
    auto cmd = helper_command(false);
    int pipefd[2];
    if (pipe(pipefd) != 0) throw Error(ErrorCode::ReadClipboard, std::string("pipe: ") + std::strerror(errno));
    pid_t pid = fork();
    if (pid < 0) { close(pipefd[0]); close(pipefd[1]); throw Error(ErrorCode::ReadClipboard, std::string("fork: ") + std::strerror(errno)); }
    if (pid == 0) {
        // child
        close(pipefd[0]);
        dup2(pipefd[1], STDOUT_FILENO);
        close(pipefd[1]);
        exec_helper(cmd);
    }
    close(pipefd[1]);
    std::string output; char buf[4096]; ssize_t n; int read_errno = 0;
    while ((n = read(pipefd[0], buf, sizeof(buf))) != 0) {
        if (n < 0) { if (errno == EINTR) continue; read_errno = errno; break; }
        output.append(buf, buf + n);
    }
    close(pipefd[0]);
    int status = wait_child(pid);
    if (read_errno) throw Error(ErrorCode::ReadClipboard, std::string("read: ") + std::strerror(read_errno));
    if (status != 0) throw Error(ErrorCode::ReadClipboard, "Clipboard helper `" + join_cmd(cmd) + "` exited with status " + std::to_string(status));
    return output;
}

void write_clipboard(const std::string& text) {
    auto cmd = helper_command(true);
    int pipefd[2];
    if (pipe(pipefd) != 0) throw Error(ErrorCode::WriteToClipboard, std::string("pipe: ") + std::strerror(errno));
    pid_t pid = fork();
    if (pid < 0) { close(pipefd[0]); close(pipefd[1]); throw Error(ErrorCode::WriteToClipboard, std::string("fork: ") + std::strerror(errno)); }
    if (pid == 0) {
        close(pipefd[1]);
        dup2(pipefd[0], STDIN_FILENO);
        close(pipefd[0]);
        exec_helper(cmd);
    }
    close(pipefd[0]);
    std::size_t off = 0; bool broken = false;
    while (off < text.size()) {
        ssize_t n = write(pipefd[1], text.data() + off, text.size() - off);
        if (n < 0) { if (errno == EINTR) continue; broken = true; break; }
        off += static_cast<std::size_t>(n);
    }
    close(pipefd[1]);
    int status = wait_child(pid);
    if (broken || status != 0)
        throw Error(ErrorCode::WriteToClipboard, "Clipboard helper `" + join_cmd(cmd) + "` failed (status " + std::to_string(status) + ")");
}

} // namespace tpipe
