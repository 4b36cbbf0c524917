#include "evogate/proc.h"
#include "evogate/seccomp.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace evogate {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    auto flush = [&]() {
        if (!cur.empty()) {
            out.push_back(cur);
            cur.clear();
        }
    };

    for (size_t i = 0; i < cmd.size(); i++) {
        char c = cmd[i];
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            if (c == '\'') { st = SQ; continue; }
            if (c == '"') { st = DQ; esc = false; continue; }
            cur.push_back(c);
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else {
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

static void set_rlimit(int resource, rlim_t v) {
    struct rlimit rl;
    rl.rlim_cur = v;
    rl.rlim_max = v;
    (void)setrlimit(resource, &rl);
}

static void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Child side between fork and exec. Never returns.
[[noreturn]] static void exec_child(char* const* cargv,
                                    char* const* cenv,
                                    const std::string& cwd,
                                    const ProcLimits& lim,
                                    int in_fd, int out_fd, int err_fd) {
    (void)dup2(in_fd, STDIN_FILENO);
    (void)dup2(out_fd, STDOUT_FILENO);
    (void)dup2(err_fd, STDERR_FILENO);

    // isolate process group so timeout can kill the whole subtree
    (void)setpgid(0, 0);
    (void)umask(077);

    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    for (int fd = 3; fd < maxfd; fd++) {
        (void)close(fd);
    }

    if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
        const char msg[] = "sandbox: chdir failed\n";
        (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
        _exit(126);
    }

#ifdef __linux__
    if (lim.no_new_privs) {
        (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
    }
    (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

    if (lim.rlimit_cpu_sec > 0) set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec);
    if (lim.rlimit_as_mb > 0) set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL);
    if (lim.rlimit_fsize_bytes >= 0) set_rlimit(RLIMIT_FSIZE, (rlim_t)lim.rlimit_fsize_bytes);
    if (lim.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile);
#ifdef RLIMIT_NPROC
    if (lim.rlimit_nproc > 0) set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc);
#endif

    if (!lim.clear_env) {
        unsetenv("LD_PRELOAD");
        unsetenv("LD_LIBRARY_PATH");
    }

    // seccomp must come after no_new_privs and is the last step before exec
    if (lim.enable_seccomp) {
        std::string err = install_seccomp_filter(lim.seccomp_allow_network);
        if (!err.empty()) {
            err = "sandbox: " + err + "\n";
            (void)!write(STDERR_FILENO, err.data(), err.size());
            _exit(126);
        }
    }

    if (lim.clear_env) {
        execvpe(cargv[0], cargv, cenv);
    } else {
        execvp(cargv[0], cargv);
    }
    _exit(127);
}

namespace {

struct Capture {
    std::string* text;
    bool* truncated;
    size_t cap;

    void append(const char* buf, ssize_t n) {
        size_t can = cap > text->size() ? cap - text->size() : 0;
        size_t take = (size_t)n;
        if (take > can) {
            take = can;
            *truncated = true;
        }
        text->append(buf, buf + take);
    }
};

// Reads what is available; returns false at EOF or error.
bool drain_fd(int fd, Capture* cap) {
    char buf[4096];
    for (;;) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            cap->append(buf, n);
            continue;
        }
        if (n == -1 && errno == EINTR) continue;
        if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        return false;
    }
}

} // namespace

bool proc_run_capture_sandboxed(const std::vector<std::string>& argv,
                                const std::string& cwd,
                                const std::string& stdin_data,
                                const ProcLimits& lim,
                                ProcResult* res,
                                const CancelFlags& cancel) {
    if (!res) return false;
    *res = ProcResult{};

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    int in_pipe[2];
    int out_pipe[2];
    int err_pipe[2];
    if (pipe2(in_pipe, O_CLOEXEC) != 0) {
        res->error = std::string("pipe(in) failed: ") + std::strerror(errno);
        return false;
    }
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        close(in_pipe[0]); close(in_pipe[1]);
        res->error = std::string("pipe(out) failed: ") + std::strerror(errno);
        return false;
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        close(in_pipe[0]); close(in_pipe[1]);
        close(out_pipe[0]); close(out_pipe[1]);
        res->error = std::string("pipe(err) failed: ") + std::strerror(errno);
        return false;
    }

    // built before fork: the child only execs
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);
    std::vector<char*> cenv;
    cenv.reserve(lim.env.size() + 1);
    for (const auto& e : lim.env) cenv.push_back(const_cast<char*>(e.c_str()));
    cenv.push_back(nullptr);

    const auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) close(fd);
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }
    if (pid == 0) {
        close(in_pipe[1]);
        close(out_pipe[0]);
        close(err_pipe[0]);
        exec_child(cargv.data(), cenv.data(), cwd, lim, in_pipe[0], out_pipe[1], err_pipe[1]);
    }

    // parent
    (void)setpgid(pid, pid);
    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);

    int in_fd = in_pipe[1];
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    set_nonblock(out_fd);
    set_nonblock(err_fd);
    if (stdin_data.empty()) {
        close(in_fd);
        in_fd = -1;
    } else {
        set_nonblock(in_fd);
    }
    size_t write_off = 0;

    Capture out_cap{&res->stdout_text, &res->stdout_truncated, lim.output_max_bytes};
    Capture err_cap{&res->stderr_text, &res->stderr_truncated, lim.output_max_bytes};

    bool child_exited = false;
    int status = 0;
    struct rusage ru;
    std::memset(&ru, 0, sizeof(ru));

    auto kill_group = [&]() {
        (void)kill(-pid, SIGKILL);
        (void)kill(pid, SIGKILL);
        (void)wait4(pid, &status, 0, &ru);
        child_exited = true;
    };

    // Broken stdin pipe must not kill the runner.
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, []() { (void)signal(SIGPIPE, SIG_IGN); });

    while (true) {
        const int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (std::any_of(cancel.begin(), cancel.end(),
                        [](const std::atomic<bool>* f) { return f && f->load(); })) {
            res->cancelled = true;
            kill_group();
            break;
        }
        if (lim.timeout_ms > 0 && elapsed_ms >= lim.timeout_ms) {
            res->timed_out = true;
            kill_group();
            break;
        }

        struct pollfd fds[3];
        nfds_t nfds = 0;
        int in_idx = -1;
        int out_idx = -1;
        int err_idx = -1;
        if (in_fd >= 0) { in_idx = (int)nfds; fds[nfds].fd = in_fd; fds[nfds].events = POLLOUT; fds[nfds].revents = 0; nfds++; }
        if (out_fd >= 0) { out_idx = (int)nfds; fds[nfds].fd = out_fd; fds[nfds].events = POLLIN; fds[nfds].revents = 0; nfds++; }
        if (err_fd >= 0) { err_idx = (int)nfds; fds[nfds].fd = err_fd; fds[nfds].events = POLLIN; fds[nfds].revents = 0; nfds++; }

        int slice = 20;
        if (lim.timeout_ms > 0) slice = std::max(1, std::min(slice, lim.timeout_ms - elapsed_ms));
        int pr = nfds > 0 ? poll(fds, nfds, slice) : poll(nullptr, 0, slice);
        if (pr < 0 && errno == EINTR) continue;

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off < stdin_data.size()) {
                ssize_t n = write(in_fd, stdin_data.data() + write_off, stdin_data.size() - write_off);
                if (n > 0) { write_off += (size_t)n; continue; }
                if (n == -1 && errno == EINTR) continue;
                if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                write_off = stdin_data.size();  // child closed stdin
                break;
            }
            if (write_off >= stdin_data.size()) {
                close(in_fd);
                in_fd = -1;
            }
        }
        if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLERR | POLLHUP))) {
            if (!drain_fd(out_fd, &out_cap)) { close(out_fd); out_fd = -1; }
        }
        if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLERR | POLLHUP))) {
            if (!drain_fd(err_fd, &err_cap)) { close(err_fd); err_fd = -1; }
        }

        pid_t w = wait4(pid, &status, WNOHANG, &ru);
        if (w == pid) {
            child_exited = true;
            break;
        }
    }

    if (in_fd >= 0) close(in_fd);
    if (out_fd >= 0) { (void)drain_fd(out_fd, &out_cap); close(out_fd); }
    if (err_fd >= 0) { (void)drain_fd(err_fd, &err_cap); close(err_fd); }

    res->wall_ms = (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    res->cpu_ms = (int64_t)ru.ru_utime.tv_sec * 1000 + ru.ru_utime.tv_usec / 1000
                + (int64_t)ru.ru_stime.tv_sec * 1000 + ru.ru_stime.tv_usec / 1000;
    res->peak_rss_kb = (int64_t)ru.ru_maxrss;

    if (!child_exited) {
        res->exit_code = 128;
        res->error = "child did not exit";
        return true;
    }
    if (WIFEXITED(status)) {
        res->exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res->term_signal = WTERMSIG(status);
        res->exit_code = 128 + res->term_signal;
    } else {
        res->exit_code = 128;
    }
    return true;
}

} // namespace evogate
