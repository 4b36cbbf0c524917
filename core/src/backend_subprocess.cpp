#include "evogate/backends.h"

#include "evogate/seccomp.h"
#include "evogate/util.h"

#include <cmath>
#include <csignal>
#include <iostream>

namespace evogate {

namespace {

std::filesystem::path default_work_root(const BackendOptions& opts) {
    if (!opts.work_root.empty()) return opts.work_root;
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    return tmp / "evogate";
}

std::string first_line(const std::string& s) {
    size_t nl = s.find('\n');
    return nl == std::string::npos ? s : s.substr(0, nl);
}

} // namespace

int cpu_seconds_for(const ResourceLimits& lim) {
    double sec = std::ceil((double)lim.wall_clock_ms * lim.cpu_share / 1000.0);
    return sec < 1.0 ? 1 : (int)sec;
}

void classify_proc_result(const ProcResult& pr,
                          bool proc_started,
                          const std::string& nonce,
                          RawRunResult* out) {
    if (!out) return;
    *out = RawRunResult{};
    out->exit_code = pr.exit_code;
    out->term_signal = pr.term_signal;
    out->timed_out = pr.timed_out;
    out->cancelled = pr.cancelled;
    out->wall_ms = pr.wall_ms;
    out->cpu_ms = pr.cpu_ms;
    out->peak_rss_kb = pr.peak_rss_kb;
    out->stderr_text = pr.stderr_text;

    if (!proc_started) {
        out->stdout_text = pr.stdout_text;
        out->error = pr.error.empty() ? "interpreter spawn failed" : pr.error;
        return;
    }

    const bool have_marker = parse_harness_output(pr.stdout_text, nonce, &out->outcome);
    out->stdout_text = out->outcome.candidate_stdout;

    // 126: chdir or seccomp setup failed in the child, 127: exec failed.
    if (!have_marker && !pr.timed_out && !pr.cancelled && pr.term_signal == 0 &&
        (pr.exit_code == 126 || pr.exit_code == 127)) {
        out->error = "interpreter could not start (exit " + std::to_string(pr.exit_code) + ")";
        std::string why = first_line(pr.stderr_text);
        if (!why.empty()) out->error += ": " + why;
        return;
    }
    out->started = true;

    const bool runner_killed = pr.timed_out || pr.cancelled;
    if (pr.term_signal == SIGXCPU || pr.term_signal == SIGXFSZ) out->resource_exceeded = true;
    if (pr.term_signal == SIGKILL && !runner_killed) out->resource_exceeded = true;
    if (have_marker && out->outcome.kind == HarnessOutcome::Kind::MEMORY) out->resource_exceeded = true;
    if (pr.stdout_truncated) out->stdout_text += "\n[stdout truncated]";
    if (pr.stderr_truncated) out->stderr_text += "\n[stderr truncated]";
}

// ---------- SubprocessBackend ----------

SubprocessBackend::SubprocessBackend(BackendOptions opts) : opts_(std::move(opts)) {
    opts_.work_root = default_work_root(opts_);
    if (opts_.python_argv.empty()) opts_.python_argv = {"python3"};
}

SubprocessBackend::~SubprocessBackend() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& kv : instances_) ids.push_back(kv.first);
    }
    for (const auto& id : ids) {
        std::string err = destroy(id);
        if (!err.empty()) std::cerr << log_tag() << " shutdown: " << err << "\n";
    }
}

std::vector<std::string> SubprocessBackend::interpreter_argv() const {
    std::vector<std::string> argv = opts_.python_argv;
    argv.push_back("-I");
    argv.push_back("-B");
    argv.push_back("-");
    return argv;
}

bool SubprocessBackend::writable_dir(const SandboxConfig& cfg) const {
    return cfg.filesystem == FilesystemAccess::READ_WRITE;
}

std::filesystem::perms SubprocessBackend::dir_perms(const SandboxConfig& cfg) const {
    using std::filesystem::perms;
    if (writable_dir(cfg)) return perms::owner_all;
    // NONE: the directory can be entered but not listed or written.
    if (!cfg.filesystem_allowed()) return perms::owner_exec;
    return perms::owner_read | perms::owner_exec;
}

ProcLimits SubprocessBackend::limits_for(const SandboxConfig& cfg, int timeout_ms) const {
    ProcLimits lim;
    lim.timeout_ms = timeout_ms;
    lim.rlimit_cpu_sec = cpu_seconds_for(cfg.limits);
    lim.rlimit_as_mb = cfg.limits.memory_mb;
    lim.rlimit_nofile = cfg.limits.max_file_ops;
    lim.rlimit_nproc = opts_.pids_limit;
    lim.rlimit_fsize_bytes = writable_dir(cfg) ? 10LL * 1024 * 1024 : 0;
    lim.no_new_privs = true;
    // The filter is the only thing that denies sockets to this backend.
    lim.enable_seccomp = opts_.seccomp || !cfg.network_allowed;
    lim.seccomp_allow_network = cfg.network_allowed;
    lim.clear_env = true;
    lim.env = {"PATH=/usr/local/bin:/usr/bin:/bin", "LANG=C.UTF-8", "PYTHONIOENCODING=utf-8"};
    return lim;
}

std::string SubprocessBackend::create(const SandboxConfig& cfg, std::string* instance_id) {
    if (!instance_id) return "null instance_id";
    if (limits_for(cfg, cfg.limits.wall_clock_ms).enable_seccomp && !seccomp_available()) {
        return std::string("seccomp unavailable, cannot enforce ") +
               (cfg.network_allowed ? "the syscall allowlist" : "network denial") + " for " +
               isolation_to_str(cfg.isolation);
    }

    std::error_code ec;
    std::filesystem::create_directories(opts_.work_root, ec);
    if (ec) return "work root " + opts_.work_root.string() + ": " + ec.message();

    Instance inst;
    inst.cfg = cfg;
    std::string id = gen_hex_id("sbx-");
    inst.dir = opts_.work_root / id;
    if (!std::filesystem::create_directory(inst.dir, ec) || ec) {
        return "create " + inst.dir.string() + ": " + (ec ? ec.message() : std::string("already exists"));
    }
    std::filesystem::permissions(inst.dir, dir_perms(cfg), std::filesystem::perm_options::replace, ec);
    if (ec) {
        std::error_code ec2;
        std::filesystem::remove_all(inst.dir, ec2);
        return "chmod " + inst.dir.string() + ": " + ec.message();
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        instances_.emplace(id, std::move(inst));
    }
    *instance_id = id;
    return "";
}

RawRunResult SubprocessBackend::run(const std::string& instance_id,
                                    const std::string& code,
                                    const TestCase* test,
                                    int timeout_ms,
                                    const CancelFlags& cancel) {
    Instance inst;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = instances_.find(instance_id);
        if (it == instances_.end()) {
            RawRunResult r;
            r.error = "unknown instance " + instance_id;
            return r;
        }
        inst = it->second;
    }

    const std::string nonce = make_harness_nonce();
    const std::string script = build_harness_script(code, test ? &test->expression : nullptr, nonce);
    const ProcLimits lim = limits_for(inst.cfg, timeout_ms);

    ProcResult pr;
    bool started = proc_run_capture_sandboxed(interpreter_argv(), inst.dir.string(), script, lim, &pr, cancel);
    RawRunResult r;
    classify_proc_result(pr, started, nonce, &r);
    if (!r.started) {
        std::cerr << log_tag() << " " << instance_id << ": " << r.error << "\n";
    }
    return r;
}

std::string SubprocessBackend::destroy(const std::string& instance_id) {
    std::filesystem::path dir;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = instances_.find(instance_id);
        if (it == instances_.end()) return "";
        dir = it->second.dir;
    }
    std::error_code ec;
    std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace, ec);
    std::filesystem::remove_all(dir, ec);
    // The entry stays on failure so a retry can finish the job.
    if (ec) return "remove " + dir.string() + ": " + ec.message();
    std::lock_guard<std::mutex> lk(mu_);
    instances_.erase(instance_id);
    return "";
}

size_t SubprocessBackend::live_instances() const {
    std::lock_guard<std::mutex> lk(mu_);
    return instances_.size();
}

} // namespace evogate
