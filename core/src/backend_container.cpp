#include "evogate/backends.h"

#include "evogate/util.h"

#include <iostream>
#include <sstream>

namespace evogate {

namespace {

// Limits for the docker client itself, not for the candidate.
ProcLimits docker_client_limits(int timeout_ms) {
    ProcLimits lim;
    lim.timeout_ms = timeout_ms;
    lim.rlimit_cpu_sec = 0;
    lim.rlimit_as_mb = 0;
    lim.rlimit_fsize_bytes = -1;
    lim.rlimit_nofile = 256;
    lim.rlimit_nproc = 0;
    lim.no_new_privs = true;
    return lim;
}

std::string fmt_cpus(double share) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(2);
    oss << share;
    return oss.str();
}

std::string trim_nl(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

} // namespace

ContainerBackend::ContainerBackend(BackendOptions opts) : opts_(std::move(opts)) {
    if (opts_.docker_bin.empty()) opts_.docker_bin = "docker";
}

ContainerBackend::~ContainerBackend() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& kv : instances_) names.push_back(kv.first);
    }
    for (const auto& n : names) {
        std::string err = destroy(n);
        if (!err.empty()) std::cerr << "[backend.container] shutdown: " << err << "\n";
    }
}

std::vector<std::string> ContainerBackend::run_argv(const SandboxConfig& cfg,
                                                    const std::string& container_name) const {
    std::vector<std::string> argv{
        opts_.docker_bin, "run", "-d", "--rm",
        "--name", container_name,
        "--memory=" + std::to_string(cfg.limits.memory_mb) + "m",
        "--memory-swap=" + std::to_string(cfg.limits.memory_mb) + "m",
        "--cpus=" + fmt_cpus(cfg.limits.cpu_share),
        "--pids-limit=" + std::to_string(opts_.pids_limit),
        "--ulimit", "nofile=" + std::to_string(cfg.limits.max_file_ops) + ":" +
                    std::to_string(cfg.limits.max_file_ops),
        "--cap-drop=ALL",
        "--security-opt=no-new-privileges",
    };
    if (!cfg.network_allowed) argv.push_back("--network=none");
    if (cfg.filesystem != FilesystemAccess::READ_WRITE) argv.push_back("--read-only");
    if (cfg.filesystem == FilesystemAccess::READ_WRITE) {
        argv.push_back("--tmpfs");
        argv.push_back("/work:rw,size=10m");
        argv.push_back("--workdir=/work");
    }
    argv.push_back(opts_.container_image);
    argv.push_back("sleep");
    argv.push_back("infinity");
    return argv;
}

std::string ContainerBackend::create(const SandboxConfig& cfg, std::string* instance_id) {
    if (!instance_id) return "null instance_id";
    const std::string name = gen_hex_id("evogate-");

    ProcResult pr;
    bool started = proc_run_capture_sandboxed(run_argv(cfg, name), "", "", docker_client_limits(60000), &pr);
    if (!started) return "docker run: " + pr.error;
    if (pr.timed_out) return "docker run: timed out";
    if (pr.exit_code != 0) {
        return "docker run: exit " + std::to_string(pr.exit_code) + ": " + trim_nl(pr.stderr_text);
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        instances_[name] = cfg;
    }
    *instance_id = name;
    return "";
}

RawRunResult ContainerBackend::run(const std::string& instance_id,
                                   const std::string& code,
                                   const TestCase* test,
                                   int timeout_ms,
                                   const CancelFlags& cancel) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (instances_.find(instance_id) == instances_.end()) {
            RawRunResult r;
            r.error = "unknown instance " + instance_id;
            return r;
        }
    }

    const std::string nonce = make_harness_nonce();
    const std::string script = build_harness_script(code, test ? &test->expression : nullptr, nonce);
    std::vector<std::string> argv{opts_.docker_bin, "exec", "-i", instance_id, "python3", "-I", "-B", "-"};

    ProcResult pr;
    ProcLimits lim = docker_client_limits(timeout_ms);
    bool started = proc_run_capture_sandboxed(argv, "", script, lim, &pr, cancel);
    RawRunResult r;
    classify_proc_result(pr, started, nonce, &r);

    // 137 = the exec'd process was SIGKILLed inside the container (OOM killer).
    if (r.started && pr.exit_code == 137 && !pr.timed_out && !pr.cancelled) r.resource_exceeded = true;
    if (!r.started) {
        std::cerr << "[backend.container] " << instance_id << ": " << r.error << "\n";
    }
    return r;
}

std::string ContainerBackend::destroy(const std::string& instance_id) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (instances_.find(instance_id) == instances_.end()) return "";
    }
    ProcResult pr;
    bool started = proc_run_capture_sandboxed({opts_.docker_bin, "rm", "-f", instance_id}, "", "",
                                              docker_client_limits(30000), &pr);
    if (!started) return "docker rm: " + pr.error;
    if (pr.exit_code != 0) {
        return "docker rm: exit " + std::to_string(pr.exit_code) + ": " + trim_nl(pr.stderr_text);
    }
    std::lock_guard<std::mutex> lk(mu_);
    instances_.erase(instance_id);
    return "";
}

} // namespace evogate
