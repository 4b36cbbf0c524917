#include "evogate/backends.h"

namespace evogate {

RestrictedBackend::RestrictedBackend(BackendOptions opts) : SubprocessBackend(std::move(opts)) {}

std::vector<std::string> RestrictedBackend::interpreter_argv() const {
    std::vector<std::string> argv = opts_.python_argv;
    argv.push_back("-I");
    argv.push_back("-S");
    argv.push_back("-B");
    argv.push_back("-");
    return argv;
}

ProcLimits RestrictedBackend::limits_for(const SandboxConfig& cfg, int timeout_ms) const {
    ProcLimits lim = SubprocessBackend::limits_for(cfg, timeout_ms);
    lim.rlimit_nproc = 1;
    lim.rlimit_fsize_bytes = 0;
    lim.enable_seccomp = true;
    lim.seccomp_allow_network = false;
    lim.clear_env = true;
    lim.env.clear();
    return lim;
}

} // namespace evogate
