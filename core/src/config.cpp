#include "evogate/config.h"
#include "evogate/proc.h"
#include "evogate/util.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

namespace evogate {

Profile detect_profile() {
    const char* env = std::getenv("EVOGATE_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // Must be called before any worker threads are created.
    // overwrite=0: won't override existing env vars
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("EVOGATE_AUDIT_FSYNC",       "0",          NO_OVERWRITE);
            setenv("EVOGATE_SECCOMP_ENABLE",    "0",          NO_OVERWRITE);
            setenv("EVOGATE_BACKEND",           "subprocess", NO_OVERWRITE);
            setenv("EVOGATE_WORKERS",           "4",          NO_OVERWRITE);
            setenv("EVOGATE_MAX_SANDBOXES",     "2",          NO_OVERWRITE);
            setenv("EVOGATE_EXECUTE_DANGEROUS", "0",          NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("EVOGATE_AUDIT_FSYNC",       "1",          NO_OVERWRITE);
            setenv("EVOGATE_SECCOMP_ENABLE",    "1",          NO_OVERWRITE);
            setenv("EVOGATE_BACKEND",           "restricted", NO_OVERWRITE);
            setenv("EVOGATE_EXECUTE_DANGEROUS", "0",          NO_OVERWRITE);
            break;
    }
}

PipelineConfig load_pipeline_config() {
    PipelineConfig c;
    c.workers = std::clamp(getenv_int("EVOGATE_WORKERS", c.workers), 1, 64);
    c.max_sandboxes = std::clamp(getenv_int("EVOGATE_MAX_SANDBOXES", c.max_sandboxes), 1, 64);

    std::string backend = getenv_str("EVOGATE_BACKEND", "subprocess");
    if (!backend_from_str(backend, &c.backend)) {
        std::cerr << "[config] unknown EVOGATE_BACKEND '" << backend << "', using subprocess\n";
        c.backend = BackendKind::SUBPROCESS;
    }

    std::string python = getenv_str("EVOGATE_PYTHON", "python3");
    std::vector<std::string> argv = split_argv_quoted(python);
    if (argv.empty()) {
        std::cerr << "[config] EVOGATE_PYTHON does not parse, using python3\n";
        argv = {"python3"};
    }
    c.python_argv = argv;

    c.container_image = getenv_str("EVOGATE_CONTAINER_IMAGE", c.container_image);
    c.create_retries = std::clamp(getenv_int("EVOGATE_CREATE_RETRIES", c.create_retries), 0, 10);
    c.watchdog_grace_ms = std::clamp(getenv_int("EVOGATE_WATCHDOG_GRACE_MS", c.watchdog_grace_ms), 100, 600000);
    c.audit_path = getenv_str("EVOGATE_AUDIT_PATH", c.audit_path);
    c.audit_fsync = getenv_bool("EVOGATE_AUDIT_FSYNC", c.audit_fsync);
    c.seccomp = getenv_bool("EVOGATE_SECCOMP_ENABLE", c.seccomp);
    c.execute_dangerous = getenv_bool("EVOGATE_EXECUTE_DANGEROUS", c.execute_dangerous);
    c.max_attempts = std::clamp(getenv_int("EVOGATE_MAX_ATTEMPTS", c.max_attempts), 1, 20);
    c.audit_max_attempts = std::clamp(getenv_int("EVOGATE_AUDIT_MAX_ATTEMPTS", c.audit_max_attempts), 1, 20);
    c.event_log_path = getenv_str("EVOGATE_EVENT_LOG", "");
    return c;
}

} // namespace evogate
