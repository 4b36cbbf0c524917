#pragma once
#include "types.h"

#include <string>
#include <vector>

namespace evogate {

enum class Profile { DEV, PROD };

// Detect profile from EVOGATE_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (no fsync, no seccomp, subprocess backend, 4 workers, 2 sandboxes)
// PROD: strict (fsync on, seccomp on, restricted backend, dangerous code never runs)
void apply_profile_defaults(Profile p);

// Everything the controller needs, read from EVOGATE_* env vars.
struct PipelineConfig {
    int workers{4};
    int max_sandboxes{2};
    BackendKind backend{BackendKind::SUBPROCESS};
    std::vector<std::string> python_argv{"python3"};
    std::string container_image{"python:3.12-slim"};
    int create_retries{2};
    int watchdog_grace_ms{2000};
    std::string audit_path{"evogate_audit.jsonl"};
    bool audit_fsync{false};
    bool seccomp{false};
    bool execute_dangerous{false};
    int max_attempts{3};
    int audit_max_attempts{4};
    std::string event_log_path;         // empty = no event log
};

// Values out of range are clamped; an unknown backend name falls back to
// subprocess with a warning on stderr.
PipelineConfig load_pipeline_config();

} // namespace evogate
