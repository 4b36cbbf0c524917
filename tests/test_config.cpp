#include "test_common.h"
#include "evogate/config.h"
#include <cstdlib>

int main() {
    // Test 1: Default profile is DEV
    unsetenv("EVOGATE_PROFILE");
    auto p = evogate::detect_profile();
    expect_true(p == evogate::Profile::DEV, "default should be DEV");

    // Test 2: PROD detection
    setenv("EVOGATE_PROFILE", "prod", 1);
    p = evogate::detect_profile();
    expect_true(p == evogate::Profile::PROD, "should detect PROD");

    // Test 3: Case insensitive
    setenv("EVOGATE_PROFILE", "PRODUCTION", 1);
    p = evogate::detect_profile();
    expect_true(p == evogate::Profile::PROD, "should detect PROD case-insensitive");

    // Test 4: Apply defaults (won't override existing)
    setenv("EVOGATE_AUDIT_FSYNC", "0", 1); // pre-existing
    unsetenv("EVOGATE_BACKEND");
    unsetenv("EVOGATE_SECCOMP_ENABLE");
    evogate::apply_profile_defaults(evogate::Profile::PROD);
    std::string val = std::getenv("EVOGATE_AUDIT_FSYNC") ? std::getenv("EVOGATE_AUDIT_FSYNC") : "";
    expect_true(val == "0", "should NOT override pre-existing env var");

    // Test 5: Apply sets missing vars
    val = std::getenv("EVOGATE_BACKEND") ? std::getenv("EVOGATE_BACKEND") : "";
    expect_true(val == "restricted", "PROD should select the restricted backend");

    auto c = evogate::load_pipeline_config();
    expect_true(c.backend == evogate::BackendKind::RESTRICTED, "config reads the backend");
    expect_true(c.seccomp, "PROD turns seccomp on");
    expect_true(!c.audit_fsync, "explicit EVOGATE_AUDIT_FSYNC=0 wins");
    expect_true(!c.execute_dangerous, "dangerous code never runs in PROD");

    // Test 6: Clamping and fallbacks
    setenv("EVOGATE_WORKERS", "1000", 1);
    setenv("EVOGATE_MAX_SANDBOXES", "0", 1);
    setenv("EVOGATE_BACKEND", "vm", 1);
    setenv("EVOGATE_PYTHON", "/opt/py/bin/python3 -X utf8", 1);
    setenv("EVOGATE_AUDIT_PATH", "/var/lib/evogate/audit.jsonl", 1);
    c = evogate::load_pipeline_config();
    expect_eq_ll(c.workers, 64, "workers clamped");
    expect_eq_ll(c.max_sandboxes, 1, "sandboxes clamped");
    expect_true(c.backend == evogate::BackendKind::SUBPROCESS, "unknown backend falls back to subprocess");
    expect_eq_ll((long long)c.python_argv.size(), 3, "python argv split");
    expect_true(c.python_argv[0] == "/opt/py/bin/python3", "python argv[0]");
    expect_true(c.audit_path == "/var/lib/evogate/audit.jsonl", "audit path");

    setenv("EVOGATE_BACKEND", "docker", 1);
    c = evogate::load_pipeline_config();
    expect_true(c.backend == evogate::BackendKind::CONTAINER, "docker is an alias of container");

    // Test 7: DEV defaults
    for (const char* k : {"EVOGATE_WORKERS", "EVOGATE_MAX_SANDBOXES", "EVOGATE_BACKEND", "EVOGATE_SECCOMP_ENABLE",
                          "EVOGATE_AUDIT_FSYNC", "EVOGATE_PYTHON", "EVOGATE_AUDIT_PATH"}) {
        unsetenv(k);
    }
    evogate::apply_profile_defaults(evogate::Profile::DEV);
    c = evogate::load_pipeline_config();
    expect_eq_ll(c.workers, 4, "DEV workers");
    expect_eq_ll(c.max_sandboxes, 2, "DEV sandboxes");
    expect_true(c.backend == evogate::BackendKind::SUBPROCESS, "DEV backend");
    expect_true(!c.seccomp, "DEV seccomp off");

    // Test 8: Profile name
    expect_true(std::string(evogate::profile_name(evogate::Profile::DEV)) == "dev", "dev name");
    expect_true(std::string(evogate::profile_name(evogate::Profile::PROD)) == "prod", "prod name");

    // Cleanup
    for (const char* k : {"EVOGATE_PROFILE", "EVOGATE_WORKERS", "EVOGATE_MAX_SANDBOXES", "EVOGATE_BACKEND",
                          "EVOGATE_SECCOMP_ENABLE", "EVOGATE_AUDIT_FSYNC", "EVOGATE_EXECUTE_DANGEROUS"}) {
        unsetenv(k);
    }

    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
