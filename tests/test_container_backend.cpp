#include "test_common.h"

#include "evogate/backends.h"

#include <algorithm>
#include <vector>

using namespace evogate;

static bool has(const std::vector<std::string>& argv, const std::string& a) {
    return std::find(argv.begin(), argv.end(), a) != argv.end();
}

int main() {
    BackendOptions opts;
    opts.docker_bin = "docker";
    opts.container_image = "python:3.12-slim";
    opts.pids_limit = 16;
    ContainerBackend backend(opts);

    // Tightest level: no network, no writable filesystem.
    {
        SandboxConfig cfg = sandbox_config_for(IsolationLevel::MAXIMUM, BackendKind::CONTAINER);
        auto argv = backend.run_argv(cfg, "evogate-test");
        expect_eq_str(argv[0], "docker", "docker binary");
        expect_true(has(argv, "--network=none"), "network disabled");
        expect_true(has(argv, "--read-only"), "read-only root");
        expect_true(!has(argv, "--tmpfs"), "no scratch mount");
        expect_true(has(argv, "--memory=64m") && has(argv, "--memory-swap=64m"), "memory cap");
        expect_true(has(argv, "--cpus=0.10"), "cpu share");
        expect_true(has(argv, "--pids-limit=16"), "pids limit");
        expect_true(has(argv, "nofile=32:32"), "file descriptor cap");
        expect_true(has(argv, "--cap-drop=ALL"), "capabilities dropped");
        expect_true(has(argv, "--security-opt=no-new-privileges"), "no new privileges");
        expect_true(has(argv, "evogate-test"), "container name");
        auto img = std::find(argv.begin(), argv.end(), "python:3.12-slim");
        expect_true(img != argv.end() && img + 1 != argv.end() && *(img + 1) == "sleep", "image then keepalive");
    }

    // HIGH keeps network off, read-only.
    {
        SandboxConfig cfg = sandbox_config_for(IsolationLevel::HIGH, BackendKind::CONTAINER);
        auto argv = backend.run_argv(cfg, "c");
        expect_true(has(argv, "--network=none") && has(argv, "--read-only"), "high isolation flags");
        expect_true(has(argv, "--memory=128m"), "high memory");
    }

    // LOW: network allowed, writable scratch instead of a read-only root.
    {
        SandboxConfig cfg = sandbox_config_for(IsolationLevel::LOW, BackendKind::CONTAINER);
        auto argv = backend.run_argv(cfg, "c");
        expect_true(!has(argv, "--network=none"), "network allowed");
        expect_true(!has(argv, "--read-only"), "writable root");
        expect_true(has(argv, "--tmpfs") && has(argv, "--workdir=/work"), "scratch work dir");
        expect_true(has(argv, "--memory=512m"), "low memory");
        expect_true(has(argv, "--cpus=0.80"), "low cpu share");
    }

    // Unknown instances fail cleanly without touching docker.
    {
        RawRunResult r = backend.run("evogate-missing", "x = 1\n", nullptr, 1000, {});
        expect_true(!r.started && contains(r.error, "unknown instance"), "unknown instance run");
        expect_true(backend.destroy("evogate-missing").empty(), "destroy of unknown id is a no-op");
        expect_true(!backend.supports_test_isolation(), "container runs share one environment");
    }

    std::cerr << "test_container_backend: ALL PASSED" << std::endl;
    return 0;
}
