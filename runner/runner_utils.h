#pragma once

#include "evogate/audit.h"
#include "evogate/config.h"
#include "evogate/controller.h"
#include "evogate/log.h"
#include "evogate/policy.h"
#include "evogate/sandbox_backend.h"
#include "evogate/sandbox_pool.h"
#include "evogate/static_analyzer.h"

#include <json-c/json.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace evogate {

// Everything one CLI process wires together. Members are declared in
// dependency order so the controller goes first on destruction.
struct Pipeline {
    PipelineConfig cfg;
    StaticAnalyzer analyzer;
    PolicyEngine policy;
    std::unique_ptr<ISandboxBackend> backend;
    std::unique_ptr<SandboxPool> pool;
    std::unique_ptr<AuditStore> audit;
    std::unique_ptr<JsonlEventLog> events;
    std::unique_ptr<EvolutionController> controller;
};

// Applies the profile defaults, reads EVOGATE_* and opens the audit store.
// wall_ms_override > 0 replaces the isolation table's wall clock.
// Without the intake journal, recover() only restores pending reviews.
// Returns empty string on success.
std::string open_pipeline(Pipeline* p, int wall_ms_override = 0, bool intake_journal = true);

// Audit store only (no backend, no controller).
std::string open_audit_only(std::unique_ptr<AuditStore>* out);

// <audit dir>/intake.wal.jsonl
std::filesystem::path intake_journal_for(const std::filesystem::path& audit_path);

// Pretty JSON to stdout; consumes the reference.
void print_json(json_object* o);

// 0 approved, 1 rejected or blocked, 3 pending review, 4 needs re-audit.
int exit_code_for(RequestState s);

// Reads --flag value pairs after argv[first]; positional args land in *pos.
struct CliArgs {
    std::vector<std::string> pos;
    std::vector<std::pair<std::string, std::string>> flags;

    std::string flag(const std::string& name, const std::string& defv = "") const;
    int flag_int(const std::string& name, int defv) const;
};
CliArgs parse_cli_args(int argc, char** argv, int first);

} // namespace evogate
