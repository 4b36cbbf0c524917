#include "runner_utils.h"

#include <cstdlib>
#include <iostream>

namespace evogate {

std::filesystem::path intake_journal_for(const std::filesystem::path& audit_path) {
    std::filesystem::path dir = audit_path.parent_path();
    if (dir.empty()) dir = ".";
    return dir / "intake.wal.jsonl";
}

std::string open_audit_only(std::unique_ptr<AuditStore>* out) {
    apply_profile_defaults(detect_profile());
    PipelineConfig cfg = load_pipeline_config();
    auto store = std::make_unique<AuditStore>(cfg.audit_path);
    store->set_fsync(cfg.audit_fsync);
    std::string err = store->open();
    if (!err.empty()) return "audit " + cfg.audit_path + ": " + err;
    *out = std::move(store);
    return "";
}

std::string open_pipeline(Pipeline* p, int wall_ms_override, bool intake_journal) {
    Profile prof = detect_profile();
    apply_profile_defaults(prof);
    p->cfg = load_pipeline_config();
    const PipelineConfig& cfg = p->cfg;

    BackendOptions bo;
    bo.python_argv = cfg.python_argv;
    bo.container_image = cfg.container_image;
    bo.seccomp = cfg.seccomp;
    p->backend = make_backend(cfg.backend, bo);
    if (!p->backend) return std::string("no backend for ") + backend_to_str(cfg.backend);

    p->pool = std::make_unique<SandboxPool>((size_t)cfg.max_sandboxes);

    p->audit = std::make_unique<AuditStore>(cfg.audit_path);
    p->audit->set_fsync(cfg.audit_fsync);
    std::string err = p->audit->open();
    if (!err.empty()) return "audit " + cfg.audit_path + ": " + err;

    if (!cfg.event_log_path.empty()) {
        p->events = std::make_unique<JsonlEventLog>(cfg.event_log_path);
        if (!p->events->ok()) {
            std::cerr << "[config] cannot open event log " << cfg.event_log_path << ", events disabled\n";
            p->events.reset();
        }
    }

    ControllerOptions co;
    co.workers = cfg.workers;
    co.execute_dangerous = cfg.execute_dangerous;
    co.max_attempts = cfg.max_attempts;
    co.audit_max_attempts = cfg.audit_max_attempts;
    co.wall_clock_override_ms = wall_ms_override;
    if (intake_journal) co.intake_journal = intake_journal_for(cfg.audit_path);
    co.journal_fsync = cfg.audit_fsync;
    co.executor.create_retries = cfg.create_retries;
    co.executor.watchdog_grace_ms = cfg.watchdog_grace_ms;

    p->controller = std::make_unique<EvolutionController>(p->analyzer, *p->pool, *p->backend, p->policy,
                                                          *p->audit, co);
    if (p->events) p->controller->subscribe(p->events.get());

    std::cerr << "[config] profile=" << profile_name(prof) << " backend=" << p->backend->name()
              << " workers=" << cfg.workers << " sandboxes=" << cfg.max_sandboxes
              << " audit=" << cfg.audit_path << "\n";
    return "";
}

void print_json(json_object* o) {
    std::cout << json_object_to_json_string_ext(o, JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_NOSLASHESCAPE)
              << "\n";
    json_object_put(o);
}

int exit_code_for(RequestState s) {
    switch (s) {
        case RequestState::AUTO_APPROVED:
        case RequestState::APPROVED:
            return 0;
        case RequestState::PENDING_HUMAN_REVIEW:
            return 3;
        case RequestState::NEEDS_REAUDIT:
            return 4;
        default:
            return 1;
    }
}

std::string CliArgs::flag(const std::string& name, const std::string& defv) const {
    for (const auto& kv : flags) {
        if (kv.first == name) return kv.second;
    }
    return defv;
}

int CliArgs::flag_int(const std::string& name, int defv) const {
    std::string v = flag(name);
    if (v.empty()) return defv;
    char* end = nullptr;
    long n = std::strtol(v.c_str(), &end, 10);
    if (!end || *end != '\0') return defv;
    return (int)n;
}

CliArgs parse_cli_args(int argc, char** argv, int first) {
    CliArgs a;
    for (int i = first; i < argc; i++) {
        std::string s = argv[i];
        if (s.rfind("--", 0) == 0 && s.size() > 2) {
            std::string name = s.substr(2);
            std::string val;
            size_t eq = name.find('=');
            if (eq != std::string::npos) {
                val = name.substr(eq + 1);
                name = name.substr(0, eq);
            } else if (i + 1 < argc) {
                val = argv[++i];
            }
            a.flags.emplace_back(name, val);
            continue;
        }
        a.pos.push_back(s);
    }
    return a;
}

} // namespace evogate
