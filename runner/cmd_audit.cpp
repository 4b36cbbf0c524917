#include "commands.h"
#include "runner_utils.h"

#include "evogate/serialization.h"
#include "evogate/util.h"

#include <iostream>
#include <vector>

using namespace evogate;

static std::string final_state_of(const AuditEntry& e) {
    std::string st;
    json_object* rec = json_tokener_parse(e.record_json.c_str());
    if (rec) {
        json_get_string(rec, "final_state", &st);
        json_object_put(rec);
    }
    return st;
}

static int audit_verify(const std::filesystem::path& path) {
    AuditVerifyResult r = AuditStore::verify_file(path);
    if (r.ok) {
        std::cout << "AUDIT: OK (" << r.entries << " entries)\n";
        return 0;
    }
    std::cout << "AUDIT: BROKEN at seq " << r.first_bad_seq << ": " << r.error << "\n";
    return 1;
}

// Usage: evogate_cli audit <list [--limit N]|show <id>|verify>
int cmd_audit(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: evogate_cli audit <list [--limit N]|show <request_id>|verify>\n";
        std::cerr << "env: EVOGATE_AUDIT_PATH (default evogate_audit.jsonl)\n";
        return 2;
    }
    const std::string sub = argv[2];

    if (sub == "verify") {
        apply_profile_defaults(detect_profile());
        return audit_verify(load_pipeline_config().audit_path);
    }

    std::unique_ptr<AuditStore> store;
    std::string err = open_audit_only(&store);
    if (!err.empty()) {
        std::cerr << err << "\n";
        return 5;
    }

    if (sub == "list") {
        // --limit N keeps the newest N entries, still printed oldest first.
        const int limit = parse_cli_args(argc, argv, 3).flag_int("limit", 0);
        std::vector<AuditEntry> entries = store->list();
        if (limit > 0 && entries.size() > (size_t)limit) entries.erase(entries.begin(), entries.end() - limit);
        for (const auto& e : entries) {
            json_object* o = json_object_new_object();
            json_object_object_add(o, "seq", json_object_new_int64((int64_t)e.seq));
            json_object_object_add(o, "kind", json_object_new_string(e.kind.c_str()));
            json_object_object_add(o, "request_id", json_object_new_string(e.request_id.c_str()));
            json_object_object_add(o, "final_state", json_object_new_string(final_state_of(e).c_str()));
            std::cout << json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE)
                      << "\n";
            json_object_put(o);
        }
        return 0;
    }

    if (sub == "show") {
        if (argc < 4) {
            std::cerr << "usage: evogate_cli audit show <request_id>\n";
            return 2;
        }
        auto entries = store->entries_for(argv[3]);
        if (entries.empty()) {
            std::cerr << "no audit entries for " << argv[3] << "\n";
            return 1;
        }
        json_object* arr = json_object_new_array();
        for (const auto& e : entries) {
            json_object* o = json_object_new_object();
            json_object_object_add(o, "seq", json_object_new_int64((int64_t)e.seq));
            json_object_object_add(o, "kind", json_object_new_string(e.kind.c_str()));
            json_object* rec = json_tokener_parse(e.record_json.c_str());
            json_object_object_add(o, "record", rec ? rec : json_object_new_string(e.record_json.c_str()));
            json_object_object_add(o, "chain_hash", json_object_new_string(e.chain_hash.c_str()));
            json_object_array_add(arr, o);
        }
        print_json(arr);
        return 0;
    }

    std::cerr << "unknown audit command: " << sub << "\n";
    return 2;
}

// Usage: evogate_cli review <request_id> <approve|reject> [--reviewer R] [--note N]
// Pending reviews are rebuilt from the audit log, so this works across restarts.
int cmd_review(int argc, char** argv) {
    CliArgs args = parse_cli_args(argc, argv, 2);
    if (args.pos.size() < 2 || (args.pos[1] != "approve" && args.pos[1] != "reject")) {
        std::cerr << "usage: evogate_cli review <request_id> <approve|reject> [--reviewer R] [--note N]\n";
        return 2;
    }
    const std::string id = args.pos[0];
    const bool approved = args.pos[1] == "approve";

    Pipeline p;
    std::string err = open_pipeline(&p, 0, false);
    if (!err.empty()) {
        std::cerr << err << "\n";
        return 5;
    }
    err = p.controller->recover();
    if (!err.empty()) std::cerr << "[controller] recovery: " << err << "\n";

    if (!p.controller->resolve_review(id, approved, args.flag("reviewer", getenv_str("USER", "")), args.flag("note"))) {
        EvolutionResult r;
        if (!p.controller->get_status(id, &r)) {
            std::cerr << "unknown request " << id << "\n";
        } else {
            std::cerr << id << " is not pending review (state " << state_to_str(r.state) << ")\n";
        }
        return 1;
    }
    EvolutionResult r;
    p.controller->get_status(id, &r);
    print_json(evolution_result_to_json(r));
    return exit_code_for(r.state);
}

int cmd_pending(int, char**) {
    Pipeline p;
    std::string err = open_pipeline(&p, 0, false);
    if (!err.empty()) {
        std::cerr << err << "\n";
        return 5;
    }
    err = p.controller->recover();
    if (!err.empty()) std::cerr << "[controller] recovery: " << err << "\n";

    json_object* arr = json_object_new_array();
    for (const auto& r : p.controller->list_pending_reviews()) {
        json_object_array_add(arr, evolution_result_to_json(r));
    }
    print_json(arr);
    return 0;
}

int cmd_stats(int, char**) {
    Pipeline p;
    std::string err = open_pipeline(&p, 0, false);
    if (!err.empty()) {
        std::cerr << err << "\n";
        return 5;
    }
    err = p.controller->recover();
    if (!err.empty()) std::cerr << "[controller] recovery: " << err << "\n";
    print_json(evolution_stats_to_json(p.controller->stats()));
    return 0;
}

// Usage: evogate_cli history [--limit N]
// Newest decision first; each entry carries the review outcome when there is one.
int cmd_history(int argc, char** argv) {
    CliArgs args = parse_cli_args(argc, argv, 2);
    const int limit = args.flag_int("limit", 50);
    if (limit < 1) {
        std::cerr << "usage: evogate_cli history [--limit N] (N >= 1)\n";
        return 2;
    }
    Pipeline p;
    std::string err = open_pipeline(&p, 0, false);
    if (!err.empty()) {
        std::cerr << err << "\n";
        return 5;
    }
    json_object* arr = json_object_new_array();
    for (const auto& r : p.controller->history((size_t)limit)) {
        json_object_array_add(arr, evolution_result_to_json(r));
    }
    print_json(arr);
    return 0;
}
