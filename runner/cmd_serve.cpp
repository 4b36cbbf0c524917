#include "commands.h"
#include "runner_utils.h"

#include "evogate/serialization.h"
#include "evogate/util.h"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <iostream>
#include <map>

using namespace evogate;

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop.store(true);
}

std::vector<std::filesystem::path> list_json(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> v;
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) return v;
    for (auto& e : std::filesystem::directory_iterator(dir, ec)) {
        if (ec) break;
        if (!e.is_regular_file(ec)) continue;
        if (e.path().extension() == ".json") v.push_back(e.path());
    }
    std::sort(v.begin(), v.end());
    return v;
}

bool move_file(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec) {
        std::cerr << "[serve] move " << from.string() << " -> " << to.string() << ": " << ec.message() << "\n";
        return false;
    }
    return true;
}

void write_result(const std::filesystem::path& dst, const EvolutionResult& r) {
    json_object* o = evolution_result_to_json(r);
    std::string body = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_NOSLASHESCAPE);
    json_object_put(o);
    std::string err = write_atomic_file(dst, body + "\n");
    if (!err.empty()) std::cerr << "[serve] write " << dst.string() << ": " << err << "\n";
}

} // namespace

// Usage: evogate_cli serve --queue DIR [--scan_ms N] [--wall-ms N]
//
// Queue layout:
//   inbox/*.json       request files (see parse_request_file); id defaults to the file stem
//   processing/        requests handed to the controller
//   done/<name>        the request file once it settled
//   out/<id>.json      latest EvolutionResult (rewritten after a review)
//   reviews/*.json     {"id":..., "approved":true, "reviewer":..., "note":...}
//   failed/            unparsable requests and reviews that were refused
int cmd_serve(int argc, char** argv) {
    CliArgs args = parse_cli_args(argc, argv, 2);
    std::filesystem::path q = args.flag("queue", getenv_str("EVOGATE_QUEUE_DIR", "evogate_queue"));
    int scan_ms = std::clamp(args.flag_int("scan_ms", getenv_int("EVOGATE_SERVE_SCAN_MS", 150)), 20, 5000);

    const auto inbox = q / "inbox";
    const auto processing = q / "processing";
    const auto done = q / "done";
    const auto out = q / "out";
    const auto reviews = q / "reviews";
    const auto failed = q / "failed";
    for (const auto& d : {inbox, processing, done, out, reviews, failed}) {
        std::error_code ec;
        std::filesystem::create_directories(d, ec);
        if (ec) {
            std::cerr << "[serve] cannot create " << d.string() << ": " << ec.message() << "\n";
            return 5;
        }
    }

    Pipeline p;
    std::string err = open_pipeline(&p, args.flag_int("wall-ms", 0));
    if (!err.empty()) {
        std::cerr << err << "\n";
        return 5;
    }

    // id -> file name in processing/
    std::map<std::string, std::string> in_flight;
    // Files left in processing/ by a previous run: the intake journal already
    // holds them, so only the bookkeeping is rebuilt.
    for (const auto& f : list_json(processing)) {
        EvolutionRequest req;
        std::string perr;
        if (parse_request_file(slurp_file(f), f.parent_path(), &req, &perr)) {
            in_flight[req.id.empty() ? f.stem().string() : req.id] = f.filename().string();
        }
    }

    err = p.controller->start();
    if (!err.empty()) std::cerr << "[controller] " << err << "\n";
    for (const auto& kv : in_flight) {
        EvolutionRequest req;
        std::string perr;
        const auto f = processing / kv.second;
        if (parse_request_file(slurp_file(f), processing, &req, &perr)) {
            req.id = kv.first;
            p.controller->submit(req);
        }
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::signal(SIGPIPE, SIG_IGN);
    std::cerr << "[serve] queue=" << q.string() << " scan_ms=" << scan_ms << "\n";

    std::map<std::string, RequestState> published;
    while (!g_stop.load()) {
        for (const auto& f : list_json(inbox)) {
            EvolutionRequest req;
            std::string perr;
            if (!parse_request_file(slurp_file(f), inbox, &req, &perr)) {
                std::cerr << "[serve] " << f.filename().string() << ": " << perr << "\n";
                move_file(f, failed / f.filename());
                continue;
            }
            if (req.id.empty()) req.id = f.stem().string();
            if (!move_file(f, processing / f.filename())) continue;
            in_flight[req.id] = f.filename().string();
            p.controller->submit(req);
        }

        for (const auto& f : list_json(reviews)) {
            json_object* o = json_tokener_parse(slurp_file(f).c_str());
            std::string id, reviewer, note;
            bool approved = false;
            bool ok = o && json_get_string(o, "id", &id) && json_get_bool(o, "approved", &approved);
            if (o) {
                json_get_string(o, "reviewer", &reviewer);
                json_get_string(o, "note", &note);
                json_object_put(o);
            }
            if (ok) ok = p.controller->resolve_review(id, approved, reviewer, note);
            if (!ok) std::cerr << "[serve] review " << f.filename().string() << " refused\n";
            move_file(f, (ok ? done : failed) / f.filename());
        }

        for (auto it = in_flight.begin(); it != in_flight.end();) {
            EvolutionResult r;
            if (!p.controller->get_status(it->first, &r) ||
                !(is_terminal(r.state) || r.state == RequestState::PENDING_HUMAN_REVIEW ||
                  r.state == RequestState::NEEDS_REAUDIT)) {
                ++it;
                continue;
            }
            write_result(out / (it->first + ".json"), r);
            published[it->first] = r.state;
            move_file(processing / it->second, done / it->second);
            it = in_flight.erase(it);
        }

        // Requests that settled as pending review or needs re-audit get their
        // result file rewritten when they move on.
        if (p.controller->retry_pending_audits() > 0) {
            std::cerr << "[serve] re-audited held decisions\n";
        }
        for (auto it = published.begin(); it != published.end();) {
            EvolutionResult r;
            if (!p.controller->get_status(it->first, &r)) {
                it = published.erase(it);
                continue;
            }
            if (r.state != it->second) {
                write_result(out / (it->first + ".json"), r);
                it->second = r.state;
            }
            if (is_terminal(r.state)) {
                it = published.erase(it);
            } else {
                ++it;
            }
        }

        sleep_ms(scan_ms);
    }

    std::cerr << "[serve] stopping\n";
    p.controller->stop();
    return 0;
}
