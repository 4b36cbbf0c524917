#include "test_common.h"

#include "evogate/hash.h"
#include "evogate/log.h"
#include "evogate/serialization.h"
#include "evogate/util.h"
#include "evogate/wal.h"

#include <json-c/json.h>

#include <fstream>

using namespace evogate;

namespace {

TransitionEvent event(const std::string& id, RequestState from, RequestState to) {
    return TransitionEvent{id, from, to, now_ms(), ""};
}

// Re-derives every chain_hash and checks the links and step numbers.
void expect_chain(const std::vector<std::string>& lines, const std::string& what) {
    std::string prev(64, '0');
    for (size_t i = 0; i < lines.size(); i++) {
        json_object* o = json_tokener_parse(lines[i].c_str());
        expect_true(o != nullptr, what + ": line parses");
        std::string chain_prev, chain_hash;
        int64_t step = 0;
        expect_true(json_get_string(o, "chain_prev", &chain_prev), what + ": chain_prev present");
        expect_true(json_get_string(o, "chain_hash", &chain_hash), what + ": chain_hash present");
        expect_true(json_get_int64(o, "step", &step), what + ": step present");
        json_object_object_del(o, "chain_prev");
        json_object_object_del(o, "chain_hash");
        const std::string body = canonical_json(o);
        json_object_put(o);

        const std::string at = what + " line " + std::to_string(i + 1);
        expect_eq_str(chain_prev, prev, at + " links to the previous line");
        expect_eq_str(chain_hash, hash::sha256_hex_pair(prev, body), at + " hash recomputes");
        expect_eq_ll(step, (long long)i + 1, at + " step");
        prev = chain_hash;
    }
}

} // namespace

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fresh_test_dir("event_log");
    const std::string path = (dir / "events.jsonl").string();

    {
        JsonlEventLog log(path);
        expect_true(log.ok(), "fresh log opens");
        log.on_transition(event("evo-1", RequestState::SUBMITTED, RequestState::SUBMITTED));
        log.on_transition(event("evo-1", RequestState::SUBMITTED, RequestState::STATIC_ANALYZING));
        expect_eq_ll((long long)log.steps(), 2, "two steps written");
    }

    // A crash mid-write leaves a partial line behind.
    {
        std::ofstream f(path, std::ios::app | std::ios::binary);
        f << "{\"event\":\"trans";
    }

    {
        JsonlEventLog log(path);
        expect_true(log.ok(), "reopened log is writable");
        expect_eq_ll((long long)log.steps(), 2, "step counter restored");
        log.on_transition(event("evo-1", RequestState::STATIC_ANALYZING, RequestState::SANDBOX_TESTING));
    }

    std::vector<std::string> lines;
    bool torn = true;
    expect_eq_str(Wal::read_lines(path, &lines, &torn), "", "read back");
    expect_true(!torn, "torn tail was cut before appending");
    expect_eq_ll((long long)lines.size(), 3, "three events across two sessions");
    expect_chain(lines, "resumed log");

    // Without a parsable last line the chain cannot continue; nothing is written.
    {
        const std::string broken = (dir / "broken.jsonl").string();
        {
            std::ofstream f(broken, std::ios::binary);
            f << "not json\n";
        }
        JsonlEventLog log(broken);
        expect_true(!log.ok(), "unparsable log refused");
        log.on_transition(event("evo-2", RequestState::SUBMITTED, RequestState::SUBMITTED));
        expect_eq_str(slurp_file(broken), "not json\n", "broken log untouched");
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
    std::cerr << "test_event_log: ALL PASSED" << std::endl;
    return 0;
}
