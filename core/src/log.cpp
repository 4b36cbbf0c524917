#include "evogate/log.h"
#include "evogate/hash.h"
#include "evogate/serialization.h"
#include "evogate/wal.h"

#include <json-c/json.h>

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace evogate {

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

JsonlEventLog::JsonlEventLog(const std::string& path)
    : path_(path), chain_prev_(std::string(64, '0')) {
    std::string err = resume();
    if (!err.empty()) {
        std::cerr << "[events] " << path_ << ": " << err << "\n";
        return;
    }
    out_.open(path_, std::ios::out | std::ios::app);
}

std::string JsonlEventLog::resume() {
    std::vector<std::string> lines;
    bool torn = false;
    uintmax_t good_bytes = 0;
    std::string err = Wal::read_lines(path_, &lines, &torn, &good_bytes);
    if (!err.empty()) return err;
    if (torn) {
        std::cerr << "[events] " << path_ << ": dropping torn final line\n";
        std::error_code ec;
        std::filesystem::resize_file(path_, good_bytes, ec);
        if (ec) return "truncate torn tail: " + ec.message();
    }
    if (lines.empty()) return "";

    json_object* last = json_tokener_parse(lines.back().c_str());
    if (!last) return "last line is not JSON, refusing to restart the chain";
    std::string chain_hash;
    int64_t step = 0;
    const bool linked = json_get_string(last, "chain_hash", &chain_hash) &&
                        json_get_int64(last, "step", &step) && chain_hash.size() == 64 && step > 0;
    json_object_put(last);
    if (!linked) return "last line has no chain_hash/step, refusing to restart the chain";
    chain_prev_ = chain_hash;
    step_ = (uint64_t)step;
    return "";
}

void JsonlEventLog::on_transition(const TransitionEvent& ev) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!ok()) return;

    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_object_new_string("transition"));
    json_object_object_add(rec, "request_id", json_object_new_string(ev.request_id.c_str()));
    json_object_object_add(rec, "from", json_object_new_string(state_to_str(ev.from)));
    json_object_object_add(rec, "to", json_object_new_string(state_to_str(ev.to)));
    json_object_object_add(rec, "at_ms", json_object_new_int64(ev.at_ms));
    if (!ev.detail.empty()) json_object_object_add(rec, "detail", json_object_new_string(ev.detail.c_str()));
    json_object_object_add(rec, "step", json_object_new_int64((int64_t)++step_));
    json_object_object_add(rec, "ts", json_object_new_string(iso_now().c_str()));

    // Tamper-evident hash chain: chain_hash = SHA256(chain_prev || record)
    std::string record = canonical_json(rec);
    std::string chain_hash = hash::sha256_hex_pair(chain_prev_, record);

    json_object_object_add(rec, "chain_prev", json_object_new_string(chain_prev_.c_str()));
    json_object_object_add(rec, "chain_hash", json_object_new_string(chain_hash.c_str()));
    out_ << canonical_json(rec) << "\n";
    out_.flush();
    json_object_put(rec);

    chain_prev_ = chain_hash;
}

} // namespace evogate
