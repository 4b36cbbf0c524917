#include "evogate/audit.h"

#include "evogate/hash.h"
#include "evogate/serialization.h"

#include <json-c/json.h>

#include <iostream>

namespace evogate {

namespace {

const std::string kGenesis(64, '0');

// Canonical line without chain fields; the hashed part.
std::string body_json(uint64_t seq, const std::string& kind, const std::string& request_id,
                      const std::string& record_json) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "seq", json_object_new_int64((int64_t)seq));
    json_object_object_add(o, "kind", json_object_new_string(kind.c_str()));
    json_object_object_add(o, "request_id", json_object_new_string(request_id.c_str()));
    json_object* rec = json_tokener_parse(record_json.c_str());
    json_object_object_add(o, "record", rec ? rec : json_object_new_object());
    std::string out = canonical_json(o);
    json_object_put(o);
    return out;
}

std::string review_to_json_string(const ReviewResolution& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "request_id", json_object_new_string(r.request_id.c_str()));
    json_object_object_add(o, "approved", json_object_new_boolean(r.approved ? 1 : 0));
    json_object_object_add(o, "reviewer", json_object_new_string(r.reviewer.c_str()));
    json_object_object_add(o, "note", json_object_new_string(r.note.c_str()));
    json_object_object_add(o, "resolved_at_ms", json_object_new_int64(r.resolved_at_ms));
    json_object_object_add(o, "final_state",
                           json_object_new_string(state_to_str(r.approved ? RequestState::APPROVED
                                                                          : RequestState::REJECTED)));
    std::string out = canonical_json(o);
    json_object_put(o);
    return out;
}

} // namespace

bool parse_audit_line(const std::string& line, AuditEntry* out) {
    if (!out) return false;
    json_object* o = json_tokener_parse(line.c_str());
    if (!o) return false;
    bool ok = json_object_is_type(o, json_type_object);
    AuditEntry e;
    int64_t seq = 0;
    ok = ok && json_get_int64(o, "seq", &seq) && seq > 0;
    ok = ok && json_get_string(o, "kind", &e.kind);
    ok = ok && json_get_string(o, "request_id", &e.request_id);
    ok = ok && json_get_string(o, "chain_prev", &e.chain_prev);
    ok = ok && json_get_string(o, "chain_hash", &e.chain_hash);
    json_object* rec = nullptr;
    ok = ok && json_object_object_get_ex(o, "record", &rec) && rec && json_object_is_type(rec, json_type_object);
    if (ok) {
        e.seq = (uint64_t)seq;
        e.record_json = canonical_json(rec);
        *out = std::move(e);
    }
    json_object_put(o);
    return ok;
}

ReviewResolution review_from_json_string(const std::string& record_json) {
    ReviewResolution r;
    json_object* o = json_tokener_parse(record_json.c_str());
    if (!o) return r;
    json_get_string(o, "request_id", &r.request_id);
    json_get_bool(o, "approved", &r.approved);
    json_get_string(o, "reviewer", &r.reviewer);
    json_get_string(o, "note", &r.note);
    json_get_int64(o, "resolved_at_ms", &r.resolved_at_ms);
    json_object_put(o);
    return r;
}

AuditStore::AuditStore(std::filesystem::path path)
    : path_(std::move(path)), wal_(path_), chain_head_(kGenesis) {}

std::string AuditStore::open() {
    std::lock_guard<std::mutex> lk(mu_);
    entries_.clear();
    decision_index_.clear();
    next_seq_ = 1;
    chain_head_ = kGenesis;

    std::vector<std::string> lines;
    bool torn = false;
    uintmax_t good_bytes = 0;
    std::string err = Wal::read_lines(path_, &lines, &torn, &good_bytes);
    if (!err.empty()) return err;

    for (size_t i = 0; i < lines.size(); i++) {
        AuditEntry e;
        if (!parse_audit_line(lines[i], &e)) {
            return "audit line " + std::to_string(i + 1) + " is malformed";
        }
        if (e.kind == "decision") decision_index_[e.request_id] = entries_.size();
        next_seq_ = e.seq + 1;
        chain_head_ = e.chain_hash;
        entries_.push_back(std::move(e));
    }

    if (torn) {
        std::cerr << "[audit] " << path_.string() << ": dropping torn final line\n";
        std::error_code ec;
        std::filesystem::resize_file(path_, good_bytes, ec);
        if (ec) return "truncate torn tail: " + ec.message();
    }
    return wal_.open();
}

std::string AuditStore::append_locked(const std::string& kind, const std::string& request_id,
                                      const std::string& record_json, uint64_t* seq_out) {
    const uint64_t seq = next_seq_;
    const std::string body = body_json(seq, kind, request_id, record_json);
    const std::string chain_hash = hash::sha256_hex_pair(chain_head_, body);

    json_object* line = json_tokener_parse(body.c_str());
    if (!line) return "internal: audit body does not parse";
    json_object_object_add(line, "chain_prev", json_object_new_string(chain_head_.c_str()));
    json_object_object_add(line, "chain_hash", json_object_new_string(chain_hash.c_str()));
    std::string text = canonical_json(line);
    json_object_put(line);

    std::string err = wal_.append_json_line(text);
    if (!err.empty()) return err;

    AuditEntry e;
    e.seq = seq;
    e.kind = kind;
    e.request_id = request_id;
    e.record_json = canonicalize_json(record_json);
    e.chain_prev = chain_head_;
    e.chain_hash = chain_hash;
    if (kind == "decision") decision_index_[request_id] = entries_.size();
    entries_.push_back(std::move(e));
    next_seq_ = seq + 1;
    chain_head_ = chain_hash;
    if (seq_out) *seq_out = seq;
    return "";
}

std::string AuditStore::append_decision(const AuditRecord& rec, uint64_t* seq_out) {
    json_object* o = audit_record_to_json(rec);
    std::string record_json = canonical_json(o);
    json_object_put(o);

    std::lock_guard<std::mutex> lk(mu_);
    if (decision_index_.count(rec.request.id)) return kDuplicate;
    return append_locked("decision", rec.request.id, record_json, seq_out);
}

std::string AuditStore::append_review(const ReviewResolution& r, uint64_t* seq_out) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!decision_index_.count(r.request_id)) return "no decision recorded for " + r.request_id;
    return append_locked("review", r.request_id, review_to_json_string(r), seq_out);
}

bool AuditStore::has_decision(const std::string& request_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return decision_index_.count(request_id) > 0;
}

bool AuditStore::get_decision(const std::string& request_id, AuditRecord* out) const {
    std::string record_json;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = decision_index_.find(request_id);
        if (it == decision_index_.end()) return false;
        record_json = entries_[it->second].record_json;
    }
    json_object* o = json_tokener_parse(record_json.c_str());
    if (!o) return false;
    bool ok = audit_record_from_json(o, out);
    json_object_put(o);
    return ok;
}

std::vector<AuditEntry> AuditStore::entries_for(const std::string& request_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<AuditEntry> out;
    for (const auto& e : entries_) {
        if (e.request_id == request_id) out.push_back(e);
    }
    return out;
}

std::vector<AuditEntry> AuditStore::list() const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_;
}

uint64_t AuditStore::next_seq() const {
    std::lock_guard<std::mutex> lk(mu_);
    return next_seq_;
}

AuditVerifyResult AuditStore::verify_file(const std::filesystem::path& path) {
    AuditVerifyResult res;
    std::vector<std::string> lines;
    bool torn = false;
    std::string err = Wal::read_lines(path, &lines, &torn);
    if (!err.empty()) {
        res.ok = false;
        res.error = err;
        return res;
    }

    std::string prev = kGenesis;
    uint64_t expect_seq = 1;
    auto fail = [&](uint64_t seq, const std::string& why) {
        res.ok = false;
        res.first_bad_seq = seq;
        res.error = why;
        return res;
    };

    for (size_t i = 0; i < lines.size(); i++) {
        json_object* o = json_tokener_parse(lines[i].c_str());
        if (!o || !json_object_is_type(o, json_type_object)) {
            if (o) json_object_put(o);
            return fail(expect_seq, "line " + std::to_string(i + 1) + " is not a JSON object");
        }
        int64_t seq = 0;
        std::string chain_prev;
        std::string chain_hash;
        bool shape = json_get_int64(o, "seq", &seq) && json_get_string(o, "chain_prev", &chain_prev) &&
                     json_get_string(o, "chain_hash", &chain_hash);
        if (!shape) {
            json_object_put(o);
            return fail(expect_seq, "line " + std::to_string(i + 1) + " lacks seq/chain fields");
        }
        json_object_object_del(o, "chain_prev");
        json_object_object_del(o, "chain_hash");
        const std::string body = canonical_json(o);
        json_object_put(o);

        if ((uint64_t)seq != expect_seq) {
            return fail((uint64_t)seq, "sequence gap: expected " + std::to_string(expect_seq));
        }
        if (chain_prev != prev) return fail((uint64_t)seq, "chain_prev does not match previous entry");
        if (hash::sha256_hex_pair(prev, body) != chain_hash) return fail((uint64_t)seq, "chain_hash mismatch");

        prev = chain_hash;
        expect_seq++;
        res.entries++;
    }
    if (torn) return fail(expect_seq, "torn final line");
    return res;
}

} // namespace evogate
