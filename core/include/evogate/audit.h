#pragma once

#include "types.h"
#include "wal.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace evogate {

// Human decision on a PENDING_HUMAN_REVIEW request.
struct ReviewResolution {
    std::string request_id;
    bool approved{false};
    std::string reviewer;
    std::string note;
    int64_t resolved_at_ms{0};
};

// One line of the audit file.
struct AuditEntry {
    uint64_t seq{0};
    std::string kind;           // "decision" | "review"
    std::string request_id;
    std::string record_json;    // canonical JSON of the record
    std::string chain_prev;
    std::string chain_hash;
};

struct AuditVerifyResult {
    bool ok{true};
    uint64_t entries{0};
    uint64_t first_bad_seq{0};  // 0 when ok
    std::string error;
};

// AuditStore: append-only, hash-chained JSONL trail keyed by request id.
//
// Line format (canonical, keys sorted):
//   {"chain_hash":..,"chain_prev":..,"kind":..,"record":{..},"request_id":..,"seq":N}
// chain_hash = SHA256(chain_prev || canonical(line without chain fields)).
// The first entry chains from 64 zeros. Sequence numbers start at 1.
//
// At most one "decision" entry per request id; review entries follow it.
class AuditStore {
public:
    static constexpr const char* kDuplicate = "duplicate";

    explicit AuditStore(std::filesystem::path path);

    AuditStore(const AuditStore&) = delete;
    AuditStore& operator=(const AuditStore&) = delete;

    void set_fsync(bool enable) { wal_.set_fsync(enable); }

    // Replays the existing file to rebuild the index, sequence and chain head.
    // A torn final line is cut off. Returns empty string on success.
    std::string open();

    // Returns empty string on success, kDuplicate when the id already has a
    // decision, or the write error. A failed write changes nothing.
    std::string append_decision(const AuditRecord& rec, uint64_t* seq_out = nullptr);
    std::string append_review(const ReviewResolution& r, uint64_t* seq_out = nullptr);

    bool has_decision(const std::string& request_id) const;
    bool get_decision(const std::string& request_id, AuditRecord* out) const;
    std::vector<AuditEntry> entries_for(const std::string& request_id) const;
    std::vector<AuditEntry> list() const;

    uint64_t next_seq() const;
    const std::filesystem::path& path() const { return path_; }

    static AuditVerifyResult verify_file(const std::filesystem::path& path);

private:
    std::string append_locked(const std::string& kind, const std::string& request_id,
                              const std::string& record_json, uint64_t* seq_out);

    std::filesystem::path path_;
    Wal wal_;
    mutable std::mutex mu_;
    std::vector<AuditEntry> entries_;
    std::map<std::string, size_t> decision_index_;    // request id -> entries_ index
    uint64_t next_seq_{1};
    std::string chain_head_;
};

// Parses one audit line; false if it is not a well-formed entry.
bool parse_audit_line(const std::string& line, AuditEntry* out);

ReviewResolution review_from_json_string(const std::string& record_json);

} // namespace evogate
