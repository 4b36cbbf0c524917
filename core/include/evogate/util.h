#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace evogate {

// Random hex id with prefix, e.g. "sbx-3f9c0a...". EVOGATE_DETERMINISTIC_IDS=1
// switches to a fixed seed (ids are still unique within the process).
std::string gen_hex_id(const std::string& prefix);

// Exponential backoff: base * mult^(next_attempt-2), capped at max_ms, plus
// up to jitter_ms. next_attempt <= 2 yields base.
int64_t backoff_delay_ms(int next_attempt,
                         int64_t base_ms,
                         int64_t mult,
                         int64_t max_ms,
                         int64_t jitter_ms);

void sleep_ms(int64_t ms);

int getenv_int(const char* k, int defv);
bool getenv_bool(const char* k, bool defv);
std::string getenv_str(const char* k, const std::string& defv);

// Returns empty string if the file cannot be read.
std::string slurp_file(const std::filesystem::path& p);

// tmp file + rename. Returns empty string on success.
std::string write_atomic_file(const std::filesystem::path& dst, const std::string& body);

} // namespace evogate
