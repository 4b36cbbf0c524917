#include "evogate/util.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace evogate {

std::string gen_hex_id(const std::string& prefix) {
    static std::mutex mu;
    static std::mt19937_64 rng = []() {
        const char* det = std::getenv("EVOGATE_DETERMINISTIC_IDS");
        if (det && std::string(det) == "1") return std::mt19937_64{1234567ULL};
        uint64_t t = (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count();
        std::random_device rd;
        uint64_t r = ((uint64_t)rd() << 32) ^ (uint64_t)rd();
        return std::mt19937_64{t ^ r};
    }();

    uint64_t a = 0;
    uint64_t b = 0;
    {
        std::lock_guard<std::mutex> lk(mu);
        a = rng();
        b = rng();
    }
    std::ostringstream oss;
    oss << prefix << std::hex << a << b;
    return oss.str();
}

int64_t backoff_delay_ms(int next_attempt,
                         int64_t base_ms,
                         int64_t mult,
                         int64_t max_ms,
                         int64_t jitter_ms) {
    if (base_ms < 0) base_ms = 0;
    if (mult < 1) mult = 1;
    if (max_ms < 0) max_ms = 0;
    if (jitter_ms < 0) jitter_ms = 0;
    int exp = next_attempt - 2;
    if (exp < 0) exp = 0;
    long double d = (long double)base_ms;
    for (int i = 0; i < exp && (max_ms == 0 || d <= (long double)max_ms); i++) d *= (long double)mult;
    int64_t delay = (int64_t)d;
    if (delay > max_ms && max_ms > 0) delay = max_ms;
    if (jitter_ms > 0) {
        static std::atomic<uint64_t> counter{0};
        uint64_t seed = (uint64_t)std::chrono::steady_clock::now().time_since_epoch().count();
        seed += counter.fetch_add(0x9e3779b97f4a7c15ULL);
        seed ^= (seed << 13);
        seed ^= (seed >> 7);
        seed ^= (seed << 17);
        delay += (int64_t)(seed % (uint64_t)(jitter_ms + 1));
    }
    return delay;
}

void sleep_ms(int64_t ms) {
    if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

int getenv_int(const char* k, int defv) {
    if (const char* e = std::getenv(k)) {
        try {
            return std::stoi(e);
        } catch (const std::exception&) {
            return defv;
        }
    }
    return defv;
}

bool getenv_bool(const char* k, bool defv) {
    const char* v = std::getenv(k);
    if (!v || !*v) return defv;
    std::string s = v;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

std::string getenv_str(const char* k, const std::string& defv) {
    const char* v = std::getenv(k);
    if (!v || !*v) return defv;
    return v;
}

std::string slurp_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) return {};
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::string write_atomic_file(const std::filesystem::path& dst, const std::string& body) {
    std::error_code ec;
    if (dst.has_parent_path()) std::filesystem::create_directories(dst.parent_path(), ec);
    auto tmp = dst;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) return "cannot write " + tmp.string();
        f << body;
        if (!f) return "short write " + tmp.string();
    }
    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return "rename failed: " + dst.string();
    }
    return "";
}

} // namespace evogate
