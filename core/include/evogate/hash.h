#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace evogate::hash {

// ---------- SHA-256 ----------
// Purpose: tamper-evident audit/event chains and source digests.
// Streaming form so large records are hashed without concatenating copies.

class Sha256 {
public:
    Sha256();

    void update(const uint8_t* data, size_t n);
    void update(const std::string& s) {
        update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    // Finalizes; the object must not be updated afterwards.
    std::array<uint8_t, 32> digest();
    std::string hex_digest();

private:
    uint32_t h_[8];
    uint8_t buf_[64];
    size_t buf_len_{0};
    uint64_t total_len_{0};
    bool finalized_{false};
};

std::string sha256_hex(const std::string& s);

// sha256(a || b) without building the concatenation
std::string sha256_hex_pair(const std::string& a, const std::string& b);

std::string to_hex(const uint8_t* data, size_t n);

} // namespace evogate::hash
