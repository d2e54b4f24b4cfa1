#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <cstdint>
#include <cstring>
#include <string_view>

namespace strata {

/// 64-bit FNV-1a accumulator used for structural schema hashes. Byte order of
/// every multi-byte input is fixed so hashes agree across platforms.
class hasher {
public:
    static constexpr uint64_t offset_basis = 0xcbf29ce484222325ULL;
    static constexpr uint64_t prime = 0x100000001b3ULL;

    hasher() = default;
    explicit hasher(uint64_t seed) : state_(seed) {}

    hasher& update_byte(uint8_t b) {
        state_ ^= b;
        state_ *= prime;
        return *this;
    }

    hasher& update(std::string_view s) {
        for (char c : s) update_byte(static_cast<uint8_t>(c));
        return *this;
    }

    hasher& update(const char* s) { return update(std::string_view(s)); }
    hasher& update(const std::string& s) { return update(std::string_view(s)); }

    // Least-significant byte first.
    hasher& update(int64_t v) { return update_u64(static_cast<uint64_t>(v)); }
    hasher& update(uint64_t v) { return update_u64(v); }

    hasher& update(bool v) { return update_byte(v ? 1 : 0); }

    hasher& update(double v) {
        uint64_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        return update_u64(bits);
    }

    hasher& update(const uuid_t& id) {
        update_u64(id.most_significant_bits());
        return update_u64(id.least_significant_bits());
    }

    hasher& update_null() { return update_byte(0xFF); }

    /// Null as update_null, anything else through its canonical text.
    hasher& update(const property_value& v) {
        if (v.is_null()) return update_null();
        return update(v.to_string());
    }

    uint64_t value() const { return state_; }

private:
    hasher& update_u64(uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            update_byte(static_cast<uint8_t>(v & 0xFF));
            v >>= 8;
        }
        return *this;
    }

    uint64_t state_ = offset_basis;
};

} // namespace strata

#endif // __cplusplus
