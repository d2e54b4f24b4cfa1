#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <functional>
#include <variant>
#include <array>
#include <random>
#include <sstream>
#include <iomanip>

namespace strata {

// UUID type (stored as TEXT, lowercase hyphenated)
struct uuid_t {
    std::array<uint8_t, 16> bytes{};

    uuid_t() = default;

    explicit uuid_t(const std::array<uint8_t, 16>& b) : bytes(b) {}

    uuid_t(uint64_t msb, uint64_t lsb) {
        for (int i = 0; i < 8; ++i) {
            bytes[i] = static_cast<uint8_t>((msb >> (56 - i * 8)) & 0xFF);
            bytes[8 + i] = static_cast<uint8_t>((lsb >> (56 - i * 8)) & 0xFF);
        }
    }

    // Convert to lowercase hyphenated string (e.g., "550e8400-e29b-41d4-a716-446655440000")
    std::string to_string() const {
        std::stringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    /// Accepts the 36-character hyphenated form or 32 bare hex digits.
    static std::optional<uuid_t> parse(std::string_view s);

    // Generate a random UUID (v4)
    static uuid_t generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dis;

        uuid_t result(dis(gen), dis(gen));

        // Set version (4) and variant (RFC 4122)
        result.bytes[6] = (result.bytes[6] & 0x0F) | 0x40;
        result.bytes[8] = (result.bytes[8] & 0x3F) | 0x80;

        return result;
    }

    uint64_t most_significant_bits() const {
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) v = (v << 8) | bytes[i];
        return v;
    }

    uint64_t least_significant_bits() const {
        uint64_t v = 0;
        for (int i = 8; i < 16; ++i) v = (v << 8) | bytes[i];
        return v;
    }

    bool operator==(const uuid_t& other) const { return bytes == other.bytes; }
    bool operator!=(const uuid_t& other) const { return bytes != other.bytes; }
    bool operator<(const uuid_t& other) const { return bytes < other.bytes; }

    // Check if UUID is nil (all zeros)
    bool is_nil() const {
        for (auto b : bytes) if (b != 0) return false;
        return true;
    }
};

using blob_t = std::vector<uint8_t>;

/// Lowercase hex, two digits per byte.
std::string to_hex(const blob_t& bytes);

/// Inverse of to_hex; either case is accepted. Odd lengths are rejected.
std::optional<blob_t> blob_from_hex(std::string_view hex);

/// Arbitrary-precision integer held as its canonical decimal digits
/// (optional leading '-', no leading zeros, "0" for zero).
class big_integer {
public:
    big_integer() : digits_("0") {}
    explicit big_integer(int64_t v) : digits_(std::to_string(v)) {}

    static std::optional<big_integer> parse(std::string_view s);

    const std::string& to_string() const { return digits_; }
    std::optional<int64_t> to_int64() const;
    bool is_negative() const { return !digits_.empty() && digits_[0] == '-'; }

    bool operator==(const big_integer& other) const { return digits_ == other.digits_; }
    bool operator!=(const big_integer& other) const { return digits_ != other.digits_; }

private:
    std::string digits_;
};

/// Arbitrary-precision decimal held as validated decimal text. Scale is
/// significant: "1.0" and "1.00" are different values.
class big_decimal {
public:
    big_decimal() : text_("0") {}
    explicit big_decimal(const big_integer& v) : text_(v.to_string()) {}
    explicit big_decimal(double v);

    /// Accepts [+-]digits[.digits][(e|E)[+-]digits]; a leading '+' is dropped.
    static std::optional<big_decimal> parse(std::string_view s);

    const std::string& to_string() const { return text_; }
    double to_double() const;

    bool operator==(const big_decimal& other) const { return text_ == other.text_; }
    bool operator!=(const big_decimal& other) const { return text_ != other.text_; }

private:
    std::string text_;
};

/// Instant plus the UTC offset it was expressed in.
struct date_time {
    int64_t epoch_millis = 0;
    int32_t offset_minutes = 0;

    date_time() = default;
    date_time(int64_t millis, int32_t offset) : epoch_millis(millis), offset_minutes(offset) {}

    /// ISO-8601, e.g. "2024-03-01T12:30:00.250+02:00"; a zero offset prints "Z".
    std::string to_string() const;

    /// Parses "YYYY-MM-DD", "YYYY-MM-DDTHH:MM[:SS[.fff]]" with an optional "Z"
    /// or "+HH:MM" suffix. A missing offset takes default_offset_minutes.
    static std::optional<date_time> parse(std::string_view s, int32_t default_offset_minutes = 0);

    static date_time now(int32_t offset_minutes = 0);

    bool operator==(const date_time& other) const {
        return epoch_millis == other.epoch_millis && offset_minutes == other.offset_minutes;
    }
    bool operator!=(const date_time& other) const { return !(*this == other); }
};

struct uri_t {
    std::string value;

    /// RFC 3986 shape check: no whitespace or control characters and, when a
    /// scheme is present, a well-formed scheme.
    static std::optional<uri_t> parse(std::string_view s);

    bool operator==(const uri_t& other) const { return value == other.value; }
    bool operator!=(const uri_t& other) const { return value != other.value; }
};

// ============================================================================
// property_value: every in-memory property value, scalar or list
// ============================================================================

class property_value {
public:
    using list_t = std::vector<property_value>;
    using storage_t = std::variant<
        std::nullptr_t,
        int64_t,
        double,
        bool,
        std::string,
        big_integer,
        big_decimal,
        date_time,
        uri_t,
        uuid_t,
        blob_t,
        list_t
    >;

    property_value() : storage_(nullptr) {}
    property_value(std::nullptr_t) : storage_(nullptr) {}
    property_value(int64_t v) : storage_(v) {}
    property_value(int v) : storage_(static_cast<int64_t>(v)) {}
    property_value(double v) : storage_(v) {}
    property_value(bool v) : storage_(v) {}
    property_value(std::string v) : storage_(std::move(v)) {}
    property_value(const char* v) : storage_(std::string(v)) {}
    property_value(big_integer v) : storage_(std::move(v)) {}
    property_value(big_decimal v) : storage_(std::move(v)) {}
    property_value(date_time v) : storage_(v) {}
    property_value(uri_t v) : storage_(std::move(v)) {}
    property_value(uuid_t v) : storage_(v) {}
    property_value(blob_t v) : storage_(std::move(v)) {}
    property_value(list_t v) : storage_(std::move(v)) {}

    static property_value make_list(list_t items = {}) { return property_value(std::move(items)); }

    bool is_null() const { return std::holds_alternative<std::nullptr_t>(storage_); }
    bool is_list() const { return std::holds_alternative<list_t>(storage_); }

    template<typename T>
    bool is() const { return std::holds_alternative<T>(storage_); }

    template<typename T>
    const T& as() const { return std::get<T>(storage_); }

    const list_t& items() const { return std::get<list_t>(storage_); }

    const storage_t& storage() const { return storage_; }

    /// Short name of the held kind, used in error messages.
    const char* kind_name() const;

    /// Canonical text form. Lists render as "[a, b]", null as "null".
    std::string to_string() const;

    bool operator==(const property_value& other) const { return storage_ == other.storage_; }
    bool operator!=(const property_value& other) const { return !(storage_ == other.storage_); }

private:
    storage_t storage_;
};

// ============================================================================
// SQLite column values
// ============================================================================

using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

enum class column_type {
    integer,
    real,
    text,
    blob
};

} // namespace strata

template<>
struct std::hash<strata::uuid_t> {
    size_t operator()(const strata::uuid_t& id) const noexcept {
        return std::hash<uint64_t>()(id.most_significant_bits() ^ (id.least_significant_bits() * 31));
    }
};

#endif // __cplusplus
