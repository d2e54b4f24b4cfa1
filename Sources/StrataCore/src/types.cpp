#include "strata/types.hpp"
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace strata {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2;
}

int days_in_month(int year, int month) {
    static const int lengths[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && (year % 4 == 0 && (year % 100 != 0 || year % 400 == 0))) return 29;
    return lengths[month - 1];
}

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

// Reads exactly n digits at pos.
bool read_fixed(std::string_view s, size_t& pos, size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < n; ++i) {
        char c = s[pos + i];
        if (!is_digit(c)) return false;
        v = v * 10 + (c - '0');
    }
    pos += n;
    out = v;
    return true;
}

} // namespace

// ============================================================================
// uuid_t
// ============================================================================

std::optional<uuid_t> uuid_t::parse(std::string_view s) {
    std::string hex;
    hex.reserve(32);
    if (s.size() == 36) {
        for (size_t i = 0; i < s.size(); ++i) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (s[i] != '-') return std::nullopt;
            } else {
                hex += s[i];
            }
        }
    } else if (s.size() == 32) {
        hex.assign(s);
    } else {
        return std::nullopt;
    }

    uuid_t result;
    for (size_t i = 0; i < 16; ++i) {
        int hi = hex_value(hex[i * 2]);
        int lo = hex_value(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        result.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return result;
}

// ============================================================================
// big_integer / big_decimal
// ============================================================================

std::optional<big_integer> big_integer::parse(std::string_view s) {
    size_t pos = 0;
    bool negative = false;
    if (!s.empty() && (s[0] == '-' || s[0] == '+')) {
        negative = s[0] == '-';
        pos = 1;
    }
    if (pos == s.size()) return std::nullopt;
    for (size_t i = pos; i < s.size(); ++i) {
        if (!is_digit(s[i])) return std::nullopt;
    }
    while (pos + 1 < s.size() && s[pos] == '0') ++pos;

    big_integer result;
    result.digits_ = std::string(s.substr(pos));
    if (negative && result.digits_ != "0") {
        result.digits_.insert(result.digits_.begin(), '-');
    }
    return result;
}

std::optional<int64_t> big_integer::to_int64() const {
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(digits_.data(), digits_.data() + digits_.size(), v);
    if (ec != std::errc() || ptr != digits_.data() + digits_.size()) return std::nullopt;
    return v;
}

big_decimal::big_decimal(double v) {
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    text_ = ec == std::errc() ? std::string(buf, ptr) : std::to_string(v);
}

std::optional<big_decimal> big_decimal::parse(std::string_view s) {
    size_t pos = 0;
    if (!s.empty() && (s[0] == '-' || s[0] == '+')) pos = 1;

    size_t int_digits = 0;
    while (pos < s.size() && is_digit(s[pos])) { ++pos; ++int_digits; }

    size_t frac_digits = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        while (pos < s.size() && is_digit(s[pos])) { ++pos; ++frac_digits; }
    }
    if (int_digits + frac_digits == 0) return std::nullopt;

    if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
        ++pos;
        if (pos < s.size() && (s[pos] == '-' || s[pos] == '+')) ++pos;
        size_t exp_digits = 0;
        while (pos < s.size() && is_digit(s[pos])) { ++pos; ++exp_digits; }
        if (exp_digits == 0) return std::nullopt;
    }
    if (pos != s.size()) return std::nullopt;

    big_decimal result;
    result.text_ = std::string(s[0] == '+' ? s.substr(1) : s);
    return result;
}

double big_decimal::to_double() const {
    return std::strtod(text_.c_str(), nullptr);
}

// ============================================================================
// date_time
// ============================================================================

std::string date_time::to_string() const {
    const int64_t local_ms = epoch_millis + static_cast<int64_t>(offset_minutes) * 60000;
    const int64_t days = floor_div(local_ms, 86400000);
    int64_t ms_of_day = local_ms - days * 86400000;

    int64_t y;
    unsigned m, d;
    civil_from_days(days, y, m, d);

    const int64_t hour = ms_of_day / 3600000;
    ms_of_day %= 3600000;
    const int64_t minute = ms_of_day / 60000;
    ms_of_day %= 60000;
    const int64_t second = ms_of_day / 1000;
    const int64_t millis = ms_of_day % 1000;

    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << y << '-'
       << std::setw(2) << m << '-' << std::setw(2) << d << 'T'
       << std::setw(2) << hour << ':' << std::setw(2) << minute << ':' << std::setw(2) << second;
    if (millis != 0) {
        ss << '.' << std::setw(3) << millis;
    }
    if (offset_minutes == 0) {
        ss << 'Z';
    } else {
        int32_t off = offset_minutes < 0 ? -offset_minutes : offset_minutes;
        ss << (offset_minutes < 0 ? '-' : '+')
           << std::setw(2) << off / 60 << ':' << std::setw(2) << off % 60;
    }
    return ss.str();
}

std::optional<date_time> date_time::parse(std::string_view s, int32_t default_offset_minutes) {
    size_t pos = 0;
    int year, month, day;
    if (!read_fixed(s, pos, 4, year)) return std::nullopt;
    if (pos >= s.size() || s[pos++] != '-') return std::nullopt;
    if (!read_fixed(s, pos, 2, month)) return std::nullopt;
    if (pos >= s.size() || s[pos++] != '-') return std::nullopt;
    if (!read_fixed(s, pos, 2, day)) return std::nullopt;
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) return std::nullopt;

    int hour = 0, minute = 0, second = 0, millis = 0;
    if (pos < s.size() && (s[pos] == 'T' || s[pos] == ' ')) {
        ++pos;
        if (!read_fixed(s, pos, 2, hour)) return std::nullopt;
        if (pos >= s.size() || s[pos++] != ':') return std::nullopt;
        if (!read_fixed(s, pos, 2, minute)) return std::nullopt;
        if (pos < s.size() && s[pos] == ':') {
            ++pos;
            if (!read_fixed(s, pos, 2, second)) return std::nullopt;
            if (pos < s.size() && s[pos] == '.') {
                ++pos;
                size_t digits = 0;
                while (pos < s.size() && is_digit(s[pos])) {
                    if (digits < 3) millis = millis * 10 + (s[pos] - '0');
                    ++digits;
                    ++pos;
                }
                if (digits == 0) return std::nullopt;
                for (size_t i = digits; i < 3; ++i) millis *= 10;
            }
        }
        if (hour > 23 || minute > 59 || second > 60) return std::nullopt;
    }

    int32_t offset = default_offset_minutes;
    if (pos < s.size()) {
        if (s[pos] == 'Z' || s[pos] == 'z') {
            offset = 0;
            ++pos;
        } else if (s[pos] == '+' || s[pos] == '-') {
            const int sign = s[pos] == '-' ? -1 : 1;
            ++pos;
            int oh = 0, om = 0;
            if (!read_fixed(s, pos, 2, oh)) return std::nullopt;
            if (pos < s.size() && s[pos] == ':') ++pos;
            if (pos < s.size() && !read_fixed(s, pos, 2, om)) return std::nullopt;
            if (oh > 18 || om > 59) return std::nullopt;
            offset = sign * (oh * 60 + om);
        }
        // A bracketed zone id such as "[Europe/Paris]" may follow the offset.
        if (pos < s.size() && s[pos] == '[' && s.back() == ']') pos = s.size();
    }
    if (pos != s.size()) return std::nullopt;

    const int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const int64_t local_ms = days * 86400000 + hour * 3600000LL + minute * 60000LL + second * 1000LL + millis;
    return date_time(local_ms - static_cast<int64_t>(offset) * 60000, offset);
}

date_time date_time::now(int32_t offset_minutes) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return date_time(static_cast<int64_t>(millis), offset_minutes);
}

// ============================================================================
// uri_t
// ============================================================================

std::optional<uri_t> uri_t::parse(std::string_view s) {
    if (s.empty()) return std::nullopt;
    for (char c : s) {
        auto uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc == 0x7F || c == '"' || c == '<' || c == '>' || c == '\\' ||
            c == '^' || c == '`' || c == '{' || c == '|' || c == '}') {
            return std::nullopt;
        }
    }

    auto colon = s.find(':');
    auto delim = s.find_first_of("/?#");
    if (colon != std::string_view::npos && (delim == std::string_view::npos || colon < delim)) {
        if (colon == 0) return std::nullopt;
        auto first = s[0];
        if (!((first >= 'a' && first <= 'z') || (first >= 'A' && first <= 'Z'))) return std::nullopt;
        for (size_t i = 1; i < colon; ++i) {
            char c = s[i];
            bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || is_digit(c) ||
                      c == '+' || c == '-' || c == '.';
            if (!ok) return std::nullopt;
        }
    }
    return uri_t{std::string(s)};
}

std::string to_hex(const blob_t& bytes) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

std::optional<blob_t> blob_from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) return std::nullopt;
    blob_t out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

// ============================================================================
// property_value
// ============================================================================

const char* property_value::kind_name() const {
    switch (storage_.index()) {
        case 0: return "null";
        case 1: return "integer";
        case 2: return "float";
        case 3: return "boolean";
        case 4: return "string";
        case 5: return "big_integer";
        case 6: return "big_decimal";
        case 7: return "date_time";
        case 8: return "uri";
        case 9: return "uuid";
        case 10: return "blob";
        case 11: return "list";
    }
    return "unknown";
}

std::string property_value::to_string() const {
    return std::visit([](auto&& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "null";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
            return ec == std::errc() ? std::string(buf, ptr) : std::to_string(v);
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, big_integer> || std::is_same_v<T, big_decimal> ||
                             std::is_same_v<T, date_time> || std::is_same_v<T, uuid_t>) {
            return v.to_string();
        } else if constexpr (std::is_same_v<T, uri_t>) {
            return v.value;
        } else if constexpr (std::is_same_v<T, blob_t>) {
            return to_hex(v);
        } else {
            std::string out = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) out += ", ";
                out += v[i].to_string();
            }
            return out + "]";
        }
    }, storage_);
}

} // namespace strata
