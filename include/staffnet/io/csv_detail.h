// io/csv_detail.h - Field-level CSV parsing primitives
// Part of the staff network library (C++20)
//
// Low-level parsing of integers, doubles and quoted CSV fields from
// string_view.  The numeric parsers are constexpr and report the
// position they stopped at; the table readers in table_io.h add line
// numbers to any error they rethrow.
//
// No table-specific knowledge lives here.

#ifndef STAFFNET_IO_CSV_DETAIL_H
#define STAFFNET_IO_CSV_DETAIL_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace staffnet::io {
namespace detail {

/// Skip spaces and tabs.
constexpr std::size_t skip_hspace(std::string_view sv, std::size_t pos) noexcept {
    while (pos < sv.size() && (sv[pos] == ' ' || sv[pos] == '\t'))
        ++pos;
    return pos;
}

/// Strip leading/trailing spaces, tabs and a trailing '\r'.
constexpr std::string_view trim(std::string_view sv) noexcept {
    std::size_t b = skip_hspace(sv, 0);
    std::size_t e = sv.size();
    while (e > b && (sv[e - 1] == ' ' || sv[e - 1] == '\t' || sv[e - 1] == '\r'))
        --e;
    return sv.substr(b, e - b);
}

constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

/// Parse unsigned integer.  Returns {value, new_pos}.
/// Throws if no digits found or the value does not fit in size_t.
constexpr std::pair<std::size_t, std::size_t>
parse_uint(std::string_view sv, std::size_t pos) {
    if (pos >= sv.size() || !is_digit(sv[pos])) {
        throw std::runtime_error("parse_uint: expected digit");
    }
    constexpr auto max = std::numeric_limits<std::size_t>::max();
    std::size_t val = 0;
    while (pos < sv.size() && is_digit(sv[pos])) {
        auto const d = static_cast<std::size_t>(sv[pos] - '0');
        if (val > (max - d) / 10) {
            throw std::runtime_error("parse_uint: value out of range");
        }
        val = val * 10 + d;
        ++pos;
    }
    return {val, pos};
}

/// Powers of ten that are exact in a double.
inline constexpr double exact_pow10[] = {
    1e0,  1e1,  1e2,  1e3,  1e4,  1e5,  1e6,  1e7,  1e8,  1e9,  1e10, 1e11,
    1e12, 1e13, 1e14, 1e15, 1e16, 1e17, 1e18, 1e19, 1e20, 1e21, 1e22};

/// mantissa * 10^exp10.  Exact operands give a correctly rounded result
/// (one multiply or divide); otherwise scaled in steps of 1e22.
constexpr double scale_decimal(std::uint64_t mantissa, int exp10) {
    auto value = static_cast<double>(mantissa);
    if (mantissa == 0) return 0.0;
    if (mantissa <= (std::uint64_t{1} << 53) && exp10 >= -22 && exp10 <= 22) {
        auto const p = exact_pow10[exp10 < 0 ? -exp10 : exp10];
        return exp10 < 0 ? value / p : value * p;
    }
    while (exp10 > 22) {
        value *= 1e22;
        exp10 -= 22;
    }
    while (exp10 < -22) {
        value /= 1e22;
        exp10 += 22;
    }
    auto const p = exact_pow10[exp10 < 0 ? -exp10 : exp10];
    return exp10 < 0 ? value / p : value * p;
}

/// Parse a double: optional sign, digits, optional '.digits', optional
/// exponent.  A leading '.' is accepted (".5").  Returns {value, new_pos}.
///
/// Digits are collected into an integer mantissa (first 19 significant
/// digits) plus a decimal exponent and scaled once, so short decimals
/// such as "0.3" read as the nearest double.  Throws if the magnitude
/// overflows a double.
constexpr std::pair<double, std::size_t>
parse_double(std::string_view sv, std::size_t pos) {
    if (pos >= sv.size()) {
        throw std::runtime_error("parse_double: unexpected end");
    }

    double sign = 1.0;
    if (sv[pos] == '-' || sv[pos] == '+') {
        if (sv[pos] == '-') sign = -1.0;
        ++pos;
    }

    constexpr int max_digits = 19;
    std::uint64_t mantissa = 0;
    int kept = 0;
    long long exp10 = 0;
    bool any_digit = false;

    while (pos < sv.size() && is_digit(sv[pos])) {
        auto const d = static_cast<std::uint64_t>(sv[pos] - '0');
        if (kept < max_digits) {
            mantissa = mantissa * 10 + d;
            if (mantissa != 0) ++kept;
        } else {
            ++exp10;
        }
        any_digit = true;
        ++pos;
    }

    if (pos < sv.size() && sv[pos] == '.') {
        ++pos;
        while (pos < sv.size() && is_digit(sv[pos])) {
            auto const d = static_cast<std::uint64_t>(sv[pos] - '0');
            if (kept < max_digits) {
                mantissa = mantissa * 10 + d;
                if (mantissa != 0) ++kept;
                --exp10;
            }
            any_digit = true;
            ++pos;
        }
    }

    if (!any_digit) {
        throw std::runtime_error("parse_double: expected digit");
    }

    if (pos < sv.size() && (sv[pos] == 'e' || sv[pos] == 'E')) {
        ++pos;
        bool neg_exp = false;
        if (pos < sv.size() && (sv[pos] == '-' || sv[pos] == '+')) {
            neg_exp = sv[pos] == '-';
            ++pos;
        }
        if (pos >= sv.size() || !is_digit(sv[pos])) {
            throw std::runtime_error("parse_double: expected exponent digit");
        }
        // Saturate: anything past 10^5 is out of range either way.
        long long e = 0;
        while (pos < sv.size() && is_digit(sv[pos])) {
            if (e < 100000) e = e * 10 + (sv[pos] - '0');
            ++pos;
        }
        exp10 += neg_exp ? -e : e;
    }

    if (mantissa == 0) return {sign * 0.0, pos};
    // kept significant digits place the value near 10^(kept - 1 + exp10).
    if (kept - 1 + exp10 > 308) {
        throw std::runtime_error("parse_double: value out of range");
    }
    if (kept - 1 + exp10 < -330) return {sign * 0.0, pos};

    auto const value = scale_decimal(mantissa, static_cast<int>(exp10));
    if (value > std::numeric_limits<double>::max()) {
        throw std::runtime_error("parse_double: value out of range");
    }
    return {sign * value, pos};
}

/// Whole-field signed integer.  Throws on trailing characters or overflow.
constexpr long long field_to_int(std::string_view field) {
    auto f = trim(field);
    bool neg = false;
    std::size_t pos = 0;
    if (!f.empty() && (f[0] == '-' || f[0] == '+')) {
        neg = f[0] == '-';
        pos = 1;
    }
    auto [v, next] = parse_uint(f, pos);
    if (next != f.size()) {
        throw std::runtime_error("field_to_int: trailing characters");
    }
    if (v > static_cast<std::size_t>(std::numeric_limits<long long>::max())) {
        throw std::runtime_error("field_to_int: value out of range");
    }
    return neg ? -static_cast<long long>(v) : static_cast<long long>(v);
}

/// Whole-field double.  Throws on trailing characters.
constexpr double field_to_double(std::string_view field) {
    auto f = trim(field);
    auto [v, next] = parse_double(f, 0);
    if (next != f.size()) {
        throw std::runtime_error("field_to_double: trailing characters");
    }
    return v;
}

/// Empty and "NA" fields denote a missing value.
constexpr bool is_missing(std::string_view field) noexcept {
    auto f = trim(field);
    return f.empty() || f == "NA" || f == "NaN";
}

/// Split one CSV record.  Fields may be double-quoted; "" inside quotes
/// is a literal quote.  Throws on an unterminated quote.
inline std::vector<std::string> split_record(std::string_view line) {
    std::vector<std::string> out;
    std::string field;
    bool quoted = false;
    std::size_t i = 0;

    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

    while (i < line.size()) {
        char const c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    i += 2;
                    continue;
                }
                quoted = false;
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            out.push_back(std::move(field));
            field.clear();
        } else {
            field += c;
        }
        ++i;
    }
    if (quoted) {
        throw std::runtime_error("split_record: unterminated quote");
    }
    out.push_back(std::move(field));
    return out;
}

/// Write a field, quoting when it holds a comma, quote or newline.
inline void write_field(std::ostream& os, std::string_view f) {
    if (f.find_first_of(",\"\n") == std::string_view::npos) {
        os << f;
        return;
    }
    os << '"';
    for (char c : f) {
        if (c == '"') os << '"';
        os << c;
    }
    os << '"';
}

} // namespace detail
} // namespace staffnet::io

#endif // STAFFNET_IO_CSV_DETAIL_H
