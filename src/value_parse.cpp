#include "value_parse.hpp"
#include <cerrno>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

std::optional<int64_t> parse_int64(const std::string& s) {
    if (s.empty()) return std::nullopt;

    size_t i = 0;
    bool negative = false;
    if (s[0] == '+' || s[0] == '-') {
        negative = (s[0] == '-');
        i = 1;
    }
    if (i == s.size()) return std::nullopt;

    // Accumulate as a negative number so INT64_MIN fits.
    int64_t acc = 0;
    const int64_t limit = std::numeric_limits<int64_t>::min();
    for (; i < s.size(); ++i) {
        char c = s[i];
        if (c < '0' || c > '9') return std::nullopt;
        int digit = c - '0';
        if (acc < (limit + digit) / 10) return std::nullopt;
        acc = acc * 10 - digit;
    }
    if (!negative) {
        if (acc == limit) return std::nullopt;
        return -acc;
    }
    return acc;
}

std::optional<double> parse_double(const std::string& s) {
    if (s.empty()) return std::nullopt;
    if (std::isspace(static_cast<unsigned char>(s.front()))) return std::nullopt;

    // strtod also takes hex floats and ignores a trailing partial token; the
    // end pointer check rejects the latter.
    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(begin, &end);
    if (end == begin || static_cast<size_t>(end - begin) != s.size()) return std::nullopt;
    if (errno == ERANGE && (v == HUGE_VAL || v == -HUGE_VAL)) return std::nullopt;
    return v;
}

std::optional<bool> parse_bool(const std::string& s) {
    if (s == "1" || s == "t" || s == "T" || s == "TRUE" || s == "true" || s == "True") return true;
    if (s == "0" || s == "f" || s == "F" || s == "FALSE" || s == "false" || s == "False") return false;
    return std::nullopt;
}

std::string format_fixed2(double v) {
    int n = std::snprintf(nullptr, 0, "%.2f", v);
    if (n <= 0) return "";
    std::string out(static_cast<size_t>(n) + 1, '\0');
    std::snprintf(&out[0], out.size(), "%.2f", v);
    out.resize(static_cast<size_t>(n));
    return out;
}

std::string truncate_utf8(const std::string& s, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        // Continuation bytes belong to the character already counted.
        if ((static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) continue;
        if (chars == max_chars) return s.substr(0, i);
        ++chars;
    }
    return s;
}
