#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

// Strict parsers for configuration values. The whole string must be
// consumed; surrounding whitespace is not accepted.

// Optional sign followed by decimal digits, range of int64_t.
std::optional<int64_t> parse_int64(const std::string& s);

// Decimal or exponent notation, "inf"/"infinity"/"nan" in any case.
std::optional<double> parse_double(const std::string& s);

// 1 t T TRUE true True / 0 f F FALSE false False.
std::optional<bool> parse_bool(const std::string& s);

// printf "%.2f", at full length.
std::string format_fixed2(double v);

// At most max_chars UTF-8 characters of s, never splitting a sequence.
std::string truncate_utf8(const std::string& s, size_t max_chars);
