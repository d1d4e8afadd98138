#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include "arg_parser.hpp"

// All parsers report failure through @p ok and return a zero value. The
// ArgParser overloads also fail when the flag is absent or has no value.

// Decimal integer with optional sign, no trailing characters, inclusive bounds.
int parse_int(const std::string& value, int min, int max, bool& ok);
int parse_int(const ArgParser& parser, const std::string& flag, int min, int max, bool& ok);

// Decimal digits only, inclusive bounds.
std::size_t parse_size_t(const std::string& value, std::size_t min, std::size_t max, bool& ok);
std::size_t parse_size_t(const ArgParser& parser, const std::string& flag, std::size_t min,
                         std::size_t max, bool& ok);

// Byte count with an optional case-insensitive unit: B, K/KB, M/MB, G/GB
// (powers of 1024). Inclusive bounds in bytes.
std::size_t parse_bytes(const std::string& value, std::size_t min, std::size_t max, bool& ok);
std::size_t parse_bytes(const ArgParser& parser, const std::string& flag, std::size_t min,
                        std::size_t max, bool& ok);

// Non-negative duration: digits followed by s (default), m, h, d or w.
std::chrono::seconds parse_duration(const std::string& value, bool& ok);
std::chrono::seconds parse_duration(const ArgParser& parser, const std::string& flag, bool& ok);

// Non-negative milliseconds: digits followed by ms (default), s or m.
std::chrono::milliseconds parse_time_ms(const std::string& value, bool& ok);
std::chrono::milliseconds parse_time_ms(const ArgParser& parser, const std::string& flag,
                                        bool& ok);

// "true"/"false", "yes"/"no", "on"/"off" or "1"/"0", any case.
bool parse_bool(const std::string& value, bool& ok);

#endif // PARSE_UTILS_HPP
