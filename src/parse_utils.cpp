#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Whole-string unsigned decimal parse.
bool parse_digits(const std::string& s, unsigned long long& out) {
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s.front())))
        return false;
    const char* end = s.data() + s.size();
    auto res = std::from_chars(s.data(), end, out);
    return res.ec == std::errc() && res.ptr == end;
}

template <typename Fn>
auto from_parser(const ArgParser& parser, const std::string& flag, bool& ok, Fn fn)
    -> decltype(fn(std::string())) {
    std::string value = parser.get_option(flag);
    if (!parser.has_flag(flag) || value.empty()) {
        ok = false;
        return decltype(fn(std::string()))();
    }
    return fn(value);
}

} // namespace

int parse_int(const std::string& value, int min, int max, bool& ok) {
    ok = false;
    std::string s = value;
    if (!s.empty() && s.front() == '+')
        s.erase(0, 1);
    if (s.empty())
        return 0;
    int v = 0;
    const char* end = s.data() + s.size();
    auto res = std::from_chars(s.data(), end, v);
    if (res.ec != std::errc() || res.ptr != end || v < min || v > max)
        return 0;
    ok = true;
    return v;
}

int parse_int(const ArgParser& parser, const std::string& flag, int min, int max, bool& ok) {
    return from_parser(parser, flag, ok,
                       [&](const std::string& v) { return parse_int(v, min, max, ok); });
}

std::size_t parse_size_t(const std::string& value, std::size_t min, std::size_t max, bool& ok) {
    ok = false;
    unsigned long long v = 0;
    if (!parse_digits(value, v) || v > std::numeric_limits<std::size_t>::max())
        return 0;
    if (v < min || v > max)
        return 0;
    ok = true;
    return static_cast<std::size_t>(v);
}

std::size_t parse_size_t(const ArgParser& parser, const std::string& flag, std::size_t min,
                         std::size_t max, bool& ok) {
    return from_parser(parser, flag, ok,
                       [&](const std::string& v) { return parse_size_t(v, min, max, ok); });
}

std::size_t parse_bytes(const std::string& value, std::size_t min, std::size_t max, bool& ok) {
    ok = false;
    std::string val = lowercase(value);
    unsigned long long mult = 1;
    const std::pair<const char*, unsigned long long> units[] = {
        {"kb", 1024ull}, {"mb", 1024ull * 1024}, {"gb", 1024ull * 1024 * 1024},
        {"k", 1024ull},  {"m", 1024ull * 1024},  {"g", 1024ull * 1024 * 1024},
        {"b", 1ull}};
    for (const auto& [suffix, factor] : units) {
        if (ends_with(val, suffix)) {
            mult = factor;
            val.erase(val.size() - std::char_traits<char>::length(suffix));
            break;
        }
    }
    unsigned long long base = 0;
    if (!parse_digits(val, base))
        return 0;
    if (base > std::numeric_limits<unsigned long long>::max() / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<std::size_t>(total);
}

std::size_t parse_bytes(const ArgParser& parser, const std::string& flag, std::size_t min,
                        std::size_t max, bool& ok) {
    return from_parser(parser, flag, ok,
                       [&](const std::string& v) { return parse_bytes(v, min, max, ok); });
}

std::chrono::seconds parse_duration(const std::string& value, bool& ok) {
    ok = false;
    if (value.empty())
        return std::chrono::seconds(0);
    std::string num = value;
    char unit = 's';
    if (!std::isdigit(static_cast<unsigned char>(num.back()))) {
        unit = num.back();
        num.pop_back();
    }
    unsigned long long n = 0;
    if (!parse_digits(num, n))
        return std::chrono::seconds(0);
    long long count = static_cast<long long>(n);
    switch (unit) {
    case 's':
        ok = true;
        return std::chrono::seconds(count);
    case 'm':
        ok = true;
        return std::chrono::minutes(count);
    case 'h':
        ok = true;
        return std::chrono::hours(count);
    case 'd':
        ok = true;
        return std::chrono::hours(24 * count);
    case 'w':
        ok = true;
        return std::chrono::hours(24 * 7 * count);
    default:
        return std::chrono::seconds(0);
    }
}

std::chrono::seconds parse_duration(const ArgParser& parser, const std::string& flag, bool& ok) {
    return from_parser(parser, flag, ok,
                       [&](const std::string& v) { return parse_duration(v, ok); });
}

std::chrono::milliseconds parse_time_ms(const std::string& value, bool& ok) {
    ok = false;
    std::string num = lowercase(value);
    long long mult = 1;
    if (ends_with(num, "ms")) {
        num.erase(num.size() - 2);
    } else if (ends_with(num, "s")) {
        mult = 1000;
        num.pop_back();
    } else if (ends_with(num, "m")) {
        mult = 60 * 1000;
        num.pop_back();
    }
    unsigned long long n = 0;
    if (!parse_digits(num, n) || n > static_cast<unsigned long long>(
                                         std::numeric_limits<long long>::max() / mult))
        return std::chrono::milliseconds(0);
    ok = true;
    return std::chrono::milliseconds(static_cast<long long>(n) * mult);
}

std::chrono::milliseconds parse_time_ms(const ArgParser& parser, const std::string& flag,
                                        bool& ok) {
    return from_parser(parser, flag, ok,
                       [&](const std::string& v) { return parse_time_ms(v, ok); });
}

bool parse_bool(const std::string& value, bool& ok) {
    std::string v = lowercase(value);
    ok = true;
    if (v == "true" || v == "yes" || v == "on" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "off" || v == "0")
        return false;
    ok = false;
    return false;
}
