#include "test_common.hpp"
#include <cstdint>

TEST_CASE("parse_int bounds and junk") {
    bool ok = false;
    REQUIRE(parse_int("42", 0, 100, ok) == 42);
    REQUIRE(ok);
    REQUIRE(parse_int("+7", 0, 100, ok) == 7);
    REQUIRE(ok);
    REQUIRE(parse_int("-3", -5, 5, ok) == -3);
    REQUIRE(ok);
    parse_int("101", 0, 100, ok);
    REQUIRE_FALSE(ok);
    parse_int("12abc", 0, 100, ok);
    REQUIRE_FALSE(ok);
    parse_int("", 0, 100, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_size_t rejects signs") {
    bool ok = false;
    REQUIRE(parse_size_t("5", 1, 10, ok) == 5);
    REQUIRE(ok);
    parse_size_t("-5", 0, 10, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("0", 1, 10, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bytes units") {
    bool ok = false;
    REQUIRE(parse_bytes("512", 0, SIZE_MAX, ok) == 512);
    REQUIRE(ok);
    REQUIRE(parse_bytes("2K", 0, SIZE_MAX, ok) == 2048);
    REQUIRE(parse_bytes("3mb", 0, SIZE_MAX, ok) == 3u * 1024 * 1024);
    REQUIRE(parse_bytes("1G", 0, SIZE_MAX, ok) == 1024u * 1024 * 1024);
    REQUIRE(parse_bytes("10b", 0, SIZE_MAX, ok) == 10);
    parse_bytes("1T", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
    parse_bytes("1k", 2048, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_duration units") {
    bool ok = false;
    REQUIRE(parse_duration("30", ok) == std::chrono::seconds(30));
    REQUIRE(ok);
    REQUIRE(parse_duration("2m", ok) == std::chrono::minutes(2));
    REQUIRE(parse_duration("1h", ok) == std::chrono::hours(1));
    REQUIRE(parse_duration("1d", ok) == std::chrono::hours(24));
    REQUIRE(parse_duration("1w", ok) == std::chrono::hours(168));
    parse_duration("5x", ok);
    REQUIRE_FALSE(ok);
    parse_duration("", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_time_ms units") {
    bool ok = false;
    REQUIRE(parse_time_ms("250", ok) == std::chrono::milliseconds(250));
    REQUIRE(ok);
    REQUIRE(parse_time_ms("250ms", ok) == std::chrono::milliseconds(250));
    REQUIRE(parse_time_ms("3s", ok) == std::chrono::milliseconds(3000));
    REQUIRE(parse_time_ms("1m", ok) == std::chrono::milliseconds(60000));
    parse_time_ms("fast", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bool spellings") {
    bool ok = false;
    REQUIRE(parse_bool("YES", ok));
    REQUIRE(ok);
    REQUIRE(parse_bool("on", ok));
    REQUIRE_FALSE(parse_bool("0", ok));
    REQUIRE(ok);
    parse_bool("maybe", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("Parsers read values from ArgParser") {
    ArgParser::Spec spec;
    spec.value_flags = {"--idle", "--max-output", "--empty"};
    ArgParser parser({"--idle", "90", "--max-output=2k", "--empty="}, spec);
    bool ok = false;
    REQUIRE(parse_int(parser, "--idle", 0, 1000, ok) == 90);
    REQUIRE(ok);
    REQUIRE(parse_bytes(parser, "--max-output", 0, SIZE_MAX, ok) == 2048);
    REQUIRE(ok);
    parse_int(parser, "--empty", 0, 10, ok);
    REQUIRE_FALSE(ok);
    parse_int(parser, "--absent", 0, 10, ok);
    REQUIRE_FALSE(ok);
}
