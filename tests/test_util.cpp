#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace eventseq;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing spaces", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
}

TEST_CASE("trim: removes tabs and mixed whitespace", "[util]") {
    REQUIRE(trim("\t hello \n") == "hello");
}

TEST_CASE("trim: empty string returns empty", "[util]") {
    REQUIRE(trim("").empty());
}

TEST_CASE("trim: all whitespace returns empty", "[util]") {
    REQUIRE(trim("   \t\n  ").empty());
}

TEST_CASE("trim: no whitespace unchanged", "[util]") {
    REQUIRE(trim("hello") == "hello");
}

// ── to_lower / normalize_text ────────────────────────────────────

TEST_CASE("to_lower: ASCII only", "[util]") {
    REQUIRE(to_lower("Person ENTERS 42") == "person enters 42");
}

TEST_CASE("normalize_text: trims and lower-cases", "[util]") {
    REQUIRE(normalize_text("  Car Arrives\t") == "car arrives");
    REQUIRE(normalize_text("car arrives") == normalize_text("CAR ARRIVES "));
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    REQUIRE(home != nullptr);
    REQUIRE(expand_home("~/.eventseq") == std::string(home) + "/.eventseq");
}

TEST_CASE("expand_home: other paths unchanged", "[util]") {
    REQUIRE(expand_home("/etc/eventseq") == "/etc/eventseq");
    REQUIRE(expand_home("").empty());
}

// ── atomic_write_file ────────────────────────────────────────────

TEST_CASE("atomic_write_file: creates parent directory and writes content", "[util]") {
    auto dir = std::filesystem::temp_directory_path() /
               ("eventseq_util_" + std::to_string(getpid()));
    std::string path = (dir / "nested" / "out.json").string();

    REQUIRE(atomic_write_file(path, "{\"ok\": true}\n"));

    std::ifstream in(path);
    std::stringstream buf;
    buf << in.rdbuf();
    REQUIRE(buf.str() == "{\"ok\": true}\n");
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    std::filesystem::remove_all(dir);
}

// ── format_fixed ─────────────────────────────────────────────────

TEST_CASE("format_fixed: rounds to precision", "[util]") {
    REQUIRE(format_fixed(0.12345, 3) == "0.123");
    REQUIRE(format_fixed(75.5, 1) == "75.5");
    REQUIRE(format_fixed(2.0, 0) == "2");
}

// ── timestamp_now ────────────────────────────────────────────────

TEST_CASE("timestamp_now: ISO 8601 UTC", "[util]") {
    auto ts = timestamp_now();
    REQUIRE(ts.size() == 20);
    REQUIRE(ts[4] == '-');
    REQUIRE(ts[10] == 'T');
    REQUIRE(ts.back() == 'Z');
}
