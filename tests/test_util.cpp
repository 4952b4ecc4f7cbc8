#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace vantage;

// ── trim / to_lower ──────────────────────────────────────────────

TEST_CASE("trim: strips surrounding whitespace", "[util]") {
    REQUIRE(trim("  hello \n\t") == "hello");
    REQUIRE(trim("") == "");
    REQUIRE(trim("   ") == "");
    REQUIRE(trim("a b") == "a b");
}

TEST_CASE("to_lower: lowercases ASCII only", "[util]") {
    REQUIRE(to_lower("WhoIs DNS") == "whois dns");
    REQUIRE(to_lower("already") == "already");
}

// ── normalize_text ───────────────────────────────────────────────

TEST_CASE("normalize_text: collapses whitespace runs and lowercases", "[util]") {
    REQUIRE(normalize_text("  What   is\tWHOIS?\n") == "what is whois?");
    REQUIRE(normalize_text("what is whois?") == "what is whois?");
}

TEST_CASE("normalize_text: whitespace-only becomes empty", "[util]") {
    REQUIRE(normalize_text(" \t\n ").empty());
}

// ── split / replace_all ──────────────────────────────────────────

TEST_CASE("split: splits on delimiter", "[util]") {
    auto parts = split("a&b&&c", '&');
    REQUIRE(parts.size() == 4);
    REQUIRE(parts[0] == "a");
    REQUIRE(parts[2].empty());
    REQUIRE(parts[3] == "c");
}

TEST_CASE("replace_all: replaces every occurrence", "[util]") {
    REQUIRE(replace_all("port_scan_tool", "_", " ") == "port scan tool");
    REQUIRE(replace_all("abc", "", "x") == "abc");
}

// ── time ─────────────────────────────────────────────────────────

TEST_CASE("epoch_millis: reports milliseconds since the epoch", "[util]") {
    REQUIRE(epoch_millis() > 1600000000000ULL);
}

TEST_CASE("system_clock: reports epoch milliseconds", "[util]") {
    Clock clock = system_clock();
    uint64_t before = epoch_millis();
    uint64_t now = clock();
    REQUIRE(now >= before);
    REQUIRE(now - before < 5000);
}

// ── atomic_write_file ────────────────────────────────────────────

TEST_CASE("atomic_write_file: creates parent dirs and writes content", "[util]") {
    auto dir = std::filesystem::temp_directory_path() /
               ("vantage_util_" + std::to_string(getpid()));
    std::string path = (dir / "nested" / "file.json").string();

    REQUIRE(atomic_write_file(path, "{\"a\":1}"));

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(content == "{\"a\":1}");
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    std::filesystem::remove_all(dir);
}
