#include "GlobPattern.hpp"

#include <catch2/catch.hpp>
#include <stdexcept>

TEST_CASE("Glob translation escapes dots and maps wildcards")
{
	REQUIRE(GlobPattern::toRegex("*.log") == ".*[.]log");
	REQUIRE(GlobPattern::toRegex("file?.txt") == "file.[.]txt");
	REQUIRE(GlobPattern::toRegex("plain") == "plain");
	REQUIRE(GlobPattern::toRegex("") == "");
}

TEST_CASE("Substring matching hits any part of the path")
{
	GlobPattern logs("*.log");
	REQUIRE(logs.matches("/data/b.log"));
	REQUIRE(logs.matches("/data/b.log.old"));
	REQUIRE_FALSE(logs.matches("/data/a.txt"));

	// the pattern can hit directory components too
	GlobPattern tmp("tmp");
	REQUIRE(tmp.matches("/var/tmp/a.txt"));
	REQUIRE(tmp.matches("/data/tmpfile"));

	// '.' is literal
	GlobPattern dotted("a.c");
	REQUIRE(dotted.matches("/x/a.c"));
	REQUIRE_FALSE(dotted.matches("/x/abc"));
}

TEST_CASE("Question mark matches exactly one character")
{
	GlobPattern single("a?c");
	REQUIRE(single.matchesWhole("abc"));
	REQUIRE_FALSE(single.matchesWhole("ac"));
	REQUIRE_FALSE(single.matchesWhole("abbc"));
}

TEST_CASE("Whole matching is anchored")
{
	GlobPattern csv("*.csv");
	REQUIRE(csv.matchesWhole("a.csv"));
	REQUIRE_FALSE(csv.matchesWhole("a.csv.bak"));
	REQUIRE(GlobPattern("*").matchesWhole(""));
}

TEST_CASE("Empty glob matches nothing")
{
	GlobPattern none("");
	REQUIRE(none.empty());
	REQUIRE_FALSE(none.matches("anything"));
	REQUIRE_FALSE(GlobPattern().matchesWhole("anything"));
}

TEST_CASE("Malformed glob is rejected")
{
	REQUIRE_THROWS_AS(GlobPattern("(unclosed"), std::invalid_argument);
}

TEST_CASE("Literal globs treat regex syntax as plain characters")
{
	REQUIRE(GlobPattern::toRegex("report(1).txt", true) == "report\\(1\\)[.]txt");
	REQUIRE(GlobPattern::toRegex("a+b*", true) == "a\\+b.*");

	REQUIRE(GlobPattern::literal("report(1).txt").matchesWhole("report(1).txt"));
	REQUIRE(GlobPattern::literal("a+b.txt").matchesWhole("a+b.txt"));
	REQUIRE_FALSE(GlobPattern::literal("a+b.txt").matchesWhole("aab.txt"));
	REQUIRE(GlobPattern::literal("[draft*").matchesWhole("[draft] notes.md"));
	REQUIRE(GlobPattern::literal("{x}|$^?").matchesWhole("{x}|$^!"));
	REQUIRE(GlobPattern::literal("back\\slash").matchesWhole("back\\slash"));
}
