// SPDX-FileCopyrightText: Copyright (c) 2025 Schelling Point Ventures Inc.
// SPDX-License-Identifier: MIT
//
#include <util/strings.hpp>
#include <doctest/doctest.h>

using namespace lmsvc::util;

TEST_CASE("trim") {
    CHECK(trim("") == "");
    CHECK(trim(" \t\n ") == "");
    CHECK(trim("  hello world\r\n") == "hello world");
    CHECK(trim("x") == "x");
}

TEST_CASE("trimQuoted") {
    CHECK(trimQuoted("\"positive\"") == "positive");
    CHECK(trimQuoted("  ' negative '  ") == "negative");
    CHECK(trimQuoted("`\"nested\"`") == "nested");
    // unbalanced quotes are kept
    CHECK(trimQuoted("\"open") == "\"open");
    CHECK(trimQuoted("'mixed\"") == "'mixed\"");
    // a lone quote is not a pair
    CHECK(trimQuoted("\"") == "\"");
    CHECK(trimQuoted("\"\"") == "");
}

TEST_CASE("case insensitive compare") {
    CHECK(toLower("PoSiTiVe") == "positive");
    CHECK(iequals("Positive", "POSITIVE"));
    CHECK_FALSE(iequals("positive", "positives"));
    CHECK(iequals("", ""));

    CHECK(icontains("I think this is POSITIVE overall", "positive"));
    CHECK_FALSE(icontains("neutral", "negative"));
    CHECK(icontains("anything", ""));
    CHECK_FALSE(icontains("", "x"));
}

TEST_CASE("preview") {
    CHECK(preview("short", 50) == "short");
    CHECK(preview("0123456789", 4) == "0123...");
    CHECK(preview("0123", 4) == "0123");

    // "é" is two bytes, cutting in the middle backs off to the sequence start
    CHECK(preview("ab\xC3\xA9xyz", 3) == "ab...");
    CHECK(preview("ab\xC3\xA9xyz", 4) == "ab\xC3\xA9...");
}

TEST_CASE("parsePort") {
    CHECK(parsePort("9090") == uint16_t(9090));
    CHECK(parsePort("0") == uint16_t(0));
    CHECK(parsePort("65535") == uint16_t(65535));

    // would wrap with a plain cast
    CHECK_FALSE(parsePort("65536"));
    CHECK_FALSE(parsePort("70000"));
    CHECK_FALSE(parsePort("99999999999999999999999"));

    CHECK_FALSE(parsePort(""));
    CHECK_FALSE(parsePort("-1"));
    CHECK_FALSE(parsePort("http"));
    CHECK_FALSE(parsePort("90x"));
    CHECK_FALSE(parsePort(" 9090"));
}
