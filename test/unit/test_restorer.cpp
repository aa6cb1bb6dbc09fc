// Unit tests for restoration/restorer.hpp (whole-text restoration).

#include <gtest/gtest.h>

#include <string>

#include "redaction/pattern_catalog.hpp"
#include "redaction/placeholder_map.hpp"
#include "restoration/restorer.hpp"

namespace {

using piirelay::redaction::PatternCatalog;
using piirelay::redaction::PlaceholderMap;
using piirelay::restoration::restoreAll;

const piirelay::redaction::PlaceholderGrammar& grammar() {
    return PatternCatalog::standard().grammar();
}

TEST(RestorerTest, UnknownTokensStayLiteral) {
    PlaceholderMap empty;
    EXPECT_EQ(restoreAll("see EMAIL_0099 here", empty, grammar()), "see EMAIL_0099 here");
}

TEST(RestorerTest, TextWithoutTokensIsUnchanged) {
    PlaceholderMap map{{"EMAIL_0001", "a@b.com"}};
    EXPECT_EQ(restoreAll("", map, grammar()), "");
    EXPECT_EQ(restoreAll("plain words", map, grammar()), "plain words");
}

TEST(RestorerTest, ReplacesKnownTokensOnly) {
    PlaceholderMap map{{"EMAIL_0001", "a@b.com"}, {"SSN_0001", "123-45-6789"}};
    EXPECT_EQ(restoreAll("EMAIL_0001 and EMAIL_0002, SSN_0001.", map, grammar()),
              "a@b.com and EMAIL_0002, 123-45-6789.");
}

TEST(RestorerTest, EveryOccurrenceIsReplaced) {
    PlaceholderMap map{{"PHONE_NUMBER_0001", "555-123-4567"}};
    EXPECT_EQ(restoreAll("PHONE_NUMBER_0001/PHONE_NUMBER_0001", map, grammar()),
              "555-123-4567/555-123-4567");
}

TEST(RestorerTest, TokensInsideWordsAreIgnored) {
    PlaceholderMap map{{"SSN_0001", "123-45-6789"}};
    EXPECT_EQ(restoreAll("xSSN_0001 SSN_00010 SSN_0001x", map, grammar()),
              "xSSN_0001 SSN_00010 SSN_0001x");
}

TEST(RestorerTest, RestoredValuesAreNotRescanned) {
    PlaceholderMap map{{"SSN_0001", "EMAIL_0001"}, {"EMAIL_0001", "x@y.com"}};
    EXPECT_EQ(restoreAll("id SSN_0001 end", map, grammar()), "id EMAIL_0001 end");
}

} // anonymous namespace
