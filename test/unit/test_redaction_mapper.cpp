// Unit tests for redaction/redaction_mapper.hpp and redaction/placeholder_map.hpp.

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "redaction/pattern_catalog.hpp"
#include "redaction/placeholder_map.hpp"
#include "redaction/redaction_mapper.hpp"
#include "restoration/restorer.hpp"

namespace {

using piirelay::redaction::PatternCatalog;
using piirelay::redaction::PlaceholderMap;
using piirelay::redaction::RedactionMapper;
using piirelay::redaction::RedactionResult;
using piirelay::redaction::RedactionState;
using piirelay::redaction::replaceAllLiteral;

class RedactionMapperTest : public ::testing::Test {
protected:
    RedactionMapperTest() : mapper(PatternCatalog::standard()) {}

    RedactionMapper mapper;
};

TEST_F(RedactionMapperTest, RedactsEveryStandardCategory) {
    RedactionResult r = mapper.redact("Contact 555-123-4567 or a@b.com, SSN 123-45-6789");

    EXPECT_EQ(r.redactedText, "Contact PHONE_NUMBER_0001 or EMAIL_0001, SSN SSN_0001");
    ASSERT_EQ(r.mapping.size(), (size_t)3);

    ASSERT_NE(r.mapping.findOriginal("SSN_0001"), nullptr);
    EXPECT_EQ(*r.mapping.findOriginal("SSN_0001"), "123-45-6789");
    ASSERT_NE(r.mapping.findOriginal("EMAIL_0001"), nullptr);
    EXPECT_EQ(*r.mapping.findOriginal("EMAIL_0001"), "a@b.com");
    ASSERT_NE(r.mapping.findOriginal("PHONE_NUMBER_0001"), nullptr);
    EXPECT_EQ(*r.mapping.findOriginal("PHONE_NUMBER_0001"), "555-123-4567");

    // Entries come out in minting order: categories in catalog order.
    EXPECT_EQ(r.mapping.entries()[0].first, "SSN_0001");
    EXPECT_EQ(r.mapping.entries()[1].first, "EMAIL_0001");
    EXPECT_EQ(r.mapping.entries()[2].first, "PHONE_NUMBER_0001");

    for (const auto& entry : r.mapping.entries()) {
        EXPECT_EQ(r.redactedText.find(entry.second), std::string::npos) << entry.second;
    }
}

TEST_F(RedactionMapperTest, RepeatedValueSharesOneToken) {
    RedactionResult r = mapper.redact("a@b.com called a@b.com");
    EXPECT_EQ(r.redactedText, "EMAIL_0001 called EMAIL_0001");
    ASSERT_EQ(r.mapping.size(), (size_t)1);
    EXPECT_EQ(*r.mapping.findToken("a@b.com"), "EMAIL_0001");
}

TEST_F(RedactionMapperTest, CountersArePerLabel) {
    RedactionResult r = mapper.redact("x@y.com, z@w.org, 111-22-3333");
    EXPECT_EQ(r.redactedText, "EMAIL_0001, EMAIL_0002, SSN_0001");
    EXPECT_EQ(*r.mapping.findOriginal("EMAIL_0002"), "z@w.org");
}

TEST_F(RedactionMapperTest, EarlierCategoryClaimsOverlappingSpan) {
    // The local part looks like a phone number; EMAIL runs first and takes it all.
    RedactionResult r = mapper.redact("reach 555-123-4567@example.com");
    EXPECT_EQ(r.redactedText, "reach EMAIL_0001");
    ASSERT_EQ(r.mapping.size(), (size_t)1);
    EXPECT_EQ(r.mapping.findOriginal("PHONE_NUMBER_0001"), nullptr);
}

TEST_F(RedactionMapperTest, TextWithoutMatchesIsUnchanged) {
    RedactionResult empty = mapper.redact("");
    EXPECT_EQ(empty.redactedText, "");
    EXPECT_TRUE(empty.mapping.empty());

    RedactionResult plain = mapper.redact("Nothing sensitive here, 42 apples.");
    EXPECT_EQ(plain.redactedText, "Nothing sensitive here, 42 apples.");
    EXPECT_TRUE(plain.mapping.empty());
}

TEST_F(RedactionMapperTest, HundredKilobyteWordIsUnchanged) {
    const std::string word(100000, 'a');
    RedactionResult r = mapper.redact(word);
    EXPECT_EQ(r.redactedText, word);
    EXPECT_TRUE(r.mapping.empty());
}

TEST_F(RedactionMapperTest, InlineImageDataDoesNotHideNearbyValues) {
    const std::string image = "see data:image/png;base64," + std::string(70000, 'Q');
    RedactionResult alone = mapper.redact(image);
    EXPECT_EQ(alone.redactedText, image);
    EXPECT_TRUE(alone.mapping.empty());

    RedactionResult r = mapper.redact(image + " from a@b.com or 555-123-4567");
    EXPECT_EQ(r.redactedText, image + " from EMAIL_0001 or PHONE_NUMBER_0001");
    EXPECT_EQ(r.mapping.size(), (size_t)2);
}

TEST_F(RedactionMapperTest, DeterministicAcrossCalls) {
    const std::string text = "Mail b@c.io or d@e.io, call (555) 222-3333.";
    RedactionResult first = mapper.redact(text);
    RedactionResult second = mapper.redact(text);
    EXPECT_EQ(first.redactedText, second.redactedText);
    EXPECT_EQ(first.mapping.entries(), second.mapping.entries());
}

TEST_F(RedactionMapperTest, RestoreInvertsRedaction) {
    const std::vector<std::string> inputs = {
        "Contact 555-123-4567 or a@b.com, SSN 123-45-6789",
        "Call +1 (555) 987-6543 twice: +1 (555) 987-6543.",
        "Two people: ann@corp.example.com and bob@corp.example.com\nSSN 321-54-9876 on file.",
        "nothing to see",
        "",
    };
    const auto& grammar = PatternCatalog::standard().grammar();
    for (const auto& input : inputs) {
        RedactionResult r = mapper.redact(input);
        EXPECT_EQ(piirelay::restoration::restoreAll(r.redactedText, r.mapping, grammar), input);
    }
}

TEST(RedactionStateTest, SequenceOverflowThrows) {
    RedactionState state;
    EXPECT_EQ(state.nextSequence("X", 2), (uint32_t)1);
    EXPECT_EQ(state.nextSequence("X", 2), (uint32_t)2);
    EXPECT_EQ(state.nextSequence("Y", 2), (uint32_t)1);
    EXPECT_THROW(state.nextSequence("X", 2), std::overflow_error);
}

TEST(ReplaceAllLiteralTest, ReplacesEveryOccurrenceOnce) {
    EXPECT_EQ(replaceAllLiteral("aXbXc", "X", "YY"), "aYYbYYc");
    EXPECT_EQ(replaceAllLiteral("ab abc", "abc", "T"), "ab T");
    EXPECT_EQ(replaceAllLiteral("aaa", "a", "aa"), "aaaaaa");
    EXPECT_EQ(replaceAllLiteral("text", "", "T"), "text");
}

TEST(PlaceholderMapTest, RejectsDuplicates) {
    PlaceholderMap map{{"EMAIL_0001", "a@b.com"}};
    EXPECT_THROW(map.insert("EMAIL_0001", "c@d.com"), std::invalid_argument);
    EXPECT_THROW(map.insert("EMAIL_0002", "a@b.com"), std::invalid_argument);
    EXPECT_EQ(map.size(), (size_t)1);
    EXPECT_EQ(map.findOriginal("EMAIL_0002"), nullptr);
    EXPECT_EQ(map.findToken("c@d.com"), nullptr);
}

} // anonymous namespace
