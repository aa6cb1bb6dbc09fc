// Unit tests for restoration/stream_restorer.hpp (incremental restoration).

#include <gtest/gtest.h>

#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

#include "redaction/pattern_catalog.hpp"
#include "redaction/placeholder_map.hpp"
#include "restoration/restorer.hpp"
#include "restoration/stream_restorer.hpp"

namespace {

using piirelay::redaction::PatternCatalog;
using piirelay::redaction::PlaceholderMap;
using piirelay::restoration::StreamRestorer;
using piirelay::restoration::restoreAll;

const piirelay::redaction::PlaceholderGrammar& grammar() {
    return PatternCatalog::standard().grammar();
}

// Feeds the non-empty fragments in order, then flushes. Returns every emission.
std::vector<std::string> runSession(const PlaceholderMap& mapping, const std::vector<std::string>& fragments) {
    StreamRestorer session(mapping, grammar());
    std::vector<std::string> emissions;
    for (const auto& fragment : fragments) {
        if (!fragment.empty()) {
            emissions.push_back(session.consume(fragment));
        }
    }
    emissions.push_back(session.flush());
    return emissions;
}

std::string join(const std::vector<std::string>& pieces) {
    std::string out;
    for (const auto& p : pieces) {
        out += p;
    }
    return out;
}

bool hasPlaceholderResidue(const std::string& piece) {
    for (char c : piece) {
        if (c == '_' || std::isupper(static_cast<unsigned char>(c))) {
            return true;
        }
    }
    return false;
}

TEST(StreamRestorerTest, SafetyMarginIsLongestTokenMinusOne) {
    PlaceholderMap mapping;
    StreamRestorer session(mapping, grammar());
    EXPECT_EQ(session.safetyMargin(), (size_t)16);
}

TEST(StreamRestorerTest, ShortInputIsWithheldUntilFlush) {
    PlaceholderMap mapping;
    StreamRestorer session(mapping, grammar());
    EXPECT_EQ(session.state(), StreamRestorer::State::Empty);

    EXPECT_EQ(session.consume("hello"), "");
    EXPECT_EQ(session.state(), StreamRestorer::State::Accumulating);
    EXPECT_EQ(session.pendingSize(), (size_t)5);

    EXPECT_EQ(session.flush(), "hello");
    EXPECT_EQ(session.state(), StreamRestorer::State::Flushed);
    EXPECT_TRUE(session.isFlushed());
}

TEST(StreamRestorerTest, StateFollowsEmissions) {
    PlaceholderMap mapping;
    StreamRestorer session(mapping, grammar());
    EXPECT_EQ(session.consume(std::string(40, 'a')), std::string(24, 'a'));
    EXPECT_EQ(session.state(), StreamRestorer::State::Emitting);
    EXPECT_EQ(session.pendingSize(), (size_t)16);
    EXPECT_EQ(session.flush(), std::string(16, 'a'));
}

TEST(StreamRestorerTest, EmptyFragmentEndsTheStream) {
    PlaceholderMap mapping{{"EMAIL_0001", "a@b.com"}};
    StreamRestorer session(mapping, grammar());
    EXPECT_EQ(session.consume("to EMAIL_0001"), "");
    EXPECT_EQ(session.consume(""), "to a@b.com");
    EXPECT_TRUE(session.isFlushed());
}

TEST(StreamRestorerTest, CallsAfterFlushThrow) {
    PlaceholderMap mapping;
    StreamRestorer session(mapping, grammar());
    session.consume("abc");
    session.flush();
    EXPECT_THROW(session.consume("more"), std::logic_error);
    EXPECT_THROW(session.consume(""), std::logic_error);
    EXPECT_THROW(session.flush(), std::logic_error);
}

TEST(StreamRestorerTest, NoPartialTokenAtAnySingleSplit) {
    const PlaceholderMap mapping{{"EMAIL_0001", "a@b.com"}};
    const std::string text = "please reach me at EMAIL_0001 before noon today, thanks";
    const std::string expected = restoreAll(text, mapping, grammar());
    ASSERT_EQ(expected, "please reach me at a@b.com before noon today, thanks");

    for (size_t i = 0; i <= text.size(); ++i) {
        auto emissions = runSession(mapping, {text.substr(0, i), text.substr(i)});
        EXPECT_EQ(join(emissions), expected) << "split at " << i;
        for (const auto& piece : emissions) {
            EXPECT_FALSE(hasPlaceholderResidue(piece)) << "split at " << i << ": '" << piece << "'";
        }
    }
}

TEST(StreamRestorerTest, NoPartialTokenAtAnyDoubleSplit) {
    const PlaceholderMap mapping{{"EMAIL_0001", "a@b.com"}, {"PHONE_NUMBER_0002", "555-123-4567"}};
    const std::string text = "x EMAIL_0001 y PHONE_NUMBER_0002 z";
    const std::string expected = "x a@b.com y 555-123-4567 z";

    for (size_t i = 0; i <= text.size(); ++i) {
        for (size_t j = i; j <= text.size(); ++j) {
            auto emissions = runSession(mapping, {text.substr(0, i), text.substr(i, j - i), text.substr(j)});
            ASSERT_EQ(join(emissions), expected) << "splits at " << i << "," << j;
            for (const auto& piece : emissions) {
                EXPECT_FALSE(hasPlaceholderResidue(piece)) << "splits at " << i << "," << j;
            }
        }
    }
}

TEST(StreamRestorerTest, FlushMatchesWholeTextRestoreForAnyChunkSize) {
    const PlaceholderMap mapping{{"EMAIL_0001", "a@b.com"}, {"PHONE_NUMBER_0001", "555-123-4567"}};
    const std::string text =
        "Hi EMAIL_0001, SSN_0042 is unknown; EMAIL_00012 and xEMAIL_0001 stay.\n"
        "caf\xC3\xA9 \xE2\x80\x93 na\xC3\xAFve PHONE_NUMBER_0001";
    const std::string expected = restoreAll(text, mapping, grammar());

    for (size_t chunk = 1; chunk <= 25; ++chunk) {
        std::vector<std::string> fragments;
        for (size_t i = 0; i < text.size(); i += chunk) {
            fragments.push_back(text.substr(i, chunk));
        }
        auto emissions = runSession(mapping, fragments);
        EXPECT_EQ(join(emissions), expected) << "chunk size " << chunk;
        for (const auto& piece : emissions) {
            if (!piece.empty()) {
                EXPECT_NE(static_cast<unsigned char>(piece[0]) & 0xC0, 0x80)
                    << "emission starts inside a UTF-8 sequence, chunk size " << chunk;
            }
        }
    }
}

TEST(StreamRestorerTest, TokenEndingTheBufferWaitsForNextCharacter) {
    const PlaceholderMap mapping{{"PHONE_NUMBER_0001", "555-123-4567"}};

    StreamRestorer completed(mapping, grammar());
    EXPECT_EQ(completed.consume("call PHONE_NUMBER_0001"), "call ");
    std::string rest = completed.consume(" now");
    rest += completed.flush();
    EXPECT_EQ(rest, "555-123-4567 now");

    StreamRestorer extended(mapping, grammar());
    EXPECT_EQ(extended.consume("call PHONE_NUMBER_0001"), "call ");
    rest = extended.consume("2 more");
    rest += extended.flush();
    EXPECT_EQ(rest, "PHONE_NUMBER_00012 more");
}

TEST(StreamRestorerTest, RestoredValuesAreNotRescanned) {
    const PlaceholderMap mapping{{"SSN_0001", "EMAIL_0001"}, {"EMAIL_0001", "x@y.com"}};
    const std::string text = "id SSN_0001 end of a fairly long line";
    std::vector<std::string> fragments;
    for (char c : text) {
        fragments.push_back(std::string(1, c));
    }
    EXPECT_EQ(join(runSession(mapping, fragments)), "id EMAIL_0001 end of a fairly long line");
}

TEST(StreamRestorerTest, EmissionNeverSplitsMultibyteCharacter) {
    std::string text;
    for (int i = 0; i < 21; ++i) {
        text += "\xC3\xA9";
    }
    text += "b";

    PlaceholderMap mapping;
    StreamRestorer session(mapping, grammar());
    const std::string first = session.consume(text);
    EXPECT_EQ(first.size(), (size_t)26);
    EXPECT_EQ(first + session.flush(), text);
}

} // anonymous namespace
