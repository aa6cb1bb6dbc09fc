// Unit tests for io/request_loader.hpp (CSV input).

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "io/request_loader.hpp"

namespace {

using piirelay::io::PromptRequest;
using piirelay::io::RequestLoader;

std::vector<PromptRequest> parseText(const std::string& text) {
    std::istringstream in(text);
    return RequestLoader::parse(in);
}

TEST(RequestLoaderTest, ParsesRequiredColumns) {
    auto requests = parseText("system_prompt,prompt\nBe brief.,Email a@b.com\nBe kind.,Say hi\n");
    ASSERT_EQ(requests.size(), (size_t)2);
    EXPECT_EQ(requests[0].instruction, "Be brief.");
    EXPECT_EQ(requests[0].request, "Email a@b.com");
    EXPECT_EQ(requests[1].instruction, "Be kind.");
    EXPECT_EQ(requests[1].request, "Say hi");
}

TEST(RequestLoaderTest, ColumnsMatchedByName) {
    auto requests = parseText("id,prompt,notes,system_prompt\n7,Do it,ignored,Be terse\n");
    ASSERT_EQ(requests.size(), (size_t)1);
    EXPECT_EQ(requests[0].instruction, "Be terse");
    EXPECT_EQ(requests[0].request, "Do it");
}

TEST(RequestLoaderTest, QuotedFieldsKeepCommasNewlinesAndQuotes) {
    auto requests = parseText(
        "system_prompt,prompt\n"
        "\"Be, brief\",\"Line one\nLine two \"\"quoted\"\"\"\n");
    ASSERT_EQ(requests.size(), (size_t)1);
    EXPECT_EQ(requests[0].instruction, "Be, brief");
    EXPECT_EQ(requests[0].request, "Line one\nLine two \"quoted\"");
}

TEST(RequestLoaderTest, TrimsUnquotedFieldsOnly) {
    auto requests = parseText("system_prompt , prompt\n  spaced  ,\"  kept  \" \n");
    ASSERT_EQ(requests.size(), (size_t)1);
    EXPECT_EQ(requests[0].instruction, "spaced");
    EXPECT_EQ(requests[0].request, "  kept  ");
}

TEST(RequestLoaderTest, HandlesBomCrlfAndBlankLines) {
    auto requests = parseText("\xEF\xBB\xBFsystem_prompt,prompt\r\nA,B\r\n\r\n\nC,D");
    ASSERT_EQ(requests.size(), (size_t)2);
    EXPECT_EQ(requests[0].instruction, "A");
    EXPECT_EQ(requests[0].request, "B");
    EXPECT_EQ(requests[1].instruction, "C");
    EXPECT_EQ(requests[1].request, "D");
}

TEST(RequestLoaderTest, ShortRowGetsEmptyCells) {
    auto requests = parseText("system_prompt,prompt\nonly an instruction\n");
    ASSERT_EQ(requests.size(), (size_t)1);
    EXPECT_EQ(requests[0].instruction, "only an instruction");
    EXPECT_EQ(requests[0].request, "");
}

TEST(RequestLoaderTest, HeaderOnlyYieldsNoRequests) {
    EXPECT_TRUE(parseText("system_prompt,prompt\n").empty());
}

TEST(RequestLoaderTest, MalformedInputThrows) {
    EXPECT_THROW(parseText(""), std::runtime_error);
    EXPECT_THROW(parseText("system_prompt,question\nA,B\n"), std::runtime_error);
    EXPECT_THROW(parseText("system_prompt,prompt\n\"open,B\n"), std::runtime_error);
    EXPECT_THROW(parseText("system_prompt,prompt\n\"A\"x,B\n"), std::runtime_error);
    EXPECT_THROW(parseText("system_prompt,prompt\nA\"b\",B\n"), std::runtime_error);
}

TEST(RequestLoaderTest, MissingFileThrows) {
    EXPECT_THROW(RequestLoader::loadFromFile("/nonexistent/piirelay/requests.csv"), std::runtime_error);
}

} // anonymous namespace
