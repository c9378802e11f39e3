#include "hb/server/RequestReader.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace hb::server;
using State = RequestReader::State;

static State feed(RequestReader& r, const std::string& s) {
    return r.feed(s.data(), s.size());
}

TEST(RequestReaderTest, WholeRequestInOneRead) {
    RequestReader r(1024);
    EXPECT_EQ(feed(r, R"({"method":"status"})"), State::Complete);
    EXPECT_STREQ(r.document()["method"].GetString(), "status");
}

TEST(RequestReaderTest, SplitAcrossReadsWaitsForTheRest) {
    RequestReader r(1024);
    EXPECT_EQ(feed(r, R"({"meth)"), State::Incomplete);
    EXPECT_EQ(feed(r, R"(od":"eval","params":{"co)"), State::Incomplete);
    EXPECT_EQ(feed(r, R"(de":"40 + 2"}})"), State::Complete);
    EXPECT_STREQ(r.document()["params"]["code"].GetString(), "40 + 2");
}

TEST(RequestReaderTest, SplitInsideNumberAndLiteral) {
    RequestReader r(1024);
    EXPECT_EQ(feed(r, R"({"a":12)"), State::Incomplete);
    EXPECT_EQ(feed(r, R"(3,"b":tr)"), State::Incomplete);
    EXPECT_EQ(feed(r, "ue}"), State::Complete);
    EXPECT_EQ(r.document()["a"].GetInt(), 123);
}

TEST(RequestReaderTest, WhitespaceOnlyIsIncomplete) {
    RequestReader r(1024);
    EXPECT_EQ(feed(r, "  \r\n "), State::Incomplete);
    EXPECT_TRUE(r.empty());
}

TEST(RequestReaderTest, TrailingBytesAfterFirstValueAreIgnored) {
    RequestReader r(1024);
    EXPECT_EQ(feed(r, R"({"method":"status"} {"method":"eval"})"), State::Complete);
    EXPECT_STREQ(r.document()["method"].GetString(), "status");
}

TEST(RequestReaderTest, InteriorGarbageIsMalformed) {
    RequestReader r(1024);
    EXPECT_EQ(feed(r, "not json at all"), State::Malformed);
    EXPECT_NE(r.error().find("Invalid JSON"), std::string::npos);
}

TEST(RequestReaderTest, EofWhileIncompleteIsMalformed) {
    RequestReader r(1024);
    EXPECT_EQ(feed(r, R"({"method":)"), State::Incomplete);
    EXPECT_EQ(r.finish(), State::Malformed);
    EXPECT_FALSE(r.error().empty());
}

TEST(RequestReaderTest, EofOnEmptyInput) {
    RequestReader r(1024);
    EXPECT_EQ(r.finish(), State::Malformed);
    EXPECT_EQ(r.error(), "empty request");
}

TEST(RequestReaderTest, OversizedRequestIsRejected) {
    RequestReader r(16);
    EXPECT_EQ(feed(r, R"({"method":"status","params":{}})"), State::TooLarge);
    EXPECT_NE(r.error().find("16 bytes"), std::string::npos);
    // Terminal: further bytes do not change the outcome.
    EXPECT_EQ(feed(r, "}"), State::TooLarge);
}

TEST(RequestReaderTest, CompleteIsSticky) {
    RequestReader r(1024);
    EXPECT_EQ(feed(r, "{}"), State::Complete);
    EXPECT_EQ(feed(r, "garbage"), State::Complete);
    EXPECT_EQ(r.finish(), State::Complete);
}
