#include "compare/ResponseComparator.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "FakeTransport.hpp"

static ComparatorConfig noSignals() {
    ComparatorConfig c;
    c.statusCode = false;
    c.lengthCheck = false;
    return c;
}

TEST(ResponseComparatorTest, SelfEquivalentWithDefaultSignals) {
    ResponseComparator cmp{ComparatorConfig{}};
    auto s = okResponse(200, "hello world");
    EXPECT_TRUE(cmp.equivalent(s, s));
}

TEST(ResponseComparatorTest, UnhealthySnapshotsNeverMatch) {
    ResponseComparator cmp{noSignals()};
    auto ok = okResponse(200, "x");
    auto failed = failedResponse("Connection refused");

    EXPECT_FALSE(cmp.equivalent(ok, failed));
    EXPECT_FALSE(cmp.equivalent(failed, ok));
    EXPECT_FALSE(cmp.equivalent(failed, failed));

    ResponseSnapshot noStatus;
    noStatus.body = "x";
    EXPECT_FALSE(cmp.equivalent(ok, noStatus));
}

TEST(ResponseComparatorTest, NoSignalsAcceptsAnyHealthyResponse) {
    ResponseComparator cmp{noSignals()};
    EXPECT_TRUE(cmp.equivalent(okResponse(200, "a"), okResponse(500, "completely different")));
}

TEST(ResponseComparatorTest, StatusCodeSignal) {
    ComparatorConfig c = noSignals();
    c.statusCode = true;
    ResponseComparator cmp{c};
    EXPECT_TRUE(cmp.equivalent(okResponse(200, "a"), okResponse(200, "bbbb")));
    EXPECT_FALSE(cmp.equivalent(okResponse(200, "a"), okResponse(403, "a")));
}

TEST(ResponseComparatorTest, LengthToleranceBoundary) {
    ComparatorConfig c = noSignals();
    c.lengthCheck = true;
    c.lengthTolerance = 0.1;
    ResponseComparator cmp{c};

    auto base = okResponse(200, std::string(100, 'x'));
    EXPECT_TRUE(cmp.equivalent(base, okResponse(200, std::string(110, 'x'))));
    EXPECT_TRUE(cmp.equivalent(base, okResponse(200, std::string(90, 'x'))));
    EXPECT_FALSE(cmp.equivalent(base, okResponse(200, std::string(111, 'x'))));
    EXPECT_FALSE(cmp.equivalent(base, okResponse(200, std::string(89, 'x'))));
}

TEST(ResponseComparatorTest, ZeroLengthBaselineNeedsZeroLengthCandidate) {
    ComparatorConfig c = noSignals();
    c.lengthCheck = true;
    c.lengthTolerance = 5.0;
    ResponseComparator cmp{c};

    auto empty = okResponse(204, "");
    EXPECT_TRUE(cmp.equivalent(empty, okResponse(204, "")));
    EXPECT_FALSE(cmp.equivalent(empty, okResponse(204, "x")));

    ResponseSnapshot noBody;
    noBody.statusCode = 204;
    EXPECT_TRUE(cmp.equivalent(empty, noBody));
}

TEST(ResponseComparatorTest, NeedAllTokens) {
    ComparatorConfig c = noSignals();
    c.needAll = {"user", "id"};
    ResponseComparator cmp{c};
    auto base = okResponse(200, "user id");

    EXPECT_TRUE(cmp.equivalent(base, okResponse(200, "{\"user\":1,\"id\":2}")));
    EXPECT_FALSE(cmp.equivalent(base, okResponse(200, "{\"user\":1}")));

    ResponseSnapshot noBody;
    noBody.statusCode = 200;
    EXPECT_FALSE(cmp.equivalent(base, noBody));
}

TEST(ResponseComparatorTest, NeedAnyToken) {
    ComparatorConfig c = noSignals();
    c.needAny = {"welcome", "dashboard"};
    ResponseComparator cmp{c};
    auto base = okResponse(200, "welcome");

    EXPECT_TRUE(cmp.equivalent(base, okResponse(200, "your dashboard")));
    EXPECT_FALSE(cmp.equivalent(base, okResponse(200, "login required")));
}

TEST(ResponseComparatorTest, RegexPatternsMustAllMatch) {
    ComparatorConfig c = noSignals();
    c.regex = {"^status: ok$", "id=\\d+"};
    ResponseComparator cmp{c};
    auto base = okResponse(200, "x");

    EXPECT_TRUE(cmp.equivalent(base, okResponse(200, "header\nstatus: ok\nid=42\n")));
    EXPECT_FALSE(cmp.equivalent(base, okResponse(200, "status: ok\nid=none")));
}

TEST(ResponseComparatorTest, InvalidRegexIsRejected) {
    ComparatorConfig c = noSignals();
    c.regex = {"(unclosed"};
    EXPECT_THROW(ResponseComparator{c}, std::invalid_argument);
}

TEST(ResponseComparatorTest, OrLogicNeedsOneSignal) {
    ComparatorConfig c;
    c.statusCode = true;
    c.lengthCheck = true;
    c.lengthTolerance = 0.0;
    c.logic = CombineLogic::Or;
    ResponseComparator cmp{c};
    auto base = okResponse(200, "abc");

    EXPECT_TRUE(cmp.equivalent(base, okResponse(200, "abcdef")));   // status only
    EXPECT_TRUE(cmp.equivalent(base, okResponse(404, "xyz")));      // length only
    EXPECT_FALSE(cmp.equivalent(base, okResponse(404, "x")));
}

TEST(ResponseComparatorTest, AndLogicNeedsEverySignal) {
    ComparatorConfig c;
    c.lengthTolerance = 0.0;
    ResponseComparator cmp{c};
    auto base = okResponse(200, "abc");

    EXPECT_TRUE(cmp.equivalent(base, okResponse(200, "xyz")));
    EXPECT_FALSE(cmp.equivalent(base, okResponse(200, "abcdef")));
    EXPECT_FALSE(cmp.equivalent(base, okResponse(404, "abc")));
}
