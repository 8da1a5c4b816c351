#include "reduce/DeltaDebugger.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

static std::vector<int> range(int n) {
    std::vector<int> v;
    for (int i = 0; i < n; ++i) v.push_back(i);
    return v;
}

static bool contains(const std::vector<int>& v, int x) {
    return std::find(v.begin(), v.end(), x) != v.end();
}

TEST(DeltaDebuggerTest, EmptyInputUsesNoTests) {
    int calls = 0;
    auto result = ddmin(std::vector<int>{}, [&](const std::vector<int>&) { ++calls; return true; }, std::nullopt);
    EXPECT_TRUE(result.items.empty());
    EXPECT_EQ(result.testsUsed, 0);
    EXPECT_EQ(calls, 0);
}

TEST(DeltaDebuggerTest, NonPositiveBudgetIsNoOp) {
    int calls = 0;
    auto pred = [&](const std::vector<int>&) { ++calls; return true; };

    auto zero = ddmin(range(5), pred, 0);
    EXPECT_EQ(zero.items, range(5));
    EXPECT_EQ(zero.testsUsed, 0);

    auto negative = ddmin(range(5), pred, -3);
    EXPECT_EQ(negative.items, range(5));
    EXPECT_EQ(calls, 0);
}

TEST(DeltaDebuggerTest, AlwaysTrueReducesToEmpty) {
    auto result = ddmin(range(8), [](const std::vector<int>&) { return true; }, std::nullopt);
    EXPECT_TRUE(result.items.empty());
    // every call removes something, so no more calls than elements
    EXPECT_LE(result.testsUsed, 8);
}

TEST(DeltaDebuggerTest, AlwaysFalseKeepsEverything) {
    int calls = 0;
    auto result = ddmin(range(4), [&](const std::vector<int>&) { ++calls; return false; }, std::nullopt);
    EXPECT_EQ(result.items, range(4));
    // n = 2 (2 chunks) then n = 4 (4 chunks)
    EXPECT_EQ(result.testsUsed, 6);
    EXPECT_EQ(calls, 6);
}

TEST(DeltaDebuggerTest, AlwaysFalseStopsAtBudget) {
    auto result = ddmin(range(16), [](const std::vector<int>&) { return false; }, 5);
    EXPECT_EQ(result.items, range(16));
    EXPECT_EQ(result.testsUsed, 5);
}

TEST(DeltaDebuggerTest, FindsSingleRequiredElement) {
    auto result = ddmin(range(10), [](const std::vector<int>& v) { return contains(v, 7); }, std::nullopt);
    EXPECT_EQ(result.items, std::vector<int>{7});
}

TEST(DeltaDebuggerTest, KeepsScatteredRequiredElementsInOrder) {
    auto result = ddmin(range(12), [](const std::vector<int>& v) {
        return contains(v, 1) && contains(v, 6) && contains(v, 11);
    }, std::nullopt);
    EXPECT_EQ(result.items, (std::vector<int>{1, 6, 11}));
}

TEST(DeltaDebuggerTest, BudgetExhaustionKeepsPartialProgress) {
    auto result = ddmin(range(8), [](const std::vector<int>& v) { return contains(v, 7); }, 1);
    // first test drops the first half
    EXPECT_EQ(result.testsUsed, 1);
    EXPECT_EQ(result.items, (std::vector<int>{4, 5, 6, 7}));
}

TEST(DeltaDebuggerTest, AlreadyMinimalInputIsUnchanged) {
    auto pred = [](const std::vector<int>& v) { return contains(v, 2) && contains(v, 5); };
    auto first = ddmin(std::vector<int>{2, 5}, pred, std::nullopt);
    EXPECT_EQ(first.items, (std::vector<int>{2, 5}));

    auto again = ddmin(first.items, pred, std::nullopt);
    EXPECT_EQ(again.items, first.items);
}

TEST(DeltaDebuggerTest, PredicateSeesSubsequencesOnly) {
    std::vector<std::string> input{"a", "b", "c", "d", "e"};
    auto result = ddmin(input, [&](const std::vector<std::string>& v) {
        // must be an order-preserving subsequence of input
        auto it = input.begin();
        for (const auto& s : v) {
            it = std::find(it, input.end(), s);
            if (it == input.end()) ADD_FAILURE() << "not a subsequence";
        }
        return std::find(v.begin(), v.end(), "d") != v.end();
    }, std::nullopt);
    EXPECT_EQ(result.items, std::vector<std::string>{"d"});
}

TEST(DeltaDebuggerTest, TrackedReductionKeepsLastAcceptedArtifact) {
    int accepted = 0;
    auto result = ddminTracked<std::string>(range(6), [&](const std::vector<int>& v) -> std::optional<std::string> {
        if (!contains(v, 4)) return std::nullopt;
        ++accepted;
        return "size=" + std::to_string(v.size());
    }, std::nullopt);

    EXPECT_EQ(result.items, std::vector<int>{4});
    ASSERT_TRUE(result.lastAccepted.has_value());
    EXPECT_EQ(*result.lastAccepted, "size=1");
    EXPECT_GT(accepted, 0);
}

TEST(DeltaDebuggerTest, TrackedReductionWithoutAcceptanceHasNoArtifact) {
    auto result = ddminTracked<int>(range(3), [](const std::vector<int>&) -> std::optional<int> {
        return std::nullopt;
    }, std::nullopt);
    EXPECT_EQ(result.items, range(3));
    EXPECT_FALSE(result.lastAccepted.has_value());
}
