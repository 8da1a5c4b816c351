#pragma once
#include <algorithm>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

// Chunked delta debugging (ddmin) over an ordered collection.
//
// The predicate receives the collection with one contiguous chunk removed and
// answers whether that remainder still has the property. Granularity starts
// at 2 chunks; a successful removal lowers it by one (floor 2), a pass with no
// success doubles it until every chunk is a single element.
//
// budget: maximum predicate calls. std::nullopt = unbounded, <= 0 = no-op.
// Budget exhaustion returns the current (partially reduced) collection.

template <typename T>
struct ReductionResult {
    std::vector<T> items;
    int testsUsed = 0;
};

// Reduction whose predicate yields an artifact on acceptance. The artifact of
// the most recent accepted call is kept in lastAccepted.
template <typename T, typename Artifact>
struct TrackedReduction {
    std::vector<T> items;
    int testsUsed = 0;
    std::optional<Artifact> lastAccepted;
};

template <typename T, typename Predicate>
ReductionResult<T> ddmin(std::vector<T> items, Predicate&& test, std::optional<int> budget) {
    ReductionResult<T> result;
    result.items = std::move(items);

    std::vector<T>& collection = result.items;
    if (collection.empty()) return result;
    if (budget && *budget <= 0) return result;

    std::size_t n = 2;
    while (!collection.empty()) {
        const std::size_t len = collection.size();
        const std::size_t chunk = (len + n - 1) / n;
        bool removed = false;

        for (std::size_t start = 0; start < len; start += chunk) {
            if (budget && result.testsUsed >= *budget) {
                return result;
            }

            const std::size_t end = std::min(start + chunk, len);
            std::vector<T> remainder;
            remainder.reserve(len - (end - start));
            remainder.insert(remainder.end(), collection.begin(), collection.begin() + start);
            remainder.insert(remainder.end(), collection.begin() + end, collection.end());

            ++result.testsUsed;
            if (test(static_cast<const std::vector<T>&>(remainder))) {
                collection = std::move(remainder);
                n = std::max<std::size_t>(n - 1, 2);
                removed = true;
                break;
            }
        }

        if (!removed) {
            if (n >= collection.size()) break;
            n = std::min(collection.size(), n * 2);
        }
    }
    return result;
}

template <typename Artifact, typename T, typename Predicate>
TrackedReduction<T, Artifact> ddminTracked(std::vector<T> items,
                                           Predicate&& probe,
                                           std::optional<int> budget) {
    TrackedReduction<T, Artifact> tracked;

    auto reduced = ddmin(
        std::move(items),
        [&](const std::vector<T>& remainder) {
            std::optional<Artifact> artifact = probe(remainder);
            if (!artifact) return false;
            tracked.lastAccepted = std::move(artifact);
            return true;
        },
        budget);

    tracked.items = std::move(reduced.items);
    tracked.testsUsed = reduced.testsUsed;
    return tracked;
}
