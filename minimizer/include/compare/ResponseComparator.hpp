#pragma once
#include <memory>
#include <vector>

#include "core/ResponseSnapshot.hpp"
#include "utils/Config.hpp"

namespace re2 {
class RE2;
}

// Decides whether a candidate response is "the same" as the baseline.
// Stateless after construction; safe to share between worker threads.
class ResponseComparator {
public:
    // Throws std::invalid_argument if a configured regex does not compile.
    explicit ResponseComparator(ComparatorConfig config);
    ~ResponseComparator();

    ResponseComparator(const ResponseComparator&) = delete;
    ResponseComparator& operator=(const ResponseComparator&) = delete;

    bool equivalent(const ResponseSnapshot& baseline, const ResponseSnapshot& candidate) const;

private:
    bool statusEqual(const ResponseSnapshot& base, const ResponseSnapshot& cand) const;
    bool lengthWithin(const ResponseSnapshot& base, const ResponseSnapshot& cand) const;
    bool needAll(const ResponseSnapshot& cand) const;
    bool needAny(const ResponseSnapshot& cand) const;
    bool regexMatch(const ResponseSnapshot& cand) const;

    ComparatorConfig config_;
    std::vector<std::unique_ptr<re2::RE2>> patterns_;
};
