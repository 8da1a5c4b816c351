#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "core/BodyCodec.hpp"
#include "core/RequestRecord.hpp"
#include "utils/Config.hpp"

namespace re2 {
class RE2;
}

// Positions of the entries eligible for removal and of the ones that must
// be sent unchanged. The two sets never overlap.
struct CandidateSplit {
    std::vector<std::size_t> candidates;
    std::vector<std::size_t> fixed;
};

class HeaderSelector {
public:
    // Throws std::invalid_argument for an invalid candidate_regex.
    explicit HeaderSelector(const HeaderPolicy& policy);
    ~HeaderSelector();

    HeaderSelector(const HeaderSelector&) = delete;
    HeaderSelector& operator=(const HeaderSelector&) = delete;

    CandidateSplit split(const HeaderList& headers) const;

private:
    bool isCandidate(const std::string& lowerName) const;

    std::unordered_set<std::string> protected_;
    std::unordered_set<std::string> ignored_;
    std::vector<std::unique_ptr<re2::RE2>> allow_;
};

CandidateSplit splitBodyFields(const BodyFields& fields, const BodyPolicy& policy);

// How a candidate left out of the kept set is rendered.
enum class DropMode { Omit, Blank };

// Fixed entries plus the kept candidates, in original order.
HeaderList assembleHeaders(const HeaderList& all,
                           const CandidateSplit& split,
                           const std::vector<std::size_t>& kept);

BodyFields assembleFields(const BodyFields& all,
                          const CandidateSplit& split,
                          const std::vector<std::size_t>& kept,
                          DropMode mode);
