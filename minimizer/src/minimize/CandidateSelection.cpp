#include "minimize/CandidateSelection.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <re2/re2.h>

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

enum class Slot : char { Fixed, Dropped, Kept };

// Fixed for every position, then candidates marked dropped unless kept.
static std::vector<Slot> slotMap(std::size_t size,
                                 const CandidateSplit& split,
                                 const std::vector<std::size_t>& kept) {
    std::vector<Slot> slots(size, Slot::Fixed);
    for (std::size_t i : split.candidates) {
        if (i < size) slots[i] = Slot::Dropped;
    }
    for (std::size_t i : kept) {
        if (i < size && slots[i] == Slot::Dropped) slots[i] = Slot::Kept;
    }
    return slots;
}

// =======================
//  Headers
// =======================
HeaderSelector::HeaderSelector(const HeaderPolicy& policy) {
    for (const auto& name : policy.protectedNames) protected_.insert(lower(name));
    for (const auto& name : policy.ignoredNames) ignored_.insert(lower(name));

    RE2::Options options(RE2::Quiet);
    options.set_case_sensitive(false);
    for (const auto& expr : policy.candidateRegex) {
        auto re = std::make_unique<RE2>(expr, options);
        if (!re->ok()) {
            throw std::invalid_argument("Invalid header candidate_regex '" + expr + "': " + re->error());
        }
        allow_.push_back(std::move(re));
    }
}

HeaderSelector::~HeaderSelector() = default;

bool HeaderSelector::isCandidate(const std::string& lowerName) const {
    if (protected_.count(lowerName) || ignored_.count(lowerName)) return false;
    if (allow_.empty()) return true;
    return std::any_of(allow_.begin(), allow_.end(),
                       [&](const std::unique_ptr<RE2>& re) { return RE2::PartialMatch(lowerName, *re); });
}

CandidateSplit HeaderSelector::split(const HeaderList& headers) const {
    CandidateSplit split;
    for (std::size_t i = 0; i < headers.size(); ++i) {
        if (isCandidate(lower(headers[i].name))) {
            split.candidates.push_back(i);
        } else {
            split.fixed.push_back(i);
        }
    }
    return split;
}

HeaderList assembleHeaders(const HeaderList& all,
                           const CandidateSplit& split,
                           const std::vector<std::size_t>& kept) {
    std::vector<Slot> slots = slotMap(all.size(), split, kept);
    HeaderList out;
    for (std::size_t i = 0; i < all.size(); ++i) {
        if (slots[i] != Slot::Dropped) out.push_back(all[i]);
    }
    return out;
}

// =======================
//  Body fields
// =======================
CandidateSplit splitBodyFields(const BodyFields& fields, const BodyPolicy& policy) {
    const std::unordered_set<std::string> protectedKeys(policy.protectedKeys.begin(), policy.protectedKeys.end());
    const std::unordered_set<std::string> onlyKeys(policy.onlyKeys.begin(), policy.onlyKeys.end());

    CandidateSplit split;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        const std::string& key = fields[i].key;
        bool candidate = !protectedKeys.count(key) && (onlyKeys.empty() || onlyKeys.count(key));
        if (candidate) {
            split.candidates.push_back(i);
        } else {
            split.fixed.push_back(i);
        }
    }
    return split;
}

BodyFields assembleFields(const BodyFields& all,
                          const CandidateSplit& split,
                          const std::vector<std::size_t>& kept,
                          DropMode mode) {
    std::vector<Slot> slots = slotMap(all.size(), split, kept);
    BodyFields out;
    for (std::size_t i = 0; i < all.size(); ++i) {
        if (slots[i] != Slot::Dropped) {
            out.push_back(all[i]);
        } else if (mode == DropMode::Blank) {
            out.push_back(BodyField{all[i].key, nlohmann::ordered_json("")});
        }
    }
    return out;
}
