#include "compare/ResponseComparator.hpp"

#include <algorithm>
#include <stdexcept>

#include <re2/re2.h>

ResponseComparator::ResponseComparator(ComparatorConfig config)
    : config_(std::move(config)) {
    for (const auto& expr : config_.regex) {
        // ^ and $ match at line boundaries
        auto re = std::make_unique<RE2>("(?m)" + expr, RE2::Quiet);
        if (!re->ok()) {
            throw std::invalid_argument("Invalid comparator regex '" + expr + "': " + re->error());
        }
        patterns_.push_back(std::move(re));
    }
}

ResponseComparator::~ResponseComparator() = default;

bool ResponseComparator::equivalent(const ResponseSnapshot& baseline,
                                    const ResponseSnapshot& candidate) const {
    if (!baseline.healthy() || !candidate.healthy()) {
        return false;
    }

    bool anyActive = false;
    bool allPass = true;
    bool anyPass = false;

    auto check = [&](bool enabled, auto&& signal) {
        if (!enabled) return;
        bool ok = signal();
        anyActive = true;
        allPass = allPass && ok;
        anyPass = anyPass || ok;
    };

    check(config_.statusCode, [&] { return statusEqual(baseline, candidate); });
    check(config_.lengthCheck, [&] { return lengthWithin(baseline, candidate); });
    check(!config_.needAll.empty(), [&] { return needAll(candidate); });
    check(!config_.needAny.empty(), [&] { return needAny(candidate); });
    check(!patterns_.empty(), [&] { return regexMatch(candidate); });

    // nothing configured: any healthy response will do
    if (!anyActive) return true;

    return config_.logic == CombineLogic::Or ? anyPass : allPass;
}

bool ResponseComparator::statusEqual(const ResponseSnapshot& base,
                                     const ResponseSnapshot& cand) const {
    return base.statusCode == cand.statusCode;
}

bool ResponseComparator::lengthWithin(const ResponseSnapshot& base,
                                      const ResponseSnapshot& cand) const {
    const std::size_t baseLen = base.size();
    const std::size_t candLen = cand.size();
    if (baseLen == 0) {
        return candLen == 0;
    }
    const double diff = baseLen > candLen ? static_cast<double>(baseLen - candLen)
                                          : static_cast<double>(candLen - baseLen);
    return diff / static_cast<double>(baseLen) <= config_.lengthTolerance;
}

bool ResponseComparator::needAll(const ResponseSnapshot& cand) const {
    if (!cand.body) return false;
    const std::string& body = *cand.body;
    return std::all_of(config_.needAll.begin(), config_.needAll.end(),
                       [&](const std::string& token) { return body.find(token) != std::string::npos; });
}

bool ResponseComparator::needAny(const ResponseSnapshot& cand) const {
    if (!cand.body) return false;
    const std::string& body = *cand.body;
    return std::any_of(config_.needAny.begin(), config_.needAny.end(),
                       [&](const std::string& token) { return body.find(token) != std::string::npos; });
}

bool ResponseComparator::regexMatch(const ResponseSnapshot& cand) const {
    if (!cand.body) return false;
    const std::string& body = *cand.body;
    return std::all_of(patterns_.begin(), patterns_.end(),
                       [&](const std::unique_ptr<RE2>& re) { return RE2::PartialMatch(body, *re); });
}
