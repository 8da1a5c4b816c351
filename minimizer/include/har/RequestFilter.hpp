#pragma once
#include <memory>
#include <string>
#include <vector>

#include "core/RequestRecord.hpp"
#include "utils/Config.hpp"

namespace re2 {
class RE2;
}

// Picks the records to minimize: every filter rule must pass, then the
// record must be in scope (an empty scope admits everything).
class RequestFilter {
public:
    // Throws std::invalid_argument for an invalid url/scope regex.
    RequestFilter(FilterConfig filter, ScopeConfig scope);
    ~RequestFilter();

    RequestFilter(const RequestFilter&) = delete;
    RequestFilter& operator=(const RequestFilter&) = delete;

    std::vector<RequestRecord> apply(const std::vector<RequestRecord>& records) const;
    bool accepts(const RequestRecord& record) const;

private:
    bool matchesFilter(const RequestRecord& record) const;
    bool matchesScope(const RequestRecord& record) const;

    FilterConfig filter_;
    ScopeConfig scope_;
    std::vector<std::unique_ptr<re2::RE2>> urlRegex_;
    std::vector<std::unique_ptr<re2::RE2>> scopeRegex_;
};
