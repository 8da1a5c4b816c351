#include "har/RequestFilter.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <re2/re2.h>

#include "utils/UrlCodec.hpp"

static std::vector<std::unique_ptr<RE2>> compileAll(const std::vector<std::string>& exprs, const char* what) {
    std::vector<std::unique_ptr<RE2>> out;
    for (const auto& expr : exprs) {
        auto re = std::make_unique<RE2>(expr, RE2::Quiet);
        if (!re->ok()) {
            throw std::invalid_argument(std::string("Invalid ") + what + " '" + expr + "': " + re->error());
        }
        out.push_back(std::move(re));
    }
    return out;
}

static bool searchAny(const std::vector<std::unique_ptr<RE2>>& patterns, const std::string& text) {
    return std::any_of(patterns.begin(), patterns.end(),
                       [&](const std::unique_ptr<RE2>& re) { return RE2::PartialMatch(text, *re); });
}

static std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return s;
}

RequestFilter::RequestFilter(FilterConfig filter, ScopeConfig scope)
    : filter_(std::move(filter)),
      scope_(std::move(scope)),
      urlRegex_(compileAll(filter_.urlRegex, "filter url_regex")),
      scopeRegex_(compileAll(scope_.includeRegex, "scope include_regex")) {}

RequestFilter::~RequestFilter() = default;

std::vector<RequestRecord> RequestFilter::apply(const std::vector<RequestRecord>& records) const {
    std::vector<RequestRecord> out;
    for (const auto& r : records) {
        if (accepts(r)) out.push_back(r);
    }
    return out;
}

bool RequestFilter::accepts(const RequestRecord& record) const {
    return matchesFilter(record) && matchesScope(record);
}

bool RequestFilter::matchesFilter(const RequestRecord& record) const {
    if (!filter_.methods.empty()) {
        const std::string method = upper(record.method);
        bool found = std::any_of(filter_.methods.begin(), filter_.methods.end(),
                                 [&](const std::string& m) { return upper(m) == method; });
        if (!found) return false;
    }

    if (!filter_.hosts.empty()) {
        const std::string host = splitUrl(record.url).host;
        if (std::find(filter_.hosts.begin(), filter_.hosts.end(), host) == filter_.hosts.end()) {
            return false;
        }
    }

    if (!urlRegex_.empty() && !searchAny(urlRegex_, record.url)) {
        return false;
    }

    if (filter_.indexRange) {
        if (record.index < filter_.indexRange->first || record.index > filter_.indexRange->second) {
            return false;
        }
    }
    return true;
}

bool RequestFilter::matchesScope(const RequestRecord& record) const {
    if (scope_.includeUrls.empty() && scopeRegex_.empty()) return true;

    bool urlMatches = std::find(scope_.includeUrls.begin(), scope_.includeUrls.end(), record.url)
                      != scope_.includeUrls.end();
    return urlMatches || searchAny(scopeRegex_, record.url);
}
