#pragma once
#include <string>
#include <utility>
#include <vector>

using QueryPairs = std::vector<std::pair<std::string, std::string>>;

// application/x-www-form-urlencoded helpers: '+' is a space, %XX escapes.
std::string formUnescape(const std::string& s);
std::string formEscape(const std::string& s);

// Split on '&'; "a" yields ("a", ""). Empty segments are skipped.
QueryPairs parseQueryString(const std::string& qs, bool keepBlankValues);
std::string buildQueryString(const QueryPairs& pairs);

struct UrlParts {
    std::string scheme;   // lowercase
    std::string host;     // host[:port]
    std::string path;
    std::string query;    // without '?'
};

UrlParts splitUrl(const std::string& url);
