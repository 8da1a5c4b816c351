#include "utils/UrlCodec.hpp"

#include <cctype>

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string formUnescape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi < 0 || lo < 0) {
                out.push_back(c);   // malformed escape kept literally
                continue;
            }
            out.push_back(static_cast<char>(hi * 16 + lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string formEscape(const std::string& s) {
    static const char* HEX = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '_' || c == '.' || c == '-' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
        }
    }
    return out;
}

QueryPairs parseQueryString(const std::string& qs, bool keepBlankValues) {
    QueryPairs pairs;
    std::size_t pos = 0;
    while (pos <= qs.size()) {
        std::size_t amp = qs.find('&', pos);
        if (amp == std::string::npos) amp = qs.size();

        std::string segment = qs.substr(pos, amp - pos);
        pos = amp + 1;
        if (segment.empty()) continue;

        std::string key;
        std::string value;
        auto eq = segment.find('=');
        if (eq == std::string::npos) {
            key = segment;
        } else {
            key = segment.substr(0, eq);
            value = segment.substr(eq + 1);
        }

        if (value.empty() && !keepBlankValues) continue;
        pairs.emplace_back(formUnescape(key), formUnescape(value));
    }
    return pairs;
}

std::string buildQueryString(const QueryPairs& pairs) {
    std::string out;
    for (const auto& kv : pairs) {
        if (!out.empty()) out.push_back('&');
        out += formEscape(kv.first);
        out.push_back('=');
        out += formEscape(kv.second);
    }
    return out;
}

UrlParts splitUrl(const std::string& url) {
    UrlParts parts;
    std::string rest = url;

    auto fragment = rest.find('#');
    if (fragment != std::string::npos) rest.erase(fragment);

    auto schemeEnd = rest.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = rest.substr(0, schemeEnd);
        for (auto& c : parts.scheme) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        rest = rest.substr(schemeEnd + 3);

        auto hostEnd = rest.find_first_of("/?");
        parts.host = rest.substr(0, hostEnd);
        rest = hostEnd == std::string::npos ? std::string() : rest.substr(hostEnd);
    }

    auto q = rest.find('?');
    if (q != std::string::npos) {
        parts.query = rest.substr(q + 1);
        rest.erase(q);
    }
    parts.path = rest;
    return parts;
}
