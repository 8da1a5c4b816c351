#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

struct HeaderEntry {
    std::string name;
    std::string value;

    bool operator==(const HeaderEntry& other) const {
        return name == other.name && value == other.value;
    }
    bool operator!=(const HeaderEntry& other) const { return !(*this == other); }
};

using HeaderList = std::vector<HeaderEntry>;

// One request taken from the capture. Never mutated after loading:
// minimization works on copies of headers/body.
struct RequestRecord {
    std::size_t index{};           // position in log.entries
    std::string method = "GET";
    std::string url;
    std::string path;
    std::map<std::string, std::vector<std::string>> query;

    HeaderList headers;            // duplicates allowed, capture order
    std::optional<std::string> body;
    std::optional<std::string> contentType;

    // Owned by HarLoader; null for records built in memory.
    const nlohmann::ordered_json* rawEntry = nullptr;
};
