#include "core/BodyCodec.hpp"

#include <algorithm>
#include <cctype>

#include "utils/UrlCodec.hpp"

using ordered_json = nlohmann::ordered_json;

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

const char* bodyKindName(BodyKind kind) {
    switch (kind) {
        case BodyKind::Json: return "json";
        case BodyKind::Form: return "form";
        case BodyKind::Raw:  return "raw";
    }
    return "raw";
}

BodyKind resolveBodyKind(const std::optional<std::string>& contentType, BodyMode mode) {
    if (mode == BodyMode::Json) return BodyKind::Json;
    if (mode == BodyMode::Form) return BodyKind::Form;

    const std::string mime = lower(contentType.value_or(""));
    if (mime.find("json") != std::string::npos) return BodyKind::Json;
    if (mime.find("x-www-form-urlencoded") != std::string::npos) return BodyKind::Form;
    return BodyKind::Raw;
}

std::optional<BodyFields> decodeBody(BodyKind kind, const std::optional<std::string>& text) {
    const std::string body = text.value_or("");
    BodyFields fields;

    switch (kind) {
        case BodyKind::Json: {
            if (body.empty()) return fields;

            ordered_json parsed = ordered_json::parse(body, nullptr, false);
            if (parsed.is_discarded() || !parsed.is_object()) {
                return std::nullopt;
            }
            for (auto it = parsed.begin(); it != parsed.end(); ++it) {
                fields.push_back(BodyField{it.key(), it.value()});
            }
            return fields;
        }
        case BodyKind::Form: {
            for (auto& kv : parseQueryString(body, true)) {
                fields.push_back(BodyField{std::move(kv.first), ordered_json(std::move(kv.second))});
            }
            return fields;
        }
        case BodyKind::Raw:
            break;
    }
    return std::nullopt;
}

std::string encodeBody(BodyKind kind, const BodyFields& fields) {
    if (kind == BodyKind::Form) {
        QueryPairs pairs;
        pairs.reserve(fields.size());
        for (const auto& f : fields) {
            pairs.emplace_back(f.key, f.value.is_string() ? f.value.get<std::string>() : f.value.dump());
        }
        return buildQueryString(pairs);
    }

    ordered_json obj = ordered_json::object();
    for (const auto& f : fields) {
        obj[f.key] = f.value;
    }
    return obj.dump(-1, ' ', false, ordered_json::error_handler_t::replace);
}

std::size_t countBodyFields(BodyKind kind, const std::optional<std::string>& text) {
    if (!text || text->empty()) return 0;
    auto fields = decodeBody(kind, text);
    return fields ? fields->size() : 0;
}
