#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "utils/Config.hpp"

enum class BodyKind { Json, Form, Raw };

struct BodyField {
    std::string key;
    nlohmann::ordered_json value;   // form values are always strings
};

using BodyFields = std::vector<BodyField>;

const char* bodyKindName(BodyKind kind);

// Forced modes win; Auto looks at the declared content type only.
BodyKind resolveBodyKind(const std::optional<std::string>& contentType, BodyMode mode);

// nullopt when the body cannot be reduced field-wise: raw kind, invalid JSON,
// or JSON that is not an object. An absent/empty body decodes to no fields.
std::optional<BodyFields> decodeBody(BodyKind kind, const std::optional<std::string>& text);

// Compact JSON object or form-encoded pairs, field order kept.
std::string encodeBody(BodyKind kind, const BodyFields& fields);

std::size_t countBodyFields(BodyKind kind, const std::optional<std::string>& text);
