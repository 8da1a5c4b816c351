#pragma once
#include <cstddef>
#include <optional>
#include <string>

#include "core/RequestRecord.hpp"

struct ResponseSnapshot {
    std::optional<int> statusCode;
    std::optional<std::string> body;
    double elapsedMs = 0.0;
    std::optional<std::string> error;
    HeaderList headers;

    bool healthy() const { return !error && statusCode.has_value(); }

    std::size_t size() const { return body ? body->size() : 0; }
};
