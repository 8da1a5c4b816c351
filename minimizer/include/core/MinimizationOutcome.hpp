#pragma once
#include <cstddef>
#include <optional>
#include <string>

#include "core/RequestRecord.hpp"
#include "core/ResponseSnapshot.hpp"

struct MinimizationOutcome {
    HeaderList headers;
    std::optional<std::string> body;
    ResponseSnapshot response;
    bool matched = false;

    std::size_t headerCandidates = 0;
    std::size_t bodyCandidates = 0;
    std::size_t finalHeaderCount = 0;
    std::size_t finalBodyFieldCount = 0;
};

// Everything the reporting side needs for one request.
struct ProcessedRequest {
    RequestRecord request;
    ResponseSnapshot baseline;
    MinimizationOutcome outcome;
    std::optional<std::string> error;   // set when minimization itself failed
};
