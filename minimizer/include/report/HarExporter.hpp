#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/MinimizationOutcome.hpp"

// Rewrites a copy of the loaded HAR: matched requests get their minimized
// header list and body; everything else is left as captured.
class HarExporter {
public:
    explicit HarExporter(const nlohmann::ordered_json& rawHar);

    void apply(const std::vector<ProcessedRequest>& processed, bool includeMetadata = true);

    // Throws std::runtime_error if the file cannot be written.
    void write(const std::string& path) const;

    const nlohmann::ordered_json& document() const { return raw_; }

private:
    nlohmann::ordered_json raw_;
};
