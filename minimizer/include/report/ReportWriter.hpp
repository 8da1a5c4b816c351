#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/MinimizationOutcome.hpp"

class ReportWriter {
public:
    explicit ReportWriter(std::string path);

    // Throws std::runtime_error if the report cannot be written.
    void write(const std::vector<ProcessedRequest>& processed) const;

    static nlohmann::ordered_json toJson(const ProcessedRequest& item);

private:
    std::string path_;
};
