#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "compare/ResponseComparator.hpp"
#include "core/BodyCodec.hpp"
#include "core/MinimizationOutcome.hpp"
#include "core/RequestRecord.hpp"
#include "core/ResponseSnapshot.hpp"
#include "transport/Transport.hpp"
#include "utils/Config.hpp"

class ExchangeLog;
class HeaderSelector;

struct MinimizationRun {
    ResponseSnapshot baseline;
    MinimizationOutcome outcome;
};

// Per-request state machine:
//   baseline -> header/body reduction (configured order) -> cross-validation
//   -> fallback cascade -> optional blank-value refinement.
//
// One request is processed start to finish by one call; several calls may run
// concurrently as long as the transport and the exchange log are thread-safe.
class RequestMinimizer {
public:
    RequestMinimizer(const Config& config,
                     Transport& transport,
                     const ResponseComparator& comparator,
                     ExchangeLog* exchangeLog = nullptr);
    ~RequestMinimizer();

    MinimizationRun minimize(const RequestRecord& request) const;

private:
    struct RequestState {
        HeaderList headers;
        std::optional<std::string> body;
    };

    // A request that the oracle accepted, with the response that proved it.
    struct AcceptedState {
        HeaderList headers;
        std::optional<std::string> body;
        ResponseSnapshot response;
    };

    struct PhaseReport {
        std::size_t candidates = 0;
        int testsUsed = 0;
        std::optional<AcceptedState> lastAccepted;
    };

    struct Probe {
        ResponseSnapshot response;
        bool equivalent = false;
    };

    PhaseReport reduceHeaders(const RequestRecord& request,
                              const ResponseSnapshot& baseline,
                              RequestState& state,
                              int budget) const;

    PhaseReport reduceBody(const RequestRecord& request,
                           const ResponseSnapshot& baseline,
                           BodyKind kind,
                           RequestState& state,
                           int budget) const;

    std::optional<AcceptedState> refineBlankValues(const RequestRecord& request,
                                                   const ResponseSnapshot& baseline,
                                                   BodyKind kind,
                                                   const HeaderList& headers,
                                                   const std::optional<std::string>& body) const;

    Probe probe(const RequestRecord& request,
                const char* phase,
                const ResponseSnapshot& baseline,
                const HeaderList& headers,
                const std::optional<std::string>& body) const;

    void record(const RequestRecord& request,
                const char* phase,
                const ResponseSnapshot& response,
                bool equivalent) const;

    const Config& config_;
    Transport& transport_;
    const ResponseComparator& comparator_;
    ExchangeLog* exchangeLog_;
    std::unique_ptr<HeaderSelector> headerSelector_;
};
