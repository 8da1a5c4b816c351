#include "minimize/RequestMinimizer.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "minimize/CandidateSelection.hpp"
#include "monitor/ExchangeLog.hpp"
#include "monitor/Log.hpp"
#include "reduce/DeltaDebugger.hpp"

RequestMinimizer::RequestMinimizer(const Config& config,
                                   Transport& transport,
                                   const ResponseComparator& comparator,
                                   ExchangeLog* exchangeLog)
    : config_(config),
      transport_(transport),
      comparator_(comparator),
      exchangeLog_(exchangeLog),
      headerSelector_(std::make_unique<HeaderSelector>(config.minimization.headers)) {}

RequestMinimizer::~RequestMinimizer() = default;

// =======================
//  Entry point
// =======================
MinimizationRun RequestMinimizer::minimize(const RequestRecord& request) const {
    LOGX(LogLevel::Info, "Minimizer", "Processing request #" << request.index
         << " " << request.method << " " << request.url);

    MinimizationRun run;
    MinimizationOutcome& out = run.outcome;

    // -------- 1. Baseline --------
    run.baseline = transport_.exchange(request, request.headers, request.body);
    record(request, "baseline", run.baseline, run.baseline.healthy());
    const ResponseSnapshot& baseline = run.baseline;

    if (!baseline.healthy()) {
        LOGX(LogLevel::Warn, "Minimizer", "Baseline failed for request #" << request.index
             << ": " << baseline.error.value_or("no status"));
        out.headers = request.headers;
        out.body = request.body;
        out.response = baseline;
        out.matched = false;
        out.headerCandidates = request.headers.size();
        out.bodyCandidates = 0;
        out.finalHeaderCount = request.headers.size();
        out.finalBodyFieldCount = 0;
        return run;
    }

    const MinimizationConfig& m = config_.minimization;
    const BodyKind kind = resolveBodyKind(request.contentType, m.body.mode);

    // -------- 2/3. Reduction phases --------
    RequestState state{request.headers, request.body};
    int remaining = std::max(0, config_.maxRoundsPerRequest);
    std::vector<PhaseReport> reports;   // execution order

    for (Phase phase : m.order) {
        PhaseReport report;
        if (phase == Phase::Headers) {
            if (!m.headers.enabled) continue;
            report = reduceHeaders(request, baseline, state, remaining);
            out.headerCandidates = report.candidates;
        } else {
            if (!m.body.enabled) continue;
            report = reduceBody(request, baseline, kind, state, remaining);
            out.bodyCandidates = report.candidates;
        }
        remaining = std::max(0, remaining - report.testsUsed);
        reports.push_back(std::move(report));
    }

    // -------- 4. Cross-validation --------
    Probe verify = probe(request, "verify", baseline, state.headers, state.body);
    out.headers = std::move(state.headers);
    out.body = std::move(state.body);
    out.response = std::move(verify.response);
    out.matched = verify.equivalent;

    // -------- 5. Fallback cascade --------
    // The phases were reduced one after the other and may not compose; the
    // later phase's accepted state already contains the earlier reduction.
    if (!out.matched) {
        LOGX(LogLevel::Info, "Minimizer", "Cross-validation failed for request #" << request.index
             << ", trying fallbacks");

        bool adopted = false;
        for (auto it = reports.rbegin(); it != reports.rend(); ++it) {
            if (it->lastAccepted && comparator_.equivalent(baseline, it->lastAccepted->response)) {
                out.headers = it->lastAccepted->headers;
                out.body = it->lastAccepted->body;
                out.response = it->lastAccepted->response;
                out.matched = true;
                adopted = true;
                break;
            }
        }

        if (!adopted) {
            LOGX(LogLevel::Info, "Minimizer", "Falling back to the original request #" << request.index);
            out.headers = request.headers;
            out.body = request.body;
            out.response = baseline;
            out.matched = comparator_.equivalent(baseline, baseline);
        }
    }

    // -------- 6. Blank-value refinement --------
    if (out.matched && m.body.tryBlankValues) {
        if (auto refined = refineBlankValues(request, baseline, kind, out.headers, out.body)) {
            out.body = std::move(refined->body);
            out.response = std::move(refined->response);
            out.matched = comparator_.equivalent(baseline, out.response);
        }
    }

    out.finalHeaderCount = out.headers.size();
    out.finalBodyFieldCount = countBodyFields(kind, out.body);

    LOGX(LogLevel::Info, "Minimizer", "Request #" << request.index
         << " headers " << request.headers.size() << " -> " << out.finalHeaderCount
         << ", body fields " << countBodyFields(kind, request.body) << " -> " << out.finalBodyFieldCount
         << ", matched=" << (out.matched ? "yes" : "no"));
    return run;
}

// =======================
//  Header phase
// =======================
RequestMinimizer::PhaseReport RequestMinimizer::reduceHeaders(const RequestRecord& request,
                                                              const ResponseSnapshot& baseline,
                                                              RequestState& state,
                                                              int budget) const {
    PhaseReport report;
    const CandidateSplit split = headerSelector_->split(state.headers);
    report.candidates = split.candidates.size();
    if (split.candidates.empty()) {
        LOGX(LogLevel::Debug, "Headers", "Request #" << request.index << ": no candidate headers");
        return report;
    }

    const HeaderList source = state.headers;
    const std::optional<std::string> body = state.body;

    auto reduced = ddminTracked<AcceptedState>(
        split.candidates,
        [&](const std::vector<std::size_t>& kept) -> std::optional<AcceptedState> {
            HeaderList headers = assembleHeaders(source, split, kept);
            Probe p = probe(request, "headers", baseline, headers, body);
            if (!p.equivalent) return std::nullopt;
            return AcceptedState{std::move(headers), body, std::move(p.response)};
        },
        budget);

    report.testsUsed = reduced.testsUsed;
    report.lastAccepted = std::move(reduced.lastAccepted);
    state.headers = assembleHeaders(source, split, reduced.items);

    LOGX(LogLevel::Info, "Headers", "Request #" << request.index << ": kept "
         << reduced.items.size() << "/" << split.candidates.size()
         << " candidates in " << reduced.testsUsed << " tests");
    return report;
}

// =======================
//  Body phase
// =======================
RequestMinimizer::PhaseReport RequestMinimizer::reduceBody(const RequestRecord& request,
                                                           const ResponseSnapshot& baseline,
                                                           BodyKind kind,
                                                           RequestState& state,
                                                           int budget) const {
    PhaseReport report;
    const BodyPolicy& policy = config_.minimization.body;

    const std::optional<BodyFields> fields = decodeBody(kind, state.body);
    if (!fields || fields->empty()) {
        LOGX(LogLevel::Debug, "Body", "Request #" << request.index << ": "
             << bodyKindName(kind) << " body not reducible, skipped");
        return report;
    }

    const CandidateSplit split = splitBodyFields(*fields, policy);
    report.candidates = split.candidates.size();
    if (split.candidates.empty()) return report;

    const DropMode drop = policy.treatEmptyAsAbsent ? DropMode::Omit : DropMode::Blank;
    const HeaderList headers = state.headers;

    auto reduced = ddminTracked<AcceptedState>(
        split.candidates,
        [&](const std::vector<std::size_t>& kept) -> std::optional<AcceptedState> {
            std::string text = encodeBody(kind, assembleFields(*fields, split, kept, drop));
            Probe p = probe(request, "body", baseline, headers, text);
            if (!p.equivalent) return std::nullopt;
            return AcceptedState{headers, std::move(text), std::move(p.response)};
        },
        budget);

    report.testsUsed = reduced.testsUsed;
    report.lastAccepted = std::move(reduced.lastAccepted);

    // untouched bodies keep their captured text
    if (reduced.items.size() < split.candidates.size()) {
        state.body = encodeBody(kind, assembleFields(*fields, split, reduced.items, drop));
    }

    LOGX(LogLevel::Info, "Body", "Request #" << request.index << ": kept "
         << reduced.items.size() << "/" << split.candidates.size()
         << " " << bodyKindName(kind) << " fields in " << reduced.testsUsed << " tests");
    return report;
}

// =======================
//  Refinement
// =======================
std::optional<RequestMinimizer::AcceptedState>
RequestMinimizer::refineBlankValues(const RequestRecord& request,
                                    const ResponseSnapshot& baseline,
                                    BodyKind kind,
                                    const HeaderList& headers,
                                    const std::optional<std::string>& body) const {
    if (kind == BodyKind::Raw || !body || body->empty()) return std::nullopt;

    const std::optional<BodyFields> fields = decodeBody(kind, body);
    if (!fields || fields->empty()) return std::nullopt;

    const CandidateSplit split = splitBodyFields(*fields, config_.minimization.body);
    if (split.candidates.empty()) return std::nullopt;

    // kept = fields that retain their value; the rest are sent blank
    auto reduced = ddmin(
        split.candidates,
        [&](const std::vector<std::size_t>& kept) {
            std::string text = encodeBody(kind, assembleFields(*fields, split, kept, DropMode::Blank));
            return probe(request, "refine", baseline, headers, text).equivalent;
        },
        std::nullopt);

    std::string text = encodeBody(kind, assembleFields(*fields, split, reduced.items, DropMode::Blank));
    Probe confirm = probe(request, "confirm", baseline, headers, text);

    LOGX(LogLevel::Info, "Refine", "Request #" << request.index << ": "
         << (split.candidates.size() - reduced.items.size()) << " values blanked, confirmation "
         << (confirm.equivalent ? "passed" : "failed"));

    if (!confirm.equivalent || text == *body) return std::nullopt;
    return AcceptedState{headers, std::move(text), std::move(confirm.response)};
}

// =======================
//  Exchanges
// =======================
RequestMinimizer::Probe RequestMinimizer::probe(const RequestRecord& request,
                                                const char* phase,
                                                const ResponseSnapshot& baseline,
                                                const HeaderList& headers,
                                                const std::optional<std::string>& body) const {
    Probe p;
    p.response = transport_.exchange(request, headers, body);
    p.equivalent = comparator_.equivalent(baseline, p.response);
    record(request, phase, p.response, p.equivalent);
    return p;
}

void RequestMinimizer::record(const RequestRecord& request,
                              const char* phase,
                              const ResponseSnapshot& response,
                              bool equivalent) const {
    LOGX(LogLevel::Debug, "Exchange", "#" << request.index << " " << phase << " -> "
         << (response.statusCode ? std::to_string(*response.statusCode) : std::string("ERR"))
         << " len=" << response.size() << (equivalent ? " ok" : " differs"));

    if (!exchangeLog_) return;

    ExchangeRecord e;
    e.timestamp = ExchangeLog::nowIso8601();
    e.request_index = request.index;
    e.phase = phase;
    e.status = response.statusCode;
    e.length = response.size();
    e.elapsed_ms = response.elapsedMs;
    e.equivalent = equivalent;
    e.error = response.error.value_or("");
    exchangeLog_->log(e);
}
