// Paired endpoint comparison

#include "comparison_task.h"
#include <array>

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_static_asset(const std::string& endpoint) {
    static const std::array<std::string, 3> suffixes = {".js", ".map", ".svg"};

    std::string path = endpoint.substr(0, endpoint.find_first_of("?#"));
    for (const auto& suffix : suffixes) {
        if (ends_with(path, suffix)) {
            return true;
        }
    }
    return false;
}

ComparisonOutcome compare_endpoint(const Prober& prober,
                                   const std::string& endpoint,
                                   const std::string& method,
                                   const AuthContext& context_a,
                                   const AuthContext& context_b) {
    ComparisonOutcome outcome;
    outcome.endpoint = endpoint;
    outcome.method = method;
    outcome.label_a = context_a.label;
    outcome.label_b = context_b.label;

    if (is_static_asset(endpoint)) {
        outcome.kind = OutcomeKind::SKIPPED;
        return outcome;
    }

    outcome.probe_a = prober.probe(endpoint, method, context_a.headers);
    if (!outcome.probe_a.ok) {
        outcome.kind = OutcomeKind::INCONCLUSIVE;
        return outcome;
    }

    outcome.probe_b = prober.probe(endpoint, method, context_b.headers);
    outcome.kind = outcome.probe_b.ok ? OutcomeKind::COMPLETED : OutcomeKind::INCONCLUSIVE;
    return outcome;
}
