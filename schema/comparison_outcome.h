#pragma once
#include <string>

/**
 * @file comparison_outcome.h
 * @brief Result of a single probe and of a paired comparison
 *
 * A probe is one HTTP request/response cycle. A comparison pairs the probes
 * of one endpoint and method under the two authentication contexts.
 */

// Result of one HTTP request. `ok == false` means the probe could not be
// completed (network error, timeout, malformed URL) and is inconclusive.
struct ProbeOutcome {
    bool ok;
    long status;
    size_t body_size;
    std::string error;

    ProbeOutcome()
        : ok(false),
          status(0),
          body_size(0)
    {}

    static ProbeOutcome completed(long status, size_t body_size) {
        ProbeOutcome p;
        p.ok = true;
        p.status = status;
        p.body_size = body_size;
        return p;
    }

    static ProbeOutcome inconclusive(const std::string& error) {
        ProbeOutcome p;
        p.error = error;
        return p;
    }
};

enum class OutcomeKind {
    COMPLETED,      // Both contexts probed successfully
    SKIPPED,        // Static asset, no request issued
    INCONCLUSIVE    // One of the probes failed
};

struct ComparisonOutcome {
    OutcomeKind kind;
    std::string endpoint;
    std::string method;
    ProbeOutcome probe_a;
    ProbeOutcome probe_b;
    std::string label_a;
    std::string label_b;

    ComparisonOutcome() : kind(OutcomeKind::INCONCLUSIVE) {}

    bool completed() const { return kind == OutcomeKind::COMPLETED; }
    bool skipped() const { return kind == OutcomeKind::SKIPPED; }
    bool inconclusive() const { return kind == OutcomeKind::INCONCLUSIVE; }

    /// Error of the probe that made this comparison inconclusive, if any.
    const std::string& error() const {
        return probe_a.ok ? probe_b.error : probe_a.error;
    }
};

inline const char* to_string(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::COMPLETED:    return "completed";
        case OutcomeKind::SKIPPED:      return "skipped";
        case OutcomeKind::INCONCLUSIVE: return "inconclusive";
    }
    return "unknown";
}
