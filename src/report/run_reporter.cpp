#include "run_reporter.h"
#include <sstream>

namespace report {

std::string RunSummary::to_string() const {
    std::ostringstream oss;
    oss << "Compared: " << completed
        << ", skipped: " << skipped
        << ", inconclusive: " << inconclusive
        << ", findings: " << findings;
    return oss.str();
}

RunReporter::RunReporter(Console& console, logging::AuditChain* audit, const Options& opts)
    : console_(console),
      audit_(audit),
      opts_(opts),
      progress_(console),
      presenter_(console),
      last_current_(0),
      audit_failed_(false)
{}

template <typename Write>
void RunReporter::audit(Write write) {
    if (!audit_ || audit_failed_) {
        return;
    }

    bool ok = false;
    try {
        ok = write(*audit_);
    } catch (const std::exception& e) {
        console_.log(std::string("Warning: audit log write failed: ") + e.what());
    }
    if (!ok) {
        audit_failed_ = true;
        console_.log("Warning: could not write to audit log, further events are dropped");
    }
}

void RunReporter::on_outcome(const ComparisonOutcome& outcome, size_t current, size_t total) {
    last_current_ = current;
    progress_.on_progress(current, total);

    switch (outcome.kind) {
        case OutcomeKind::SKIPPED:
            summary_.skipped++;
            return;
        case OutcomeKind::INCONCLUSIVE:
            summary_.inconclusive++;
            if (opts_.verbose) {
                console_.log("Inconclusive: " + outcome.endpoint + " [" + outcome.method + "]: " + outcome.error());
            }
            audit([&](logging::AuditChain& log) { return log.record_inconclusive(outcome); });
            return;
        case OutcomeKind::COMPLETED:
            summary_.completed++;
            break;
    }

    auto finding = presenter_.on_outcome(outcome);
    if (finding) {
        summary_.findings++;
        audit([&](logging::AuditChain& log) { return log.record_finding(*finding); });
        findings_.push_back(std::move(*finding));
    }
}

void RunReporter::finish() {
    console_.finish();
    if (opts_.verbose) {
        console_.log(summary_.to_string());
    }
}

} // namespace report
