#pragma once
#include "console.h"
#include "progress_reporter.h"
#include "finding_presenter.h"
#include "core/scheduler.h"
#include "logging/chain.h"
#include <schema/finding.h>
#include <string>
#include <vector>

namespace report {

// Counts per outcome kind over one run.
struct RunSummary {
    size_t completed = 0;
    size_t skipped = 0;
    size_t inconclusive = 0;
    size_t findings = 0;

    size_t total() const { return completed + skipped + inconclusive; }
    std::string to_string() const;
};

// Outcome sink driving the live console: every outcome advances the
// progress bar, matching outcomes print a finding block. Inconclusive
// outcomes stay silent unless `verbose` is set.
class RunReporter : public OutcomeSink {
public:
    struct Options {
        bool verbose;

        Options() : verbose(false) {}
    };

    /**
     * @brief Create a reporter writing to a console
     * @param console Live console shared by progress and findings
     * @param audit Optional audit log, may be null
     * @param opts Reporter options
     */
    RunReporter(Console& console, logging::AuditChain* audit, const Options& opts = Options());

    void on_outcome(const ComparisonOutcome& outcome, size_t current, size_t total) override;

    /// Close the progress line and print the end-of-run output.
    void finish();

    const RunSummary& summary() const { return summary_; }
    const std::vector<Finding>& findings() const { return findings_; }
    size_t last_progress() const { return last_current_; }

private:
    Console& console_;
    logging::AuditChain* audit_;
    Options opts_;
    ProgressReporter progress_;
    FindingPresenter presenter_;
    RunSummary summary_;
    std::vector<Finding> findings_;
    size_t last_current_;
    bool audit_failed_;

    // Run one audit write; a false return or an exception disables the log.
    template <typename Write>
    void audit(Write write);
};

} // namespace report
