#pragma once
#include "console.h"
#include <schema/comparison_outcome.h>
#include <schema/finding.h>
#include <optional>
#include <string>
#include <vector>

namespace report {

// Applies the bypass detection rule to comparison outcomes and prints a
// finding block for each match. Skipped, inconclusive and non-matching
// outcomes print nothing.

class FindingPresenter {
public:
    explicit FindingPresenter(Console& console);

    /**
     * @brief Detection rule: both contexts got 200 with the same body size
     * @param outcome Comparison outcome
     * @return true for completed outcomes matching the rule
     */
    static bool is_finding(const ComparisonOutcome& outcome);

    /**
     * @brief Build the finding for an outcome
     * @param outcome Comparison outcome
     * @return Finding if the detection rule matches, empty otherwise
     */
    static std::optional<Finding> evaluate(const ComparisonOutcome& outcome);

    /// Lines of the console block for a finding, ending with a blank line.
    static std::vector<Console::Line> format(const Finding& finding);

    /**
     * @brief Print the finding for an outcome if it matches
     * @param outcome Comparison outcome
     * @return The finding that was printed, if any
     */
    std::optional<Finding> on_outcome(const ComparisonOutcome& outcome);

private:
    Console& console_;
};

} // namespace report
