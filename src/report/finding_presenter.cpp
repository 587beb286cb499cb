// Auth bypass detection and finding output

#include "finding_presenter.h"
#include <sstream>

namespace report {

FindingPresenter::FindingPresenter(Console& console)
    : console_(console)
{}

bool FindingPresenter::is_finding(const ComparisonOutcome& outcome) {
    if (!outcome.completed()) {
        return false;
    }
    return outcome.probe_a.status == 200 &&
           outcome.probe_b.status == 200 &&
           outcome.probe_a.body_size == outcome.probe_b.body_size;
}

std::optional<Finding> FindingPresenter::evaluate(const ComparisonOutcome& outcome) {
    if (!is_finding(outcome)) {
        return std::nullopt;
    }

    Finding f;
    f.url = outcome.endpoint;
    f.method = outcome.method;
    f.label_a = outcome.label_a;
    f.label_b = outcome.label_b;
    f.status_a = outcome.probe_a.status;
    f.status_b = outcome.probe_b.status;
    f.size_a = outcome.probe_a.body_size;
    f.size_b = outcome.probe_b.body_size;
    return f;
}

static std::string context_line(const std::string& label, long status, size_t size) {
    std::ostringstream oss;
    oss << label << ": " << status << " (" << size << " bytes)";
    return oss.str();
}

std::vector<Console::Line> FindingPresenter::format(const Finding& finding) {
    std::vector<Console::Line> lines;
    lines.emplace_back(Color::GREEN, "Potential Auth Bypass Found!");
    lines.emplace_back(Color::GREEN, "Endpoint: " + finding.url + " [" + finding.method + "]");
    lines.emplace_back(Color::YELLOW, context_line(finding.label_a, finding.status_a, finding.size_a));
    lines.emplace_back(Color::YELLOW, context_line(finding.label_b, finding.status_b, finding.size_b));
    lines.emplace_back(Color::NONE, "");
    return lines;
}

std::optional<Finding> FindingPresenter::on_outcome(const ComparisonOutcome& outcome) {
    auto finding = evaluate(outcome);
    if (finding) {
        console_.print_block(format(*finding));
    }
    return finding;
}

} // namespace report
