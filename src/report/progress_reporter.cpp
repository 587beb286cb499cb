#include "progress_reporter.h"
#include <cstdio>

namespace report {

ProgressReporter::ProgressReporter(Console& console)
    : console_(console)
{}

std::string ProgressReporter::render(size_t current, size_t total, size_t width) {
    double fraction = total == 0 ? 1.0 : static_cast<double>(current) / static_cast<double>(total);
    if (fraction > 1.0) fraction = 1.0;
    size_t filled = static_cast<size_t>(static_cast<double>(width) * fraction);

    std::string line = "Progress: [";
    line.append(filled, '#');
    line.append(width - filled, '-');

    char pct[16];
    std::snprintf(pct, sizeof(pct), "] %.1f%%", fraction * 100.0);
    line += pct;
    return line;
}

void ProgressReporter::on_progress(size_t current, size_t total) {
    console_.draw_progress(render(current, total));
}

} // namespace report
