#pragma once
#include "console.h"
#include <string>

namespace report {

// Renders `Progress: [#####-----] NN.N%` for every delivered outcome.
class ProgressReporter {
public:
    static constexpr size_t kWidth = 50;

    explicit ProgressReporter(Console& console);

    void on_progress(size_t current, size_t total);

    /**
     * @brief Format the progress line
     * @param current Outcomes delivered so far
     * @param total Outcomes expected; 0 renders as complete
     * @param width Bar width in characters
     * @return Progress line without carriage return
     */
    static std::string render(size_t current, size_t total, size_t width = kWidth);

private:
    Console& console_;
};

} // namespace report
