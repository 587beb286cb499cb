#pragma once
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace report {

// Live console shared by the progress bar and the finding output.
// The progress line is redrawn in place with a carriage return. Anything
// else printed while a run is active first clears that line and then
// redraws it, so blocks and log lines never end up glued to the bar.

enum class Color {
    NONE,
    GREEN,
    YELLOW,
    RED
};

class Console {
public:
    using Line = std::pair<Color, std::string>;

    /**
     * @brief Create a console over output and diagnostic streams
     * @param out Stream for the progress bar and findings (stdout)
     * @param err Stream for log lines (stderr)
     * @param color Whether to emit ANSI color codes
     */
    Console(std::ostream& out, std::ostream& err, bool color = true);

    /// Replace the current progress line with `line`.
    void draw_progress(const std::string& line);

    /// Print a block of lines between the progress redraws.
    void print_block(const std::vector<Line>& lines);

    /// Print one diagnostic line to the error stream.
    void log(const std::string& line);

    /// Clear the progress line and print the closing `Done.` marker.
    void finish();

    static const char* ansi(Color c);

private:
    std::ostream& out_;
    std::ostream& err_;
    bool color_;
    std::string progress_;

    void clear_line();
    void redraw();
};

} // namespace report
