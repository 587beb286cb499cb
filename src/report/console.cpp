/**
 * @file console.cpp
 * @brief Progress line handling and colored block output
 */

#include "console.h"

namespace report {

static const char* kClearLine = "\r\033[K";
static const char* kReset = "\033[0m";

Console::Console(std::ostream& out, std::ostream& err, bool color)
    : out_(out), err_(err), color_(color)
{}

const char* Console::ansi(Color c) {
    switch (c) {
        case Color::GREEN:  return "\033[32m";
        case Color::YELLOW: return "\033[33m";
        case Color::RED:    return "\033[31m";
        case Color::NONE:   return "";
    }
    return "";
}

void Console::clear_line() {
    if (!progress_.empty()) {
        out_ << kClearLine;
    }
}

void Console::redraw() {
    if (!progress_.empty()) {
        out_ << "\r" << progress_;
    }
    out_.flush();
}

void Console::draw_progress(const std::string& line) {
    progress_ = line;
    out_ << "\r" << progress_;
    out_.flush();
}

void Console::print_block(const std::vector<Line>& lines) {
    clear_line();
    for (const auto& [color, text] : lines) {
        if (color_ && color != Color::NONE) {
            out_ << ansi(color) << text << kReset << "\n";
        } else {
            out_ << text << "\n";
        }
    }
    redraw();
}

void Console::log(const std::string& line) {
    clear_line();
    out_.flush();
    err_ << line << "\n";
    err_.flush();
    redraw();
}

void Console::finish() {
    if (!progress_.empty()) {
        out_ << kClearLine;
        progress_.clear();
    }
    out_ << "Done.\n";
    out_.flush();
}

} // namespace report
