// ============================================================
// progress_display.cpp -- Per-file progress line
// ============================================================

#include "progress_display.hpp"
#include "../common/utils.hpp"
#include <iomanip>
#include <sstream>
#include <cstdio>

#include <unistd.h>

bool ProgressDisplay::is_tty() {
    return isatty(fileno(stdout)) != 0;
}

ProgressDisplay::ProgressDisplay(std::ostream& out, bool tty)
    : out_(out)
    , tty_(tty)
{}

ProgressDisplay::~ProgressDisplay() {
    finish();
}

std::string ProgressDisplay::format_line(const ProgressEvent& ev) {
    std::ostringstream ss;
    ss << "Progress: " << std::setw(3) << ev.percent << "%"
       << " | Transfer rate: " << utils::format_rate_mbps(ev.rate_mbps)
       << " | Remaining time: " << utils::format_mmss(ev.remaining_s);
    return ss.str();
}

std::string ProgressDisplay::build_progress_bar(double pct, int width) const {
    if (width < 4) return "";
    int fill = (int)(pct / 100.0 * width);
    fill = utils::clamp(fill, 0, width);

    std::string bar = "[";
    for (int i = 0; i < width; ++i) {
        if (i < fill)          bar += '=';
        else if (i == fill)    bar += '>';
        else                   bar += ' ';
    }
    bar += "]";
    return bar;
}

void ProgressDisplay::update(const ProgressEvent& ev) {
    std::string line = format_line(ev);

    if (!tty_) {
        out_ << line << "\n";
        out_.flush();
        return;
    }

    // Carriage return + clear line, then redraw
    out_ << "\r\x1b[2K" << build_progress_bar((double)ev.percent, 30) << " " << line;
    line_open_ = true;
    if (ev.percent >= 100) {
        out_ << "\n";
        line_open_ = false;
    }
    out_.flush();
}

void ProgressDisplay::finish() {
    if (line_open_) {
        out_ << "\n";
        out_.flush();
        line_open_ = false;
    }
}
