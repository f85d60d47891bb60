#pragma once

// ============================================================
// progress_display.hpp -- Per-file progress line
// ============================================================

#include "../common/platform.hpp"
#include "../sync/transfer_engine.hpp"
#include <string>
#include <iostream>

class ProgressDisplay {
public:
    // On a TTY the line is redrawn in place; otherwise each event
    // is printed on its own line.
    explicit ProgressDisplay(std::ostream& out = std::cout, bool tty = is_tty());
    ~ProgressDisplay();

    ProgressDisplay(const ProgressDisplay&) = delete;
    ProgressDisplay& operator=(const ProgressDisplay&) = delete;

    void update(const ProgressEvent& ev);

    // Terminate a line left open by an interrupted copy
    void finish();

    // "Progress:  42% | Transfer rate:  3.50 MB/s | Remaining time: 02:05"
    static std::string format_line(const ProgressEvent& ev);

    static bool is_tty();

private:
    std::ostream& out_;
    bool tty_;
    bool line_open_{false};

    std::string build_progress_bar(double pct, int width) const;
};
