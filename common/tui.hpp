#pragma once

// ============================================================
// tui.hpp -- ANSI progress display
//
// Rendered synchronously by whoever advances the counters; there
// is no refresh thread.
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <ostream>
#include <chrono>

struct TuiState {
    u64 bytes_sent{0};
    u64 bytes_total{0};
    u32 chunks_sent{0};
    u32 chunks_total{0};
    std::string label;   // payload name shown after the bar
};

class Tui {
public:
    // use_ansi=false prints a plain line per update instead of
    // redrawing in place.
    Tui(TuiState& state, std::ostream& out, bool use_ansi);

    // A frame left on screen without finish() (the transfer failed)
    // still gets its line ended, so later output starts clean.
    ~Tui();

    Tui(const Tui&) = delete;
    Tui& operator=(const Tui&) = delete;

    // Draw the current state (replaces the previous frame)
    void render();

    // Print the final frame and move past it (once)
    void finish();

private:
    TuiState& state_;
    std::ostream& out_;
    bool use_ansi_;
    bool drawn_{false};
    bool finished_{false};

    std::chrono::steady_clock::time_point start_time_;

    std::string build_progress_bar(double pct, int width) const;
    std::string build_line();
};
