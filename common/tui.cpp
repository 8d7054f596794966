// ============================================================
// tui.cpp -- ANSI progress display implementation
// ============================================================

#include "tui.hpp"
#include "../common/utils.hpp"
#include <iomanip>
#include <sstream>

Tui::Tui(TuiState& state, std::ostream& out, bool use_ansi)
    : state_(state)
    , out_(out)
    , use_ansi_(use_ansi)
    , start_time_(std::chrono::steady_clock::now())
{}

Tui::~Tui() {
    if (use_ansi_ && drawn_ && !finished_) {
        out_ << "\n";
        out_.flush();
    }
}

std::string Tui::build_progress_bar(double pct, int width) const {
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

std::string Tui::build_line() {
    double elapsed_s = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_time_).count();
    double speed = elapsed_s > 0.0 ? (double)state_.bytes_sent / elapsed_s : 0.0;

    double pct = state_.bytes_total > 0
        ? (double)state_.bytes_sent / (double)state_.bytes_total * 100.0
        : 100.0;
    pct = utils::clamp(pct, 0.0, 100.0);

    std::ostringstream ss;
    ss << std::fixed;
    if (use_ansi_) {
        ss << build_progress_bar(pct, 30) << " ";
    }
    ss << std::setw(5) << std::setprecision(1) << pct << "%"
       << "  Chunks: " << state_.chunks_sent << "/" << state_.chunks_total
       << "  Sent: " << utils::format_bytes(state_.bytes_sent)
       << "/" << utils::format_bytes(state_.bytes_total)
       << "  " << utils::format_speed(speed);

    std::string label = state_.label;
    if (label.size() > 30) {
        label = "..." + label.substr(label.size() - 27);
    }
    if (!label.empty()) ss << "  " << label;
    return ss.str();
}

void Tui::render() {
    std::string line = build_line();
    if (use_ansi_) {
        // Carriage return + clear line, redraw in place
        out_ << "\r\x1b[2K" << line;
    } else {
        out_ << line << "\n";
    }
    out_.flush();
    drawn_ = true;
}

void Tui::finish() {
    if (finished_) return;
    if (!drawn_) render();
    finished_ = true;
    if (use_ansi_) {
        out_ << "\n";
        out_.flush();
    }
}
