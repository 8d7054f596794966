// ============================================================
// prompter.cpp -- Console prompter
// ============================================================

#include "prompter.hpp"
#include <algorithm>
#include <cctype>

static std::string trim(const std::string& s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto b = std::find_if(s.begin(), s.end(), not_space);
    auto e = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return b < e ? std::string(b, e) : std::string();
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

ConsolePrompter::ConsolePrompter(std::istream& in, std::ostream& out, bool interactive)
    : in_(in), out_(out), interactive_(interactive) {}

bool ConsolePrompter::confirm(const std::string& question) {
    // Keep asking until we get something we understand
    for (;;) {
        out_ << question << " [y/n]: ";
        out_.flush();
        std::string line;
        if (!std::getline(in_, line)) {
            out_ << "\n";
            return false;
        }
        std::string answer = lower(trim(line));
        if (answer == "y" || answer == "yes") return true;
        if (answer == "n" || answer == "no")  return false;
    }
}

std::string ConsolePrompter::ask(const std::string& question) {
    out_ << question;
    out_.flush();
    std::string line;
    if (!std::getline(in_, line)) {
        out_ << "\n";
        return {};
    }
    return trim(line);
}
