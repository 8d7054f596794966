#pragma once

// ============================================================
// prompter.hpp -- Questions to the user at the console
//
// The loader core never reads stdin itself; whatever needs an
// answer goes through a Prompter.
// ============================================================

#include <string>
#include <istream>
#include <ostream>

class Prompter {
public:
    virtual ~Prompter() = default;

    // false when nobody is there to answer (stdin is not a terminal)
    virtual bool interactive() const = 0;

    // Yes/no question; false on "no" or end of input
    virtual bool confirm(const std::string& question) = 0;

    // Free-form answer, trimmed; empty on end of input
    virtual std::string ask(const std::string& question) = 0;
};

class ConsolePrompter : public Prompter {
public:
    ConsolePrompter(std::istream& in, std::ostream& out, bool interactive);

    bool interactive() const override { return interactive_; }
    bool confirm(const std::string& question) override;
    std::string ask(const std::string& question) override;

private:
    std::istream& in_;
    std::ostream& out_;
    bool interactive_;
};
