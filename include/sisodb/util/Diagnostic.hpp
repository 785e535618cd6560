#pragma once

#include <iostream>
#include <sisodb/util/Position.hpp>
#include <sisodb/util/terminal.hpp>


namespace siso {

/** Routes results to one stream and error messages to another, counting the errors.  The lexer and the parsers report
 * into a `Diagnostic`; callers inspect `num_errors()` to decide whether the input was well-formed. */
struct Diagnostic
{
    Diagnostic(const bool color, std::ostream &out, std::ostream &err)
        : color_(color)
        , out_(out)
        , err_(err)
    { }

    /** Starts an error message located at \p pos. */
    std::ostream & e(const Position &pos) {
        if (color_) err_ << term::BOLD;
        err_ << pos << ": ";
        if (color_) err_ << term::RESET;
        return err();
    }

    /** Starts an error message without location. */
    std::ostream & err() {
        ++num_errors_;
        if (color_) err_ << term::BOLD << term::fg(ERROR_COLOR);
        err_ << "error: ";
        if (color_) err_ << term::RESET;
        return err_;
    }

    std::ostream & out() const { return out_; }

    unsigned num_errors() const { return num_errors_; }
    void clear() { num_errors_ = 0; }

    private:
    static constexpr unsigned ERROR_COLOR = 160;

    const bool color_;
    std::ostream &out_;
    std::ostream &err_;
    unsigned num_errors_ = 0;
};

}
