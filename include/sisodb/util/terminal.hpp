#pragma once

#include <ostream>
#include <sisodb/sisodb-config.hpp>


/* ANSI escape sequences for the shell prompt, the banner, and colored diagnostics. */
namespace siso::term {

constexpr const char *RESET  = "\033[0m";
constexpr const char *BOLD   = "\033[1m";
constexpr const char *ITALIC = "\033[3m";

/** One of the 256 terminal colors, applied to either the foreground or the background. */
struct S_EXPORT Color
{
    bool background;
    unsigned code;

    friend std::ostream & operator<<(std::ostream &out, Color c) {
        return out << "\033[" << (c.background ? "48" : "38") << ";5;" << c.code << 'm';
    }
};

inline Color fg(unsigned code) { return Color{false, code}; }
inline Color bg(unsigned code) { return Color{true, code}; }

/** Returns true iff `$TERM` names a terminal that is known to support colors. */
bool S_EXPORT has_color();

}
