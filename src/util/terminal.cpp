#include <sisodb/util/terminal.hpp>

#include <cstdlib>
#include <sisodb/util/fn.hpp>


bool siso::term::has_color()
{
    constexpr const char *SUPPORTED_TERMS[] = {
        "ansi",
        "color",
        "linux",
        "screen",
        "screen-256color",
        "tmux-256color",
        "vt100",
        "xterm",
        "xterm-256color",
    };
    if (auto term = std::getenv("TERM")) {
        for (auto supported : SUPPORTED_TERMS) {
            if (streq(term, supported))
                return true;
        }
    }
    return false;
}
