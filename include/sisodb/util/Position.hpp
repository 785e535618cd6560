#pragma once

#include <cstddef>
#include <ostream>
#include <sisodb/util/fn.hpp>


namespace siso {

/** A location in the text of a statement.  `line` and `column` count from 1 once the lexer has read the first
 * character.  `offset` is the index of the character in the statement text; parsers use it to cut fragments, e.g. the
 * text of a malformed WHERE clause. */
struct Position
{
    const char *name;
    unsigned line = 0;
    unsigned column = 0;
    std::size_t offset = 0;

    explicit Position(const char *name) : name(name) { }

    bool operator==(const Position &other) const {
        return streq(name, other.name) and line == other.line and column == other.column and offset == other.offset;
    }
    bool operator!=(const Position &other) const { return not operator==(other); }

    friend std::ostream & operator<<(std::ostream &out, const Position &pos) {
        return out << pos.name << ':' << pos.line << ':' << pos.column;
    }
};

}
