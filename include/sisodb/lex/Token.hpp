#pragma once

#include <sisodb/lex/TokenType.hpp>
#include <sisodb/util/macro.hpp>
#include <sisodb/util/Position.hpp>
#include <sstream>
#include <string>


namespace siso {

namespace ast {

struct Token
{
    Position pos;
    std::string text; ///< the text of the token exactly as it appears in the input, quotes included
    TokenType type;

    explicit Token() : pos(nullptr), type(TK_EOF) { }

    explicit Token(Position pos, std::string text, TokenType type)
        : pos(pos)
        , text(std::move(text))
        , type(type)
    { }

    operator bool() const { return type != TK_EOF; }
    operator TokenType() const { return type; }

S_LCOV_EXCL_START
    friend std::string to_string(const Token &tok) {
        std::ostringstream os;
        os << tok;
        return os.str();
    }

    friend std::ostream & operator<<(std::ostream &os, const Token &tok) {
        return os << tok.pos << ", '" << tok.text << "', " << tok.type;
    }

    void dump(std::ostream &out) const { out << *this << std::endl; }
    void dump() const { dump(std::cerr); }
S_LCOV_EXCL_STOP
};

}

}
