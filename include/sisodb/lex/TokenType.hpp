#pragma once

#include <iostream>
#include <sisodb/util/macro.hpp>
#include <string>


namespace siso {

enum TokenType
{
#define S_TOKENTYPE(tok) TK_##tok,
#include <sisodb/tables/TokenType.tbl>
#undef S_TOKENTYPE
    TokenType_MAX = TK_EOF
};

inline char const * get_name(const TokenType tt)
{
    switch (tt) {
        case TK_ERROR:          return "error";
        case TK_EOF:            return "eof";
        case TK_IDENTIFIER:     return "identifier";
        case TK_STRING_LITERAL: return "string-literal";

        case TK_DEC_INT:
        case TK_DEC_FLOAT:
            return "constant";

#define S_KEYWORD(tt, name) case TK_ ## tt:
#include <sisodb/tables/Keywords.tbl>
#undef S_KEYWORD
            return "keyword";

#define S_OPERATOR(tt) case TK_ ## tt:
#include <sisodb/tables/Operators.tbl>
#undef S_OPERATOR
            return "punctuator";
    }
    S_unreachable("invalid token type");
}

S_LCOV_EXCL_START
inline std::ostream & operator<<(std::ostream &os, const TokenType tt)
{
    switch (tt) {
#define S_TOKENTYPE(tok) case TK_ ## tok: return os << "TK_"#tok;
#include <sisodb/tables/TokenType.tbl>
#undef S_TOKENTYPE
    }
    S_unreachable("invalid token type");
}

inline std::string to_string(const TokenType tt)
{
    switch (tt) {
#define S_TOKENTYPE(tok) case TK_ ## tok: return "TK_"#tok;
#include <sisodb/tables/TokenType.tbl>
#undef S_TOKENTYPE
    }
    S_unreachable("invalid token type");
}
S_LCOV_EXCL_STOP

}
