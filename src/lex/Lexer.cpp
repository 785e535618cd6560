#include "lex/Lexer.hpp"

#include <cctype>
#include <sisodb/util/fn.hpp>


#define UNDO(CHR) { in.putback(c_); c_ = CHR; pos_.column--; pos_.offset--; }


using namespace siso;
using namespace siso::ast;


void Lexer::initialize_keywords()
{
#define S_KEYWORD(tok, text) keywords_.emplace(#text, TK_##tok);
#include <sisodb/tables/Keywords.tbl>
#undef S_KEYWORD
}

Token Lexer::next()
{
    /* skip whitespaces and comments */
    for (;;) {
        switch (c_) {
            case EOF: return Token(pos_, "EOF", TK_EOF);
            case ' ': case '\t': case '\v': case '\f': case '\n': case '\r': step(); continue;

            case '-': {
                step();
                if (c_ == '-') {
                    /* read comment */
                    do step(); while (c_ != EOF and c_ != '\n');
                    continue;
                } else {
                    /* TK_MINUS */
                    UNDO('-');
                    goto after;
                }
            }

            default: goto after;
        }
    }
after:

    start_ = pos_;
    buf_.clear();

    switch (c_) {
        case '0': case '1': case '2': case '3': case '4': case '5': case '6': case '7': case '8': case '9':
            return read_number();

        case '\'':
        case '"':
            return read_string_literal();

        /* Punctuators */
#define LEX(chr, text, tt, SUB) case chr: step(); switch (c_) { SUB } return Token(start_, text, tt);
#define GUESS(first, SUB) case first: step(); switch (c_) { SUB } UNDO(first); break;
        LEX('(', "(", TK_LPAR, );
        LEX(')', ")", TK_RPAR, );
        LEX('+', "+", TK_PLUS, );
        LEX('-', "-", TK_MINUS, );
        LEX('*', "*", TK_ASTERISK, );
        LEX('=', "=", TK_EQUAL, );
        GUESS('!',
            LEX('=', "!=", TK_BANG_EQUAL, ) );
        LEX('<', "<", TK_LESS,
            LEX('=', "<=", TK_LESS_EQUAL, )
            LEX('>', "<>", TK_LESS_GREATER, ) );
        LEX('>', ">", TK_GREATER,
            LEX('=', ">=", TK_GREATER_EQUAL, ) );
        LEX(',', ",", TK_COMMA, );
        LEX(';', ";", TK_SEMICOL, );
        LEX('.', ".", TK_DOT,
            case '0': case '1': case '2': case '3': case '4': case '5': case '6': case '7': case '8': case '9':
                UNDO('.');
                return read_number(););

#undef LEX
#undef GUESS

        default: /* fallthrough */;
    }

    if ('_' == c_ or is_alpha(c_)) return read_keyword_or_identifier();

    push();
    diag.e(start_) << "illegal character '" << buf_ << "'\n";
    return Token(start_, buf_, TK_ERROR);
}


/*====================================================================================================================*/
//
//  Lexer functions
//
/*====================================================================================================================*/

Token Lexer::read_keyword_or_identifier()
{
    while ('_' == c_ or is_alnum(c_))
        push();
    auto it = keywords_.find(to_upper(buf_));
    if (it == keywords_.end()) return Token(start_, buf_, TK_IDENTIFIER);
    else return Token(start_, buf_, it->second);
}

Token Lexer::read_number()
{
    bool is_float = false;
    bool empty = true;

    /*-- sequence before dot ---------*/
    while (is_dec(c_)) { empty = false; push(); }

    /*-- the dot ---------------------*/
    if ('.' == c_) {
        push();
        is_float = true;
        /*-- sequence after dot ------*/
        while (is_dec(c_)) { empty = false; push(); }
    }

    /*-- exponent part ---------------*/
    if ('e' == c_ or 'E' == c_) {
        push();
        is_float = true;
        if ('-' == c_ or '+' == c_) push();
        empty = true;
        while (is_dec(c_)) { empty = false; push(); }
    }

    /* A number must not run into an identifier, as in `12abc`. */
    if (empty or '_' == c_ or is_alpha(c_)) {
        while ('_' == c_ or is_alnum(c_)) push();
        diag.e(start_) << "invalid number '" << buf_ << "'\n";
        return Token(start_, buf_, TK_ERROR);
    }
    return Token(start_, buf_, is_float ? TK_DEC_FLOAT : TK_DEC_INT);
}

Token Lexer::read_string_literal()
{
    const int quote = c_;
    push(); // initial quote
    for (;;) {
        while (EOF != c_ and quote != c_)
            push();
        if (EOF == c_) {
            diag.e(start_) << "unterminated string literal '" << buf_ << "'\n";
            return Token(start_, buf_, TK_ERROR);
        }
        push(); // quote
        if (quote != c_) break; // terminal quote
        push(); // doubled quote, i.e. an escaped quote character
    }
    return Token(start_, buf_, TK_STRING_LITERAL);
}
