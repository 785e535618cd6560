#pragma once

#include <istream>
#include <sisodb/lex/Token.hpp>
#include <sisodb/lex/TokenType.hpp>
#include <sisodb/util/Diagnostic.hpp>
#include <string>
#include <unordered_map>


namespace siso {

namespace ast {

struct S_EXPORT Lexer
{
    public:
    Diagnostic &diag;
    const char *filename;
    std::istream &in;

    private:
    using Keywords_t = std::unordered_map<std::string, TokenType>;
    Keywords_t keywords_;
    int c_;
    Position pos_, start_;
    std::string buf_;

    public:
    explicit Lexer(Diagnostic &diag, const char *filename, std::istream &in)
        : diag(diag)
        , filename(filename)
        , in(in)
        , pos_(filename)
        , start_(pos_)
    {
        buf_.reserve(32);
        initialize_keywords();
        c_ = '\n';
        step();
    }

    /** Initializes the set of all keywords.  Keywords are stored in upper case. */
    void initialize_keywords();

    /** Obtains the next token from the input stream. */
    Token next();

    private:
    /** Reads the next character from \p in to \p c_, and updates \p pos_ accordingly. */
    int step() {
        if (pos_.line != 0) ++pos_.offset;
        switch (c_) {
            case '\n':
                pos_.column = 1;
                pos_.line++;
                break;

            default:
                pos_.column++;
                break;
        }
        return c_ = in.get();
    }

    void push() {
        buf_.push_back(c_);
        step();
    }

    bool accept(const int c) {
        if (c == this->c_) {
            push();
            return true;
        }
        return false;
    }

    /* Lexer routines. */
    Token read_keyword_or_identifier();
    Token read_number();
    Token read_string_literal();
};

}

}
