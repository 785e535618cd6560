#include "catch2/catch.hpp"

#include "lex/Lexer.hpp"
#include "testutil.hpp"
#include <tuple>

using namespace siso;

TEST_CASE("Lexer::next()", "[core][lex][unit]")
{
    SECTION("valid tokens")
    {
        std::tuple<const char*, const TokenType, const char*, const TokenType> expr[] = {
            /* { expression, Token, text, nextToken } */

            /* single token */
            { "(", TK_LPAR, "(", TK_EOF },
            { ")", TK_RPAR, ")", TK_EOF },
            { "+", TK_PLUS, "+", TK_EOF },
            { "-", TK_MINUS, "-", TK_EOF },
            { "*", TK_ASTERISK, "*", TK_EOF },
            { "=", TK_EQUAL, "=", TK_EOF },
            { "!=", TK_BANG_EQUAL, "!=", TK_EOF },
            { "<>", TK_LESS_GREATER, "<>", TK_EOF },
            { "<", TK_LESS, "<", TK_EOF },
            { "<=", TK_LESS_EQUAL, "<=", TK_EOF },
            { ">", TK_GREATER, ">", TK_EOF },
            { ">=", TK_GREATER_EQUAL, ">=", TK_EOF },
            { ",", TK_COMMA, ",", TK_EOF },
            { ";", TK_SEMICOL, ";", TK_EOF },
            { ".", TK_DOT, ".", TK_EOF },

            /* whitespaces and comments */
            { "SELECT  \t   \v\f\n \
               \r -- this is a comment\n *", TK_Select, "SELECT", TK_ASTERISK },
            { "SELECT  -- this is the end of the document", TK_Select, "SELECT", TK_EOF },
            { "-- a comment\n-5", TK_MINUS, "-", TK_DEC_INT },

            /* numeric constants */
            { "123456789", TK_DEC_INT, "123456789", TK_EOF },
            { "0", TK_DEC_INT, "0", TK_EOF },
            { "007", TK_DEC_INT, "007", TK_EOF },
            { "3.14", TK_DEC_FLOAT, "3.14", TK_EOF },
            { ".5", TK_DEC_FLOAT, ".5", TK_EOF },
            { "5.", TK_DEC_FLOAT, "5.", TK_EOF },
            { "1e10", TK_DEC_FLOAT, "1e10", TK_EOF },
            { "2.5E-3", TK_DEC_FLOAT, "2.5E-3", TK_EOF },
            { "42,", TK_DEC_INT, "42", TK_COMMA },

            /* string literals */
            { "'hello'", TK_STRING_LITERAL, "'hello'", TK_EOF },
            { "\"hello\"", TK_STRING_LITERAL, "\"hello\"", TK_EOF },
            { "''", TK_STRING_LITERAL, "''", TK_EOF },
            { "'it''s'", TK_STRING_LITERAL, "'it''s'", TK_EOF },
            { "'a;b'", TK_STRING_LITERAL, "'a;b'", TK_EOF },
            { "'-- no comment'", TK_STRING_LITERAL, "'-- no comment'", TK_EOF },

            /* keywords are case-insensitive and keep their spelling */
            { "SELECT", TK_Select, "SELECT", TK_EOF },
            { "select", TK_Select, "select", TK_EOF },
            { "BeTwEeN", TK_Between, "BeTwEeN", TK_EOF },
            { "NULL", TK_Null, "NULL", TK_EOF },
            { "not", TK_Not, "not", TK_EOF },

            /* identifiers */
            { "users", TK_IDENTIFIER, "users", TK_EOF },
            { "_tmp", TK_IDENTIFIER, "_tmp", TK_EOF },
            { "col_1", TK_IDENTIFIER, "col_1", TK_EOF },
            { "INTEGER", TK_IDENTIFIER, "INTEGER", TK_EOF },
            { "name(", TK_IDENTIFIER, "name", TK_LPAR },
        };

        for (auto e : expr) {
            LEXER(std::get<0>(e));
            auto tok = lexer.next();

            CHECK(diag.num_errors() == 0);
            CHECK(err.str().empty());
            CHECK(tok.type == std::get<1>(e));
            CHECK(tok.text == std::get<2>(e));
            CHECK(lexer.next().type == std::get<3>(e));
        }
    }

    SECTION("invalid tokens")
    {
        const char *expr[] = {
            "!",
            "#",
            "?",
            "'unterminated",
            "\"unterminated",
            "12abc",
            "1e",
            "1.5e+",
        };

        for (auto e : expr) {
            LEXER(e);
            auto tok = lexer.next();

            CHECK(tok.type == TK_ERROR);
            CHECK(diag.num_errors() > 0);
            CHECK_FALSE(err.str().empty());
        }
    }
}

TEST_CASE("Lexer positions", "[core][lex][unit]")
{
    LEXER("SELECT *\n  FROM t;");

    auto select = lexer.next();
    REQUIRE(select.pos.line == 1);
    REQUIRE(select.pos.column == 1);
    REQUIRE(select.pos.offset == 0);

    auto star = lexer.next();
    REQUIRE(star.pos.line == 1);
    REQUIRE(star.pos.column == 8);
    REQUIRE(star.pos.offset == 7);

    auto from = lexer.next();
    REQUIRE(from.type == TK_From);
    REQUIRE(from.pos.line == 2);
    REQUIRE(from.pos.column == 3);
    REQUIRE(from.pos.offset == 11);

    auto t = lexer.next();
    REQUIRE(t.pos.offset == 16);

    auto semicolon = lexer.next();
    REQUIRE(semicolon.type == TK_SEMICOL);
    REQUIRE(semicolon.pos.offset == 17);

    auto eof = lexer.next();
    REQUIRE(eof.type == TK_EOF);
    REQUIRE(eof.pos.offset == 18);
}
