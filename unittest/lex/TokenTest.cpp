#include "catch2/catch.hpp"

#include <sisodb/lex/Token.hpp>


using namespace siso;
using namespace siso::ast;


TEST_CASE("Token c'tor", "[core][lex][unit]")
{
    Position pos("the_file");
    Token tok = Token(pos, "the_text", TK_ERROR);

    REQUIRE(pos == tok.pos);
    REQUIRE(tok.text == "the_text");
    REQUIRE(TK_ERROR == tok.type);
}

TEST_CASE("Token::bool()", "[core][lex][unit]")
{
    Position pos("the_file");

    {
        Token tok = Token(pos, "the_text", TK_ERROR);
        REQUIRE(bool(tok));
    }

    {
        Token tok = Token(pos, "the_text", TK_EOF);
        REQUIRE(not bool(tok));
    }

    {
        Token tok;
        REQUIRE(not bool(tok));
    }
}

TEST_CASE("Token::TokenType()", "[core][lex][unit]")
{
    Position pos("the_file");
    Token tok = Token(pos, "the_text", TK_Select);

    REQUIRE(TK_Select == TokenType(tok));
}

TEST_CASE("get_name(TokenType)", "[core][lex][unit]")
{
    REQUIRE(streq(get_name(TK_Select), "keyword"));
    REQUIRE(streq(get_name(TK_Between), "keyword"));
    REQUIRE(streq(get_name(TK_LESS_EQUAL), "punctuator"));
    REQUIRE(streq(get_name(TK_IDENTIFIER), "identifier"));
    REQUIRE(streq(get_name(TK_STRING_LITERAL), "string-literal"));
    REQUIRE(streq(get_name(TK_DEC_FLOAT), "constant"));
    REQUIRE(streq(get_name(TK_EOF), "eof"));
}
