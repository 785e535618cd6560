#include "catch2/catch.hpp"

#include "stages/StageUtil.hpp"
#include "testutil.hpp"
#include <sisodb/util/Diagnostic.hpp>


using namespace siso;


TEST_CASE("Diagnostic", "[core][util][unit]")
{
    std::ostringstream out, err;
    Diagnostic diag(false, out, err);
    Position pos("stmt.sql");
    pos.line = 2;
    pos.column = 7;

    SECTION("located error")
    {
        diag.e(pos) << "unexpected ORDER\n";
        CHECK(err.str() == "stmt.sql:2:7: error: unexpected ORDER\n");
        CHECK(out.str().empty());
        CHECK(diag.num_errors() == 1);
    }

    SECTION("error without location")
    {
        diag.err() << "could not open file\n";
        CHECK(err.str() == "error: could not open file\n");
        CHECK(diag.num_errors() == 1);
    }

    SECTION("clear")
    {
        diag.e(pos);
        diag.err();
        REQUIRE(diag.num_errors() == 2);
        diag.clear();
        CHECK(diag.num_errors() == 0);
    }

    SECTION("results")
    {
        diag.out() << "1 row";
        CHECK(out.str() == "1 row");
        CHECK(err.str().empty());
        CHECK(diag.num_errors() == 0);
    }
}

TEST_CASE("Diagnostic/lexer errors carry the token position", "[core][util][unit]")
{
    LEXER("SELECT *\n  FROM t $");

    for (auto tok = lexer.next(); tok; tok = lexer.next()) { }

    CHECK(diag.num_errors() == 1);
    CHECK(err.str() == "-:2:10: error: illegal character '$'\n");
}

TEST_CASE("StatementParser::where_error()", "[core][util][unit]")
{
    SECTION("fragment ends before ORDER BY")
    {
        const std::string text = "SELECT * FROM users WHERE age >> 5 ORDER BY age";
        StatementParser P(text);
        CHECK_FALSE(P.parser.parse_SelectStmt());
        CHECK_FALSE(P.ok());
        auto msg = P.where_error(text);
        REQUIRE(msg);
        CHECK(*msg == "Invalid WHERE condition: age >> 5");
    }

    SECTION("fragment spans multiple lines")
    {
        const std::string text = "DELETE FROM users\nWHERE age >\n  AND city = 'NYC'";
        StatementParser P(text);
        CHECK_FALSE(P.parser.parse_DeleteStmt());
        auto msg = P.where_error(text);
        REQUIRE(msg);
        CHECK(*msg == "Invalid WHERE condition: age >\n  AND city = 'NYC'");
    }

    SECTION("well-formed condition")
    {
        const std::string text = "SELECT * FROM users WHERE age > 5";
        StatementParser P(text);
        CHECK(P.parser.parse_SelectStmt());
        CHECK(P.ok());
        CHECK_FALSE(P.where_error(text));
    }
}
