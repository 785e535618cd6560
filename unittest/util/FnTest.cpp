#include "catch2/catch.hpp"

#include <cstdlib>
#include <sisodb/util/exception.hpp>
#include <sisodb/util/fn.hpp>
#include <string>
#include <tuple>


using namespace siso;


TEST_CASE("streq/strneq", "[core][util][fn]")
{
    REQUIRE(streq("", ""));
    REQUIRE(streq("abc", "abc"));
    REQUIRE_FALSE(streq("abc", "abd"));
    REQUIRE_FALSE(streq("abc", "ab"));

    REQUIRE(strneq("abc", "abd", 2));
    REQUIRE_FALSE(strneq("abc", "abd", 3));
}

TEST_CASE("iequals", "[core][util][fn]")
{
    REQUIRE(iequals("select", "SELECT"));
    REQUIRE(iequals("NuLl", "null"));
    REQUIRE(iequals("", ""));
    REQUIRE_FALSE(iequals("select", "selec"));
    REQUIRE_FALSE(iequals("a", "b"));
}

TEST_CASE("to_upper/to_lower", "[core][util][fn]")
{
    REQUIRE(to_upper("Hello, World 42") == "HELLO, WORLD 42");
    REQUIRE(to_lower("Hello, World 42") == "hello, world 42");
}

TEST_CASE("trim", "[core][util][fn]")
{
    REQUIRE(trim("  abc  ") == "abc");
    REQUIRE(trim("\t\nabc def\r\n") == "abc def");
    REQUIRE(trim("abc") == "abc");
    REQUIRE(trim("   ").empty());
    REQUIRE(trim("").empty());
}

TEST_CASE("join", "[core][util][fn]")
{
    REQUIRE(join({}, ", ").empty());
    REQUIRE(join({"a"}, ", ") == "a");
    REQUIRE(join({"a", "b", "c"}, ", ") == "a, b, c");
    REQUIRE(join({"a", "b"}, "\t") == "a\tb");
}

TEST_CASE("quote/unquote", "[core][util][fn]")
{
    SECTION("quote")
    {
        CHECK(quote("abc") == "'abc'");
        CHECK(quote("abc", '"') == "\"abc\"");
    }

    SECTION("unquote")
    {
        CHECK(unquote("'abc'") == "abc");
        CHECK(unquote("\"abc\"") == "abc");
        CHECK(unquote("''") == "");
        CHECK(unquote("'it''s'") == "it's");
        CHECK(unquote("\"say \"\"hi\"\"\"") == "say \"hi\"");
    }

    SECTION("unquoted input is returned unchanged")
    {
        CHECK(unquote("") == "");
        CHECK(unquote("a") == "a");
        CHECK(unquote("'") == "'");
        CHECK(unquote("'abc") == "'abc");
        CHECK(unquote("'abc\"") == "'abc\"");
    }
}

TEST_CASE("like", "[core][util][fn]")
{
    std::tuple<std::string, std::string, bool> triples[] = {
        /* { string, pattern, result } */

        /* empty pattern */
        { "", "", true },
        { "a", "", false },

        /* no wildcards */
        { "", "a", false },
        { "a", "a", true },
        { "A", "a", true },
        { "a", "A", true },
        { "b", "a", false },
        { "abc", "abc", true },
        { "ab", "abc", false },
        { "abcd", "abc", false },

        /* `_`-wildcard */
        { "", "_", false },
        { "a", "_", true },
        { "aa", "_", false },
        { "ab", "a_", true },
        { "axbyzc", "a_b__c", true },
        { "axbyc", "a_b__c", false },

        /* `%`-wildcard */
        { "", "%", true },
        { "abc", "%", true },
        { "", "a%", false },
        { "a", "a%", true },
        { "Alice", "a%", true },
        { "bac", "a%", false },
        { "abc", "a%b%%c", true },
        { "axyzbrstc", "a%b%%c", true },
        { "axyzbrst", "a%b%%c", false },
        { "New York", "%york", true },
        { "New York", "%ew%", true },

        /* complex patterns */
        { "xabcyzdqe", "%_ab%c__d%e", true },
        { "abcyzdqe", "%_ab%c__d%e", false },
    };

    for (const auto& [str, pattern, exp] : triples) {
        auto res = like(str, pattern);
        CHECK(exp == res);
        if (exp != res) {
            std::cerr << "Expected " << (exp ? "" : "no ") << "match for string \"" << str << "\" and pattern \""
                      << pattern << "\", but got " << (res ? "one." : "none.") << std::endl;
        }
    }
}

TEST_CASE("get_home_path", "[core][util][fn]")
{
#if __linux || __APPLE__
    char *homepath = getenv("HOME");            // Get original HOME path
    const std::string original = homepath ? homepath : "";
    const std::string str("Hello, World");
    setenv("HOME", str.c_str(), 1);             // Replace value of HOME
    const std::string gotten = get_home_path();
    REQUIRE(str == gotten);                     // Check wether get_home_path() returns the correct string
    setenv("HOME", original.c_str(), 1);        // Restore original HOME path
#endif
}

TEST_CASE("isspace", "[core][util][fn]")
{
    SECTION("only spaces")
    {
        auto string = "     ";
        REQUIRE(isspace(string, 5));
        REQUIRE(isspace(string));
    }

    SECTION("contains a nonspace")
    {
        auto string = "  x  ";
        REQUIRE_FALSE(isspace(string, 5));
        REQUIRE_FALSE(isspace(string));
    }

    SECTION("nonspace beyond the given length")
    {
        auto string = "  x";
        REQUIRE(isspace(string, 2));
        REQUIRE_FALSE(isspace(string));
    }

    SECTION("empty string")
    {
        REQUIRE(isspace("", 0));
        REQUIRE(isspace(""));
    }
}

TEST_CASE("cast/is/as", "[core][util][fn]")
{
    struct Base { virtual ~Base() { } };
    struct Derived : Base { };
    struct Other : Base { };

    Derived d;
    Base *b = &d;

    REQUIRE(is<Derived>(b));
    REQUIRE_FALSE(is<Other>(b));
    REQUIRE(cast<Derived>(b) == &d);
    REQUIRE(cast<Other>(b) == nullptr);
    REQUIRE(&as<Derived>(*b) == &d);
}
