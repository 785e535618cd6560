#include "catch2/catch.hpp"

#include <sisodb/catalog/Schema.hpp>
#include <sisodb/util/fn.hpp>


using namespace siso;


TEST_CASE("column_type", "[core][catalog][schema][unit]")
{
    CHECK(streq(get_name(CT_INTEGER), "INTEGER"));
    CHECK(streq(get_name(CT_TEXT), "TEXT"));
    CHECK(streq(get_name(CT_REAL), "REAL"));
    CHECK(streq(get_name(CT_BLOB), "BLOB"));

    CHECK(parse_column_type("INTEGER") == CT_INTEGER);
    CHECK(parse_column_type("integer") == CT_INTEGER);
    CHECK(parse_column_type("Real") == CT_REAL);
    CHECK(parse_column_type("blob") == CT_BLOB);
    CHECK_FALSE(parse_column_type("INT"));
    CHECK_FALSE(parse_column_type(""));
}

TEST_CASE("Schema c'tor", "[core][catalog][schema][unit]")
{
    Schema S("users");
    CHECK(S.name() == "users");
    CHECK(S.empty());
    CHECK(S.num_columns() == 0);
    CHECK(S.begin() == S.end());
    CHECK_FALSE(S.primary_key());
}

TEST_CASE("Schema::add()", "[core][catalog][schema][unit]")
{
    Schema S("users");

    Column id("id", CT_INTEGER);
    id.primary_key = true;
    id.not_nullable = true;
    S.add(id);

    Column name("name");
    S.add(name);

    Column age("age", CT_INTEGER);
    age.default_value = Value(18);
    age.has_default = true;
    S.add(age);

    REQUIRE(S.num_columns() == 3);
    CHECK(S.column_names() == std::vector<std::string>{ "id", "name", "age" });
    CHECK(S[0] == id);
    CHECK(S[1] == name);
    CHECK(S[2] == age);
    CHECK(S.primary_key() == &S[0]);

    CHECK(S.has("age"));
    CHECK_FALSE(S.has("AGE"));
    CHECK_FALSE(S.has("city"));
    CHECK(S.at("age").default_value == Value(18));

    SECTION("duplicate column")
    {
        try {
            S.add(Column("name", CT_TEXT));
            FAIL("expected invalid_argument");
        } catch (const invalid_argument &e) {
            CHECK(std::string(e.what()) == "Duplicate column 'name'");
        }
        CHECK(S.num_columns() == 3);
    }

    SECTION("second primary key")
    {
        Column other("other");
        other.primary_key = true;
        try {
            S.add(other);
            FAIL("expected invalid_argument");
        } catch (const invalid_argument &e) {
            CHECK(std::string(e.what()) == "Table can have only one PRIMARY KEY");
        }
        CHECK(S.num_columns() == 3);
    }

    SECTION("unknown column")
    {
        REQUIRE_THROWS_AS(S.at("city"), out_of_range);
    }
}

TEST_CASE("Schema/equality", "[core][catalog][schema][unit]")
{
    Schema S1("t"), S2("t"), S3("u");
    S1.add(Column("a", CT_INTEGER));
    S2.add(Column("a", CT_INTEGER));
    S3.add(Column("a", CT_INTEGER));

    CHECK(S1 == S2);
    CHECK(S1 != S3);

    S2.add(Column("b"));
    CHECK(S1 != S2);
}
