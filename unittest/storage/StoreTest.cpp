#include "catch2/catch.hpp"

#include "testutil.hpp"
#include <sisodb/storage/Store.hpp>
#include <sisodb/util/exception.hpp>


using namespace siso;
using namespace siso::testutil;


namespace {

Schema make_users_schema()
{
    Schema S("users");
    S.add(Column("name"));
    S.add(Column("age", CT_INTEGER));
    return S;
}

}


TEST_CASE("Row", "[core][storage][unit]")
{
    auto row = make_row({ {"name", "Alice"}, {"age", 30} });

    REQUIRE(row.size() == 2);
    CHECK(row.has("name"));
    CHECK_FALSE(row.has("city"));
    CHECK(row.get("name") == Value("Alice"));
    CHECK(row.get("city").is_null());

    SECTION("with() replaces in place")
    {
        auto updated = row.with("age", 31);
        CHECK(updated.get("age") == Value(31));
        CHECK(row.get("age") == Value(30));
        REQUIRE(updated.size() == 2);
        CHECK(updated.begin()->first == "name");
    }

    SECTION("with() appends")
    {
        auto updated = row.with("city", "NYC");
        REQUIRE(updated.size() == 3);
        CHECK((updated.end() - 1)->first == "city");
        CHECK_FALSE(row.has("city"));
    }

    SECTION("project()")
    {
        auto projected = row.project({ "age", "city" });
        REQUIRE(projected.size() == 2);
        CHECK(projected.begin()->first == "age");
        CHECK(projected.get("age") == Value(30));
        CHECK(projected.has("city"));
        CHECK(projected.get("city").is_null());
        CHECK_FALSE(projected.has("name"));
    }

    SECTION("equality respects order")
    {
        CHECK(row == make_row({ {"name", "Alice"}, {"age", 30} }));
        CHECK(row != make_row({ {"age", 30}, {"name", "Alice"} }));
    }
}

TEST_CASE("Table", "[core][storage][unit]")
{
    Table T(make_users_schema());
    CHECK(T.name() == "users");
    CHECK(T.num_rows() == 0);

    T.insert(make_row({ {"name", "Alice"}, {"age", 30} }));
    T.insert(make_row({ {"name", "Bob"},   {"age", 25} }));
    T.insert(make_row({ {"name", "Carol"}, {"age", 35} }));
    REQUIRE(T.num_rows() == 3);
    CHECK(T.rows()[1]->get("name") == Value("Bob"));

    SECTION("update() with predicate")
    {
        auto old_row = T.rows()[0];
        auto n = T.update({ {"age", 31} }, [](const Row &r) { return r.get("name") == Value("Alice"); });
        CHECK(n == 1);
        CHECK(T.rows()[0]->get("age") == Value(31));
        CHECK(T.rows()[1]->get("age") == Value(25));
        /* rows held elsewhere are not modified */
        CHECK(old_row->get("age") == Value(30));
    }

    SECTION("update() without predicate")
    {
        auto n = T.update({ {"age", Value::Null()} });
        CHECK(n == 3);
        for (auto &r : T)
            CHECK(r->get("age").is_null());
    }

    SECTION("update() of an unknown column")
    {
        REQUIRE_THROWS_AS(T.update({ {"age", 1}, {"city", "LA"} }), out_of_range);
        CHECK(T.rows()[0]->get("age") == Value(30));
    }

    SECTION("remove() with predicate")
    {
        auto n = T.remove([](const Row &r) { return r.get("age") == Value(25); });
        CHECK(n == 1);
        REQUIRE(T.num_rows() == 2);
        CHECK(T.rows()[0]->get("name") == Value("Alice"));
        CHECK(T.rows()[1]->get("name") == Value("Carol"));
    }

    SECTION("remove() without predicate")
    {
        CHECK(T.remove() == 3);
        CHECK(T.num_rows() == 0);
    }
}

TEST_CASE("Database", "[core][storage][unit]")
{
    Database DB;
    CHECK(DB.num_collections() == 0);
    CHECK_FALSE(DB.has_collection("users"));

    DB.create_collection(make_users_schema());
    DB.create_collection(Schema("accounts"));
    CHECK(DB.num_collections() == 2);
    CHECK(DB.has_collection("users"));
    CHECK(DB.collection_names() == std::vector<std::string>{ "accounts", "users" });

    SECTION("duplicate table")
    {
        try {
            DB.create_collection(Schema("users"));
            FAIL("expected invalid_argument");
        } catch (const invalid_argument &e) {
            CHECK(std::string(e.what()) == "Table 'users' already exists");
        }
    }

    SECTION("rows")
    {
        DB.insert_row("users", make_row({ {"name", "Alice"}, {"age", 30} }));
        DB.insert_row("users", make_row({ {"name", "Bob"},   {"age", 25} }));
        CHECK(DB.get_collection("users").num_rows() == 2);

        CHECK(DB.update_rows("users", { {"age", 26} }, [](const Row &r) { return r.get("name") == Value("Bob"); }) == 1);
        CHECK(DB.get_collection("users").rows()[1]->get("age") == Value(26));

        CHECK(DB.delete_rows("users") == 2);
        CHECK(DB.get_collection("users").num_rows() == 0);
    }

    SECTION("unknown table")
    {
        CHECK_THROWS_AS(DB.get_collection("nope"), out_of_range);
        CHECK_THROWS_AS(DB.drop_collection("nope"), out_of_range);
        CHECK_THROWS_AS(DB.insert_row("nope", Row()), out_of_range);
        CHECK_THROWS_AS(DB.update_rows("nope", {}), out_of_range);
        CHECK_THROWS_AS(DB.delete_rows("nope"), out_of_range);
    }

    SECTION("drop")
    {
        DB.drop_collection("users");
        CHECK_FALSE(DB.has_collection("users"));
        CHECK(DB.num_collections() == 1);
        DB.clear();
        CHECK(DB.num_collections() == 0);
    }
}
