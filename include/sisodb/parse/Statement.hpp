#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <sisodb/catalog/Schema.hpp>
#include <sisodb/catalog/Value.hpp>
#include <sisodb/parse/Predicate.hpp>
#include <sisodb/pipeline/Payload.hpp>
#include <sisodb/sisodb-config.hpp>
#include <sisodb/storage/Store.hpp>
#include <string>
#include <vector>


namespace siso {

/** The typed form of a statement.  A spec is derived once from the statement text and never modified afterwards. */
struct S_EXPORT StatementSpec : Payload
{
    std::string text; ///< the statement this spec was parsed from
    std::string table; ///< the name of the table the statement operates on

    StatementSpec() = default;

    std::string to_string() const override { return text; }
};

/** `CREATE TABLE [IF NOT EXISTS] name (column-definition, ...)` */
struct S_EXPORT CreateTableSpec : StatementSpec
{
    Schema schema;
    bool if_not_exists = false;
};

/** `DROP TABLE [IF EXISTS] name` */
struct S_EXPORT DropTableSpec : StatementSpec
{
    bool if_exists = false;
};

/** `INSERT INTO name [(columns)] VALUES (values) [, (values) ...]` */
struct S_EXPORT InsertSpec : StatementSpec
{
    using tuple_type = std::vector<Value>;

    ///> the explicitly named columns; empty if the values are given positionally
    std::vector<std::string> columns;
    ///> one tuple per row to insert
    std::vector<tuple_type> rows;

    bool has_column_names() const { return not columns.empty(); }
    bool is_batch() const { return rows.size() > 1; }
};

/** `SELECT [DISTINCT] columns FROM name [WHERE clause] [ORDER BY column [ASC|DESC]] [LIMIT n [OFFSET m]]` */
struct S_EXPORT SelectSpec : StatementSpec
{
    struct order_type
    {
        std::string column;
        bool descending = false;
    };

    ///> the requested columns; empty means all columns
    std::vector<std::string> columns;
    std::unique_ptr<ast::Predicate> where;
    std::optional<order_type> order_by;
    std::optional<uint64_t> limit;
    std::optional<uint64_t> offset;
    bool distinct = false;

    bool selects_all() const { return columns.empty(); }
};

/** `UPDATE name SET column = value [, ...] [WHERE clause]` */
struct S_EXPORT UpdateSpec : StatementSpec
{
    assignment_list assignments;
    std::unique_ptr<ast::Predicate> where;
};

/** `DELETE FROM name [WHERE clause]` */
struct S_EXPORT DeleteSpec : StatementSpec
{
    std::unique_ptr<ast::Predicate> where;
};

/** `SAVE DATABASE 'filename'` and `LOAD DATABASE 'filename'` */
struct S_EXPORT DatabaseFileSpec : StatementSpec
{
    std::string filename;
};

}
