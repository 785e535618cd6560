#pragma once

#include <sisodb/pipeline/Dispatcher.hpp>
#include <sisodb/pipeline/Stage.hpp>
#include <sisodb/sisodb-config.hpp>
#include <sisodb/storage/Store.hpp>


namespace siso {

#define SISODB_DECLARE_STAGE_METHODS(NAME) \
    const char * name() const override { return NAME; } \
    bool matches(const WorkUnit &unit) const override; \
    void transform(const WorkUnit &unit, Dispatcher &D) const override;

/** A stage operating on the row store. */
struct S_EXPORT DatabaseStage : Stage
{
    protected:
    Database &db_;

    public:
    explicit DatabaseStage(Database &db) : db_(db) { }
};


/*======================================================================================================================
 * Persistence
 *====================================================================================================================*/

/** Writes the entire row store to a file.  Handles `SAVE DATABASE 'file'`. */
struct S_EXPORT SaveStage : DatabaseStage
{
    using DatabaseStage::DatabaseStage;
    SISODB_DECLARE_STAGE_METHODS("Save")
};

/** Replaces the entire row store by the contents of a file.  Handles `LOAD DATABASE 'file'`. */
struct S_EXPORT LoadStage : DatabaseStage
{
    using DatabaseStage::DatabaseStage;
    SISODB_DECLARE_STAGE_METHODS("Load")
};


/*======================================================================================================================
 * Statement parsers and their execution
 *====================================================================================================================*/

/** Parses `CREATE TABLE` statements into a `CreateTableSpec`. */
struct S_EXPORT CreateTableParseStage : Stage
{
    SISODB_DECLARE_STAGE_METHODS("CreateTableParse")
};

/** Creates the table of a `CreateTableSpec`. */
struct S_EXPORT CreateTableExecuteStage : DatabaseStage
{
    using DatabaseStage::DatabaseStage;
    SISODB_DECLARE_STAGE_METHODS("CreateTableExecute")
};

/** Parses and executes `DROP TABLE` statements. */
struct S_EXPORT DropTableStage : DatabaseStage
{
    using DatabaseStage::DatabaseStage;
    SISODB_DECLARE_STAGE_METHODS("DropTable")
};

/** Parses `INSERT` statements into an `InsertSpec` and checks that every tuple provides a value per named column. */
struct S_EXPORT InsertParseStage : Stage
{
    SISODB_DECLARE_STAGE_METHODS("InsertParse")
};

/** Inserts the rows of an `InsertSpec`.  Either all rows are inserted or none. */
struct S_EXPORT InsertExecuteStage : DatabaseStage
{
    using DatabaseStage::DatabaseStage;
    SISODB_DECLARE_STAGE_METHODS("InsertExecute")
};

/** Parses `SELECT` statements into a `SelectSpec`. */
struct S_EXPORT SelectParseStage : Stage
{
    SISODB_DECLARE_STAGE_METHODS("SelectParse")
};

/** Parses `UPDATE` statements into an `UpdateSpec`. */
struct S_EXPORT UpdateParseStage : Stage
{
    SISODB_DECLARE_STAGE_METHODS("UpdateParse")
};

/** Updates the rows selected by an `UpdateSpec`. */
struct S_EXPORT UpdateExecuteStage : DatabaseStage
{
    using DatabaseStage::DatabaseStage;
    SISODB_DECLARE_STAGE_METHODS("UpdateExecute")
};

/** Parses `DELETE` statements into a `DeleteSpec`. */
struct S_EXPORT DeleteParseStage : Stage
{
    SISODB_DECLARE_STAGE_METHODS("DeleteParse")
};

/** Deletes the rows selected by a `DeleteSpec`. */
struct S_EXPORT DeleteExecuteStage : DatabaseStage
{
    using DatabaseStage::DatabaseStage;
    SISODB_DECLARE_STAGE_METHODS("DeleteExecute")
};


/*======================================================================================================================
 * Relational operators
 *====================================================================================================================*/

/** Turns a `SelectSpec` into a `RowSet` holding all rows of the queried table.  Validates all columns the query
 * refers to. */
struct S_EXPORT TableScanStage : DatabaseStage
{
    using DatabaseStage::DatabaseStage;
    SISODB_DECLARE_STAGE_METHODS("TableScan")
};

/** Keeps the rows of a `RowSet` that satisfy the `WHERE` clause. */
struct S_EXPORT FilterStage : Stage
{
    SISODB_DECLARE_STAGE_METHODS("Filter")
};

/** Sorts the rows of a `RowSet` stably by the `ORDER BY` column.  `NULL`s are always sorted last. */
struct S_EXPORT OrderByStage : Stage
{
    SISODB_DECLARE_STAGE_METHODS("OrderBy")
};

/** Reduces the rows of a `RowSet` to the selected columns. */
struct S_EXPORT ProjectionStage : Stage
{
    SISODB_DECLARE_STAGE_METHODS("Projection")
};

/** Removes duplicate rows from a `RowSet`, keeping the first occurrence. */
struct S_EXPORT DistinctStage : Stage
{
    SISODB_DECLARE_STAGE_METHODS("Distinct")
};

/** Applies `LIMIT` and `OFFSET` to a `RowSet`. */
struct S_EXPORT LimitStage : Stage
{
    SISODB_DECLARE_STAGE_METHODS("Limit")
};

/** Renders a completely processed `RowSet` as the result of the query. */
struct S_EXPORT ResultSetStage : Stage
{
    SISODB_DECLARE_STAGE_METHODS("ResultSet")
};


/*======================================================================================================================
 * Terminal stages
 *====================================================================================================================*/

/** Captures `Terminal` units as the result of the dispatcher. */
struct S_EXPORT ResultStage : Stage
{
    SISODB_DECLARE_STAGE_METHODS("Result")
};

/** Reports units that all other stages declined.  Must be registered last.  In production mode, the report is a terse
 * syntax error, otherwise it lists the complete processing history of the unit. */
struct S_EXPORT ErrorStage : Stage
{
    private:
    bool production_;

    public:
    explicit ErrorStage(bool production = false) : production_(production) { }

    bool production() const { return production_; }

    SISODB_DECLARE_STAGE_METHODS("Error")
};

#undef SISODB_DECLARE_STAGE_METHODS

/** Registers all stages with \p D in their canonical order. */
void S_EXPORT register_stages(Dispatcher &D, Database &db, bool production);

}
