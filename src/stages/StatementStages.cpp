#include <sisodb/stages/Stages.hpp>

#include "stages/StageUtil.hpp"
#include <sisodb/parse/PredicateEvaluator.hpp>
#include <sisodb/parse/Statement.hpp>
#include <sisodb/util/exception.hpp>
#include <sstream>
#include <unordered_map>


using namespace siso;


namespace {

/** Returns the first column of \p pred that \p schema lacks, if any. */
std::optional<std::string> find_unknown_column(const ast::Predicate *pred, const Schema &schema)
{
    if (not pred) return std::nullopt;
    for (auto &column : pred->columns()) {
        if (not schema.has(column))
            return column;
    }
    return std::nullopt;
}

}


/*======================================================================================================================
 * CREATE TABLE
 *====================================================================================================================*/

bool CreateTableParseStage::matches(const WorkUnit &unit) const
{
    auto stmt = unit.get<Statement>();
    return stmt and stmt->starts_with({TK_Create, TK_Table});
}

void CreateTableParseStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    auto &stmt = *unit.get<Statement>();
    StatementParser P(stmt.text);

    std::shared_ptr<CreateTableSpec> spec;
    try {
        spec = P.parser.parse_CreateTableStmt();
    } catch (const invalid_argument &e) {
        D.emit(unit, make_error(e.what()));
        return;
    }

    if (not spec or not P.ok()) {
        D.emit(unit, make_error("Invalid CREATE TABLE syntax"));
        return;
    }
    spec->text = stmt.text;
    D.emit(unit, std::move(spec));
}

bool CreateTableExecuteStage::matches(const WorkUnit &unit) const { return unit.is<CreateTableSpec>(); }

void CreateTableExecuteStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    auto &spec = *unit.get<CreateTableSpec>();

    if (db_.has_collection(spec.table)) {
        if (spec.if_not_exists)
            D.emit(unit, make_result("Table '" + spec.table + "' already exists (skipped)"));
        else
            D.emit(unit, make_error("Table '" + spec.table + "' already exists"));
        return;
    }

    try {
        db_.create_collection(spec.schema);
    } catch (const invalid_argument &e) {
        D.emit(unit, make_error(e.what()));
        return;
    }
    D.emit(unit, make_result("Table '" + spec.table + "' created"));
}


/*======================================================================================================================
 * DROP TABLE
 *====================================================================================================================*/

bool DropTableStage::matches(const WorkUnit &unit) const
{
    auto stmt = unit.get<Statement>();
    return stmt and stmt->starts_with({TK_Drop, TK_Table});
}

void DropTableStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    auto &stmt = *unit.get<Statement>();
    StatementParser P(stmt.text);

    auto spec = P.parser.parse_DropTableStmt();
    if (not spec or not P.ok()) {
        D.emit(unit, make_error("Invalid DROP TABLE syntax"));
        return;
    }

    if (not db_.has_collection(spec->table)) {
        if (spec->if_exists)
            D.emit(unit, make_result("Table '" + spec->table + "' does not exist (skipped)"));
        else
            D.emit(unit, make_error("Table '" + spec->table + "' does not exist"));
        return;
    }

    db_.drop_collection(spec->table);
    D.emit(unit, make_result("Table '" + spec->table + "' dropped"));
}


/*======================================================================================================================
 * INSERT
 *====================================================================================================================*/

bool InsertParseStage::matches(const WorkUnit &unit) const
{
    auto stmt = unit.get<Statement>();
    return stmt and stmt->starts_with({TK_Insert, TK_Into});
}

void InsertParseStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    auto &stmt = *unit.get<Statement>();
    StatementParser P(stmt.text);

    std::shared_ptr<InsertSpec> spec = P.parser.parse_InsertStmt();
    if (not spec or not P.ok()) {
        D.emit(unit, make_error("Invalid INSERT syntax: " + stmt.text + "\nExpected: INSERT INTO tablename VALUES (...)"));
        return;
    }
    spec->text = stmt.text;

    /* Every tuple must provide one value per named column.  Without column names, all tuples of a batch must agree in
     * their number of values; the number of columns of the table is checked on execution. */
    if (spec->has_column_names() and not spec->is_batch()) {
        auto &tuple = spec->rows.front();
        if (tuple.size() != spec->columns.size()) {
            std::ostringstream oss;
            oss << "Column count (" << spec->columns.size() << ") does not match value count (" << tuple.size() << ')';
            D.emit(unit, make_error(oss.str()));
            return;
        }
    } else if (spec->is_batch()) {
        const std::size_t arity = spec->has_column_names() ? spec->columns.size() : spec->rows.front().size();
        for (std::size_t i = 0; i != spec->rows.size(); ++i) {
            if (spec->rows[i].size() != arity) {
                D.emit(unit, make_error("Row " + std::to_string(i + 1) + " has wrong number of values"));
                return;
            }
        }
    }

    D.emit(unit, std::move(spec));
}

bool InsertExecuteStage::matches(const WorkUnit &unit) const { return unit.is<InsertSpec>(); }

void InsertExecuteStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    auto &spec = *unit.get<InsertSpec>();

    if (not db_.has_collection(spec.table)) {
        D.emit(unit, make_error("Table '" + spec.table + "' does not exist"));
        return;
    }
    auto &schema = db_.get_collection(spec.table).schema();

    /*----- Build and validate all rows before inserting any. -----*/
    std::vector<Row> rows;
    rows.reserve(spec.rows.size());

    if (spec.has_column_names()) {
        for (auto &column : spec.columns) {
            if (not schema.has(column)) {
                D.emit(unit, make_error("Column '" + column + "' does not exist in table '" + spec.table + "'"));
                return;
            }
        }

        for (auto &tuple : spec.rows) {
            std::unordered_map<std::string_view, const Value*> values;
            for (std::size_t i = 0; i != spec.columns.size(); ++i)
                values[spec.columns[i]] = &tuple[i];

            std::vector<Row::entry_type> entries;
            for (auto &col : schema) {
                if (auto it = values.find(col.name); it != values.end())
                    entries.emplace_back(col.name, *it->second);
                else
                    entries.emplace_back(col.name, col.has_default ? col.default_value : Value::Null());
            }
            rows.emplace_back(std::move(entries));
        }
    } else {
        for (auto &tuple : spec.rows) {
            if (tuple.size() != schema.num_columns()) {
                std::ostringstream oss;
                oss << "Column count mismatch. Table '" << spec.table << "' has " << schema.num_columns()
                    << " columns, but INSERT provides " << tuple.size() << " values";
                D.emit(unit, make_error(oss.str()));
                return;
            }

            std::vector<Row::entry_type> entries;
            auto value = tuple.begin();
            for (auto &col : schema)
                entries.emplace_back(col.name, *value++);
            rows.emplace_back(std::move(entries));
        }
    }

    const std::size_t num_rows = rows.size();
    for (auto &row : rows)
        db_.insert_row(spec.table, std::move(row));
    D.emit(unit, make_result(rows_text(num_rows) + " inserted into '" + spec.table + "'"));
}


/*======================================================================================================================
 * SELECT
 *====================================================================================================================*/

bool SelectParseStage::matches(const WorkUnit &unit) const
{
    auto stmt = unit.get<Statement>();
    return stmt and stmt->starts_with({TK_Select});
}

void SelectParseStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    auto &stmt = *unit.get<Statement>();
    StatementParser P(stmt.text);

    std::shared_ptr<SelectSpec> spec = P.parser.parse_SelectStmt();
    if (not spec or not P.ok()) {
        if (auto msg = P.where_error(stmt.text))
            D.emit(unit, make_error(*msg));
        else
            D.emit(unit, make_error("Invalid SELECT syntax: " + stmt.text + "\nExpected: SELECT columns FROM tablename"));
        return;
    }
    spec->text = stmt.text;
    D.emit(unit, std::move(spec));
}


/*======================================================================================================================
 * UPDATE
 *====================================================================================================================*/

bool UpdateParseStage::matches(const WorkUnit &unit) const
{
    auto stmt = unit.get<Statement>();
    return stmt and stmt->starts_with({TK_Update});
}

void UpdateParseStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    auto &stmt = *unit.get<Statement>();
    StatementParser P(stmt.text);

    std::shared_ptr<UpdateSpec> spec = P.parser.parse_UpdateStmt();
    if (not spec or not P.ok()) {
        if (auto msg = P.where_error(stmt.text))
            D.emit(unit, make_error(*msg));
        else
            D.emit(unit, make_error("Invalid UPDATE syntax\n"
                                    "Expected: UPDATE tablename SET column = value [WHERE condition]"));
        return;
    }
    spec->text = stmt.text;
    D.emit(unit, std::move(spec));
}

bool UpdateExecuteStage::matches(const WorkUnit &unit) const { return unit.is<UpdateSpec>(); }

void UpdateExecuteStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    auto &spec = *unit.get<UpdateSpec>();

    if (not db_.has_collection(spec.table)) {
        D.emit(unit, make_error("Table '" + spec.table + "' does not exist"));
        return;
    }
    auto &schema = db_.get_collection(spec.table).schema();

    for (auto &[column, _] : spec.assignments) {
        if (not schema.has(column)) {
            D.emit(unit, make_error("Column '" + column + "' does not exist in table '" + spec.table + "'"));
            return;
        }
    }
    if (find_unknown_column(spec.where.get(), schema)) {
        D.emit(unit, make_error("Invalid WHERE clause columns"));
        return;
    }

    const auto num_rows = db_.update_rows(spec.table, spec.assignments, ast::make_row_predicate(spec.where.get()));
    D.emit(unit, make_result(rows_text(num_rows) + " updated"));
}


/*======================================================================================================================
 * DELETE
 *====================================================================================================================*/

bool DeleteParseStage::matches(const WorkUnit &unit) const
{
    auto stmt = unit.get<Statement>();
    return stmt and stmt->starts_with({TK_Delete, TK_From});
}

void DeleteParseStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    auto &stmt = *unit.get<Statement>();
    StatementParser P(stmt.text);

    std::shared_ptr<DeleteSpec> spec = P.parser.parse_DeleteStmt();
    if (not spec or not P.ok()) {
        if (auto msg = P.where_error(stmt.text))
            D.emit(unit, make_error(*msg));
        else
            D.emit(unit, make_error("Invalid DELETE syntax\nExpected: DELETE FROM tablename [WHERE condition]"));
        return;
    }
    spec->text = stmt.text;
    D.emit(unit, std::move(spec));
}

bool DeleteExecuteStage::matches(const WorkUnit &unit) const { return unit.is<DeleteSpec>(); }

void DeleteExecuteStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    auto &spec = *unit.get<DeleteSpec>();

    if (not db_.has_collection(spec.table)) {
        D.emit(unit, make_error("Table '" + spec.table + "' does not exist"));
        return;
    }
    if (find_unknown_column(spec.where.get(), db_.get_collection(spec.table).schema())) {
        D.emit(unit, make_error("Invalid WHERE clause columns"));
        return;
    }

    const auto num_rows = db_.delete_rows(spec.table, ast::make_row_predicate(spec.where.get()));
    D.emit(unit, make_result(rows_text(num_rows) + " deleted"));
}
