#include <sisodb/stages/Stages.hpp>

#include "stages/StageUtil.hpp"
#include <iomanip>
#include <sisodb/io/StorageEngine.hpp>
#include <sisodb/parse/Statement.hpp>
#include <sstream>


using namespace siso;


namespace {

std::string kilobytes(std::size_t bytes)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << (double(bytes) / 1024.);
    return oss.str();
}

}


/*======================================================================================================================
 * SAVE DATABASE
 *====================================================================================================================*/

bool SaveStage::matches(const WorkUnit &unit) const
{
    auto stmt = unit.get<Statement>();
    return stmt and stmt->starts_with({TK_Save, TK_Database});
}

void SaveStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    auto &stmt = *unit.get<Statement>();
    StatementParser P(stmt.text);

    auto spec = P.parser.parse_SaveStmt();
    if (not spec or not P.ok()) {
        D.emit(unit, make_error("Invalid SAVE DATABASE syntax\nExpected: SAVE DATABASE 'filename'"));
        return;
    }

    const std::string path = StorageEngine::with_extension(spec->filename);
    try {
        const auto bytes = StorageEngine::save(db_, path);
        D.emit(unit, make_result("Database saved to '" + path + "' (" + kilobytes(bytes) + " KB)"));
    } catch (const runtime_error &e) {
        D.emit(unit, make_error(e.what()));
    }
}


/*======================================================================================================================
 * LOAD DATABASE
 *====================================================================================================================*/

bool LoadStage::matches(const WorkUnit &unit) const
{
    auto stmt = unit.get<Statement>();
    return stmt and stmt->starts_with({TK_Load, TK_Database});
}

void LoadStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    auto &stmt = *unit.get<Statement>();
    StatementParser P(stmt.text);

    auto spec = P.parser.parse_LoadStmt();
    if (not spec or not P.ok()) {
        D.emit(unit, make_error("Invalid LOAD DATABASE syntax\nExpected: LOAD DATABASE 'filename'"));
        return;
    }

    const std::string path = StorageEngine::with_extension(spec->filename);
    try {
        db_ = StorageEngine::load(path);
        std::ostringstream oss;
        oss << "Database loaded from '" << path << "' (" << db_.num_collections() << " tables, "
            << kilobytes(StorageEngine::file_size(path)) << " KB)";
        D.emit(unit, make_result(oss.str()));
    } catch (const runtime_error &e) {
        D.emit(unit, make_error(e.what()));
    }
}


/*======================================================================================================================
 * Terminal stages
 *====================================================================================================================*/

bool ResultStage::matches(const WorkUnit &unit) const { return unit.is<Terminal>(); }

void ResultStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    D.set_result(unit.get<Terminal>()->text);
}

bool ErrorStage::matches(const WorkUnit &unit) const
{
    auto &T = unit.trace;
    return T.total_stages != 0 and T.declined_by.size() + 1 == T.total_stages and not T.has_declined(name());
}

void ErrorStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    if (production_)
        D.emit(unit, make_error("Invalid SQL syntax"));
    else
        D.emit(unit, make_error("ERROR:\n" + unit.error_report()));
}


/*======================================================================================================================
 * Pipeline
 *====================================================================================================================*/

void siso::register_stages(Dispatcher &D, Database &db, bool production)
{
    D.register_stage<SaveStage>(db);
    D.register_stage<LoadStage>(db);
    D.register_stage<CreateTableParseStage>();
    D.register_stage<CreateTableExecuteStage>(db);
    D.register_stage<DropTableStage>(db);
    D.register_stage<InsertParseStage>();
    D.register_stage<InsertExecuteStage>(db);
    D.register_stage<SelectParseStage>();
    D.register_stage<TableScanStage>(db);
    D.register_stage<FilterStage>();
    D.register_stage<OrderByStage>();
    D.register_stage<ProjectionStage>();
    D.register_stage<DistinctStage>();
    D.register_stage<LimitStage>();
    D.register_stage<ResultSetStage>();
    D.register_stage<UpdateParseStage>();
    D.register_stage<UpdateExecuteStage>(db);
    D.register_stage<DeleteParseStage>();
    D.register_stage<DeleteExecuteStage>(db);
    D.register_stage<ResultStage>();
    D.register_stage<ErrorStage>(production);
}
