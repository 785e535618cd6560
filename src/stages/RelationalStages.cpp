#include <sisodb/stages/Stages.hpp>

#include "stages/StageUtil.hpp"
#include <algorithm>
#include <boost/container_hash/hash.hpp>
#include <sisodb/parse/PredicateEvaluator.hpp>
#include <sisodb/parse/Statement.hpp>
#include <sisodb/pipeline/RowSet.hpp>
#include <unordered_set>


using namespace siso;


namespace {

/** Returns the row set of \p unit if it is due for \p phase. */
const RowSet * due_for(const WorkUnit &unit, RowSet::phase_t phase)
{
    auto R = unit.get<RowSet>();
    return R and R->next_phase() == phase ? R : nullptr;
}

/** Hashes the values of the given columns of a row. */
struct RowSignatureHash
{
    const std::vector<std::string> &columns;

    std::size_t operator()(const row_ptr &row) const {
        std::size_t seed = 0;
        for (auto &column : columns)
            boost::hash_combine(seed, std::hash<Value>{}(row->get(column)));
        return seed;
    }
};

/** Compares the values of the given columns of two rows. */
struct RowSignatureEqual
{
    const std::vector<std::string> &columns;

    bool operator()(const row_ptr &left, const row_ptr &right) const {
        return std::all_of(columns.begin(), columns.end(), [&](const std::string &column) {
            return left->get(column) == right->get(column);
        });
    }
};

}


/*======================================================================================================================
 * TableScan
 *====================================================================================================================*/

bool TableScanStage::matches(const WorkUnit &unit) const { return unit.is<SelectSpec>(); }

void TableScanStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    auto select = std::static_pointer_cast<const SelectSpec>(unit.payload);

    if (not db_.has_collection(select->table)) {
        D.emit(unit, make_error("Table '" + select->table + "' does not exist"));
        return;
    }
    auto &table = db_.get_collection(select->table);
    auto &schema = table.schema();

    /*----- Validate the columns referenced by the query. -----*/
    for (auto &column : select->columns) {
        if (not schema.has(column)) {
            D.emit(unit, make_error("Column '" + column + "' does not exist in table '" + select->table + "'"));
            return;
        }
    }
    if (select->order_by and not schema.has(select->order_by->column)) {
        D.emit(unit, make_error("ORDER BY column '" + select->order_by->column + "' does not exist"));
        return;
    }
    if (select->where) {
        for (auto &column : select->where->columns()) {
            if (not schema.has(column)) {
                D.emit(unit, make_error("Invalid WHERE clause columns"));
                return;
            }
        }
    }

    auto columns = select->selects_all() ? schema.column_names() : select->columns;
    D.emit(unit, std::make_shared<const RowSet>(table.rows(), std::move(columns), std::move(select), RowSet::P_Scan));
}


/*======================================================================================================================
 * Filter
 *====================================================================================================================*/

bool FilterStage::matches(const WorkUnit &unit) const { return due_for(unit, RowSet::P_Filter); }

void FilterStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    auto &R = *unit.get<RowSet>();
    auto &where = *R.select->where;

    ast::PredicateEvaluator E;
    std::vector<row_ptr> rows;
    std::copy_if(R.rows.begin(), R.rows.end(), std::back_inserter(rows), [&](const row_ptr &row) {
        return E(where, *row);
    });
    D.emit(unit, R.advance(RowSet::P_Filter, std::move(rows)));
}


/*======================================================================================================================
 * OrderBy
 *====================================================================================================================*/

namespace {

/** Orders non-`NULL` sort keys.  Numeric values precede all others, so that columns of mixed kinds are ordered
 * consistently; within either group the usual comparison applies. */
int compare_keys(const Value &left, const Value &right)
{
    const bool l_numeric = left.is_numeric();
    const bool r_numeric = right.is_numeric();
    if (l_numeric != r_numeric)
        return l_numeric ? -1 : 1;
    return compare(left, right);
}

}

bool OrderByStage::matches(const WorkUnit &unit) const { return due_for(unit, RowSet::P_Order); }

void OrderByStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    auto &R = *unit.get<RowSet>();
    auto &order = *R.select->order_by;

    std::vector<row_ptr> rows(R.rows);
    std::stable_sort(rows.begin(), rows.end(), [&order](const row_ptr &left, const row_ptr &right) {
        const Value &l = left->get(order.column);
        const Value &r = right->get(order.column);
        if (l.is_null() or r.is_null())
            return r.is_null() and not l.is_null(); // NULL is last in either direction
        const int cmp = compare_keys(l, r);
        return order.descending ? cmp > 0 : cmp < 0;
    });
    D.emit(unit, R.advance(RowSet::P_Order, std::move(rows)));
}


/*======================================================================================================================
 * Projection
 *====================================================================================================================*/

bool ProjectionStage::matches(const WorkUnit &unit) const { return due_for(unit, RowSet::P_Project); }

void ProjectionStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    auto &R = *unit.get<RowSet>();

    std::vector<row_ptr> rows;
    rows.reserve(R.size());
    for (auto &row : R.rows)
        rows.push_back(std::make_shared<const Row>(row->project(R.columns)));
    D.emit(unit, R.advance(RowSet::P_Project, std::move(rows)));
}


/*======================================================================================================================
 * Distinct
 *====================================================================================================================*/

bool DistinctStage::matches(const WorkUnit &unit) const { return due_for(unit, RowSet::P_Distinct); }

void DistinctStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    auto &R = *unit.get<RowSet>();

    std::unordered_set<row_ptr, RowSignatureHash, RowSignatureEqual> seen(
        R.size(), RowSignatureHash{R.columns}, RowSignatureEqual{R.columns}
    );
    std::vector<row_ptr> rows;
    for (auto &row : R.rows) {
        if (seen.insert(row).second)
            rows.push_back(row);
    }
    D.emit(unit, R.advance(RowSet::P_Distinct, std::move(rows)));
}


/*======================================================================================================================
 * Limit
 *====================================================================================================================*/

bool LimitStage::matches(const WorkUnit &unit) const { return due_for(unit, RowSet::P_Limit); }

void LimitStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    auto &R = *unit.get<RowSet>();
    const uint64_t offset = R.select->offset.value_or(0);
    const uint64_t limit = *R.select->limit;

    std::vector<row_ptr> rows;
    for (uint64_t i = offset; i < R.size() and i - offset < limit; ++i)
        rows.push_back(R.rows[i]);
    D.emit(unit, R.advance(RowSet::P_Limit, std::move(rows)));
}


/*======================================================================================================================
 * ResultSet
 *====================================================================================================================*/

bool ResultSetStage::matches(const WorkUnit &unit) const { return due_for(unit, RowSet::P_Done); }

void ResultSetStage::transform(const WorkUnit &unit, Dispatcher &D) const
{
    D.emit(unit, make_result(unit.get<RowSet>()->render()));
}
