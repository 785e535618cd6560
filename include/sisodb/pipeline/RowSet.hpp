#pragma once

#include <memory>
#include <sisodb/parse/Statement.hpp>
#include <sisodb/pipeline/Payload.hpp>
#include <sisodb/sisodb-config.hpp>
#include <sisodb/storage/Store.hpp>
#include <string>
#include <vector>


namespace siso {

/** A set of rows in flight through the relational operators of a `SELECT`.  The row set refers to the rows of the
 * store rather than copying them and keeps a reference to the `SelectSpec` it was created for, so that the operators
 * can consult the query. */
struct S_EXPORT RowSet : Payload
{
#define SISODB_ROWSET_PHASES(X) \
    X(Scan) \
    X(Filter) \
    X(Order) \
    X(Project) \
    X(Distinct) \
    X(Limit) \
    X(Done)

    /** The phases of a `SELECT`, in the order they are applied. */
    enum phase_t {
#define X(NAME) P_##NAME,
        SISODB_ROWSET_PHASES(X)
#undef X
    };

    std::vector<row_ptr> rows;
    ///> the columns of the result, in order
    std::vector<std::string> columns;
    std::shared_ptr<const SelectSpec> select;
    ///> the last phase this row set passed through
    phase_t phase;

    RowSet(std::vector<row_ptr> rows, std::vector<std::string> columns, std::shared_ptr<const SelectSpec> select,
           phase_t phase)
        : rows(std::move(rows))
        , columns(std::move(columns))
        , select(S_notnull(std::move(select)))
        , phase(phase)
    { }

    std::size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }

    /** Returns `true` iff the query of this row set calls for \p phase. */
    bool calls_for(phase_t phase) const;

    /** Returns the next phase this row set must pass through, skipping the phases its query does not call for.
     * Returns `P_Done` once all phases are complete. */
    phase_t next_phase() const;

    /** Returns a copy of this row set holding \p rows that has passed through \p phase. */
    std::shared_ptr<const RowSet> advance(phase_t phase, std::vector<row_ptr> rows) const {
        return std::make_shared<const RowSet>(std::move(rows), columns, select, phase);
    }

    /** Renders the rows as a table: the row count, a header line, a separator line, and one line per row. */
    std::string render() const;

    std::string to_string() const override;
};

/** Returns the name of \p phase. */
const char * S_EXPORT get_name(RowSet::phase_t phase);

}
