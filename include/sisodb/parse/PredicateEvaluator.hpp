#pragma once

#include <sisodb/parse/Predicate.hpp>
#include <sisodb/sisodb-config.hpp>
#include <sisodb/storage/Store.hpp>


namespace siso {

namespace ast {

/** Evaluates predicates against single rows.
 *
 * Comparisons treat both sides numerically if both are numeric, and compare their textual renderings otherwise.  A
 * comparison involving `NULL` is false.  Likewise, `IN`, `LIKE`, and `BETWEEN` are false for a `NULL` column value.
 * Only `IS NULL` and `IS NOT NULL` observe `NULL`.  A column missing from the row is `NULL`.
 */
struct S_EXPORT PredicateEvaluator : ConstPredicateVisitor
{
    private:
    const Row *row_ = nullptr;
    bool result_ = false;

    public:
    PredicateEvaluator() = default;

    /** Returns `true` iff \p row satisfies \p pred. */
    bool operator()(const Predicate &pred, const Row &row) {
        row_ = &row;
        (*this)(pred);
        return result_;
    }

    using ConstPredicateVisitor::operator();
#define DECLARE(CLASS) void operator()(Const<CLASS> &p) override;
    SISODB_PREDICATE_LIST(DECLARE)
#undef DECLARE
};

/** Returns `true` iff \p row satisfies \p pred. */
inline bool evaluate(const Predicate &pred, const Row &row)
{
    PredicateEvaluator E;
    return E(pred, row);
}

/** Returns a `row_predicate` that evaluates \p pred.  \p pred must outlive the returned function.  If \p pred is
 * `nullptr`, the returned function is empty and thus selects every row. */
inline row_predicate make_row_predicate(const Predicate *pred)
{
    if (not pred) return row_predicate();
    return [pred](const Row &row) { return evaluate(*pred, row); };
}

}

}
