#include <sisodb/parse/PredicateEvaluator.hpp>

#include <algorithm>
#include <sisodb/util/fn.hpp>


using namespace siso;
using namespace siso::ast;


void PredicateEvaluator::operator()(Const<ErrorPredicate>&)
{
    S_unreachable("an erroneous predicate cannot be evaluated");
}

void PredicateEvaluator::operator()(Const<PredicateLeaf> &p)
{
    const Value &v = row_->get(p.column());

    switch (p.op()) {
        case PredicateLeaf::OP_IsNull:
            result_ = v.is_null();
            return;

        case PredicateLeaf::OP_IsNotNull:
            result_ = not v.is_null();
            return;

        default:
            break;
    }

    if (v.is_null()) {
        result_ = false;
        return;
    }

    switch (p.op()) {
        case PredicateLeaf::OP_Equal:
        case PredicateLeaf::OP_NotEqual:
        case PredicateLeaf::OP_Less:
        case PredicateLeaf::OP_Greater:
        case PredicateLeaf::OP_LessEqual:
        case PredicateLeaf::OP_GreaterEqual: {
            if (p.value().is_null()) {
                result_ = false;
                return;
            }
            const int cmp = compare(v, p.value());
            switch (p.op()) {
                case PredicateLeaf::OP_Equal:        result_ = cmp == 0; break;
                case PredicateLeaf::OP_NotEqual:     result_ = cmp != 0; break;
                case PredicateLeaf::OP_Less:         result_ = cmp <  0; break;
                case PredicateLeaf::OP_Greater:      result_ = cmp >  0; break;
                case PredicateLeaf::OP_LessEqual:    result_ = cmp <= 0; break;
                case PredicateLeaf::OP_GreaterEqual: result_ = cmp >= 0; break;
                default: S_unreachable("not a comparison");
            }
            return;
        }

        case PredicateLeaf::OP_In: {
            auto &list = p.list();
            result_ = std::any_of(list.begin(), list.end(), [&v](const Value &elem) {
                return not elem.is_null() and compare(v, elem) == 0;
            });
            return;
        }

        case PredicateLeaf::OP_Like:
            result_ = not p.value().is_null() and like(v.to_string(), p.value().to_string());
            return;

        case PredicateLeaf::OP_Between: {
            auto &[min, max] = p.range();
            result_ = not min.is_null() and not max.is_null() and compare(v, min) >= 0 and compare(v, max) <= 0;
            return;
        }

        case PredicateLeaf::OP_IsNull:
        case PredicateLeaf::OP_IsNotNull:
            S_unreachable("NULL tests are handled above");
    }
}

void PredicateEvaluator::operator()(Const<PredicateBranch> &p)
{
    (*this)(*p.lhs);
    const bool lhs = result_;
    (*this)(*p.rhs);
    const bool rhs = result_;
    result_ = p.is_conjunction() ? lhs and rhs : lhs or rhs;
}
