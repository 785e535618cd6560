#include <sisodb/parse/Predicate.hpp>

#include <algorithm>
#include <sisodb/util/fn.hpp>


using namespace siso;
using namespace siso::ast;


namespace {

/** Prints a predicate as SQL.  Branches are parenthesized, so the printed text reflects the tree structure. */
struct PredicatePrinter : ConstPredicateVisitor
{
    std::ostream &out;

    explicit PredicatePrinter(std::ostream &out) : out(out) { }

    using ConstPredicateVisitor::operator();

    void print(const Value &v) {
        if (v.is_string())
            out << quote(v.as_s());
        else
            out << v;
    }

    void operator()(Const<ErrorPredicate> &p) override { out << "[error-predicate] " << p.tok.text; }

    void operator()(Const<PredicateLeaf> &p) override {
        out << p.column() << ' ' << get_name(p.op());
        switch (p.op()) {
            case PredicateLeaf::OP_IsNull:
            case PredicateLeaf::OP_IsNotNull:
                break;

            case PredicateLeaf::OP_Between:
                out << ' ';
                print(p.range().first);
                out << " AND ";
                print(p.range().second);
                break;

            case PredicateLeaf::OP_In: {
                out << " (";
                auto &list = p.list();
                for (auto it = list.begin(); it != list.end(); ++it) {
                    if (it != list.begin()) out << ", ";
                    print(*it);
                }
                out << ')';
                break;
            }

            default:
                out << ' ';
                print(p.value());
                break;
        }
    }

    void operator()(Const<PredicateBranch> &p) override {
        out << '(';
        (*this)(*p.lhs);
        out << (p.is_conjunction() ? " AND " : " OR ");
        (*this)(*p.rhs);
        out << ')';
    }
};

/** Collects the names of all columns referenced by a predicate. */
struct ColumnCollector : ConstPredicateVisitor
{
    std::vector<std::string> columns;

    using ConstPredicateVisitor::operator();

    void operator()(Const<ErrorPredicate>&) override { }

    void operator()(Const<PredicateLeaf> &p) override {
        if (std::find(columns.begin(), columns.end(), p.column()) == columns.end())
            columns.push_back(p.column());
    }

    void operator()(Const<PredicateBranch> &p) override {
        (*this)(*p.lhs);
        (*this)(*p.rhs);
    }
};

}


/*======================================================================================================================
 * Predicate
 *====================================================================================================================*/

std::vector<std::string> Predicate::columns() const
{
    ColumnCollector C;
    C(*this);
    return std::move(C.columns);
}

namespace siso::ast {

std::ostream & operator<<(std::ostream &out, const Predicate &p)
{
    PredicatePrinter P(out);
    P(p);
    return out;
}

}

S_LCOV_EXCL_START
void Predicate::dump(std::ostream &out) const { out << *this << std::endl; }
void Predicate::dump() const { dump(std::cerr); }
S_LCOV_EXCL_STOP

const char * siso::ast::get_name(PredicateLeaf::operator_kind op)
{
    switch (op) {
#define X(NAME, TEXT) case PredicateLeaf::OP_##NAME: return TEXT;
        SISODB_PREDICATE_OPERATORS(X)
#undef X
    }
    S_unreachable("invalid predicate operator");
}


/*======================================================================================================================
 * PredicateLeaf
 *====================================================================================================================*/

PredicateLeaf::PredicateLeaf(Token column, operator_kind op, operand_type operand)
    : Predicate(std::move(column))
    , op_(op)
    , operand_(std::move(operand))
{
    switch (op_) {
        case OP_IsNull:
        case OP_IsNotNull:
            S_insist(std::holds_alternative<std::monostate>(operand_), "NULL tests take no operand");
            break;

        case OP_Between:
            S_insist(std::holds_alternative<range_type>(operand_), "BETWEEN requires a range");
            break;

        case OP_In:
            S_insist(std::holds_alternative<list_type>(operand_), "IN requires a list");
            break;

        default:
            S_insist(std::holds_alternative<Value>(operand_), "comparison requires a single value");
            break;
    }
}


/*======================================================================================================================
 * operator==()
 *====================================================================================================================*/

bool ErrorPredicate::operator==(const Predicate &o) const { return is<const ErrorPredicate>(o); }

bool PredicateLeaf::operator==(const Predicate &o) const
{
    if (auto other = cast<const PredicateLeaf>(&o))
        return this->column() == other->column() and this->op_ == other->op_ and this->operand_ == other->operand_;
    return false;
}

bool PredicateBranch::operator==(const Predicate &o) const
{
    if (auto other = cast<const PredicateBranch>(&o))
        return this->tok.type == other->tok.type and *this->lhs == *other->lhs and *this->rhs == *other->rhs;
    return false;
}


/*======================================================================================================================
 * accept()
 *====================================================================================================================*/

#define ACCEPT(CLASS) \
    void CLASS::accept(PredicateVisitor &v) { v(*this); } \
    void CLASS::accept(ConstPredicateVisitor &v) const { v(*this); }
ACCEPT(ErrorPredicate);
ACCEPT(PredicateLeaf);
ACCEPT(PredicateBranch);
#undef ACCEPT
