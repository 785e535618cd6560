#pragma once

#include <iostream>
#include <memory>
#include <sisodb/catalog/Value.hpp>
#include <sisodb/lex/Token.hpp>
#include <sisodb/sisodb-config.hpp>
#include <sisodb/util/macro.hpp>
#include <sisodb/util/Visitor.hpp>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>


namespace siso {

namespace ast {

// forward declare the Predicate visitor
struct PredicateVisitor;
struct ConstPredicateVisitor;

/** A predicate of a `WHERE` clause.  Predicates form a binary tree of `PredicateBranch`es with `PredicateLeaf`s at
 * the leaves.  A predicate tree is immutable once built. */
struct S_EXPORT Predicate
{
    Token tok; ///< the token of the predicate; the column name for a leaf, the connective for a branch

    explicit Predicate(Token tok) : tok(std::move(tok)) { }
    virtual ~Predicate() { }

    /** Returns `true` iff \p other is *syntactically* equal to `this`. */
    virtual bool operator==(const Predicate &other) const = 0;
    bool operator!=(const Predicate &other) const { return not operator==(other); }

    virtual void accept(PredicateVisitor &v) = 0;
    virtual void accept(ConstPredicateVisitor &v) const = 0;

    /** Returns the names of all columns referenced by this predicate, in order of first occurrence. */
    std::vector<std::string> columns() const;

    friend std::ostream & S_EXPORT operator<<(std::ostream &out, const Predicate &p);

S_LCOV_EXCL_START
    friend std::string to_string(const Predicate &p) {
        std::ostringstream oss;
        oss << p;
        return oss.str();
    }
S_LCOV_EXCL_STOP

    void dump(std::ostream &out) const;
    void dump() const;
};

/** The error predicate.  Used when the parser encountered a syntactical error. */
struct S_EXPORT ErrorPredicate : Predicate
{
    explicit ErrorPredicate(Token tok) : Predicate(std::move(tok)) { }

    bool operator==(const Predicate &other) const override;

    void accept(PredicateVisitor &v) override;
    void accept(ConstPredicateVisitor &v) const override;
};

/** A condition on a single column, e.g. `age > 25`, `name LIKE 'A%'`, or `city IS NOT NULL`. */
struct S_EXPORT PredicateLeaf : Predicate
{
#define SISODB_PREDICATE_OPERATORS(X) \
    X(Equal,        "=") \
    X(NotEqual,     "!=") \
    X(Less,         "<") \
    X(Greater,      ">") \
    X(LessEqual,    "<=") \
    X(GreaterEqual, ">=") \
    X(In,           "IN") \
    X(Like,         "LIKE") \
    X(Between,      "BETWEEN") \
    X(IsNull,       "IS NULL") \
    X(IsNotNull,    "IS NOT NULL")

    enum operator_kind {
#define X(NAME, _) OP_##NAME,
        SISODB_PREDICATE_OPERATORS(X)
#undef X
    };

    using range_type = std::pair<Value, Value>;
    using list_type = std::vector<Value>;
    using operand_type = std::variant<std::monostate, Value, range_type, list_type>;

    private:
    operator_kind op_;
    operand_type operand_;

    public:
    /** Creates a leaf.  The shape of \p operand must match \p op: `BETWEEN` takes a range, `IN` a list, the `NULL`
     * tests no operand, and all other operators a single value. */
    PredicateLeaf(Token column, operator_kind op, operand_type operand);

    const std::string & column() const { return tok.text; }
    operator_kind op() const { return op_; }
    const operand_type & operand() const { return operand_; }

    const Value & value() const { return std::get<Value>(operand_); }
    const range_type & range() const { return std::get<range_type>(operand_); }
    const list_type & list() const { return std::get<list_type>(operand_); }

    /** Returns `true` iff \p op is a comparison, i.e. one of `=`, `!=`, `<`, `>`, `<=`, and `>=`. */
    static bool is_comparison(operator_kind op) { return op <= OP_GreaterEqual; }

    bool operator==(const Predicate &other) const override;

    void accept(PredicateVisitor &v) override;
    void accept(ConstPredicateVisitor &v) const override;
};

/** Returns the SQL spelling of \p op. */
const char * S_EXPORT get_name(PredicateLeaf::operator_kind op);

/** A conjunction or disjunction of two predicates. */
struct S_EXPORT PredicateBranch : Predicate
{
    std::unique_ptr<Predicate> lhs;
    std::unique_ptr<Predicate> rhs;

    PredicateBranch(Token op, std::unique_ptr<Predicate> lhs, std::unique_ptr<Predicate> rhs)
        : Predicate(std::move(op))
        , lhs(S_notnull(std::move(lhs)))
        , rhs(S_notnull(std::move(rhs)))
    {
        S_insist(tok.type == TK_And or tok.type == TK_Or, "a branch must be a conjunction or a disjunction");
    }

    bool is_conjunction() const { return tok.type == TK_And; }
    bool is_disjunction() const { return tok.type == TK_Or; }

    bool operator==(const Predicate &other) const override;

    void accept(PredicateVisitor &v) override;
    void accept(ConstPredicateVisitor &v) const override;
};

#define SISODB_PREDICATE_LIST(X) \
    X(siso::ast::ErrorPredicate) \
    X(siso::ast::PredicateLeaf) \
    X(siso::ast::PredicateBranch)

S_DECLARE_VISITOR(PredicateVisitor, Predicate, SISODB_PREDICATE_LIST)
S_DECLARE_VISITOR(ConstPredicateVisitor, const Predicate, SISODB_PREDICATE_LIST)

}

}
