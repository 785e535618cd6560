#pragma once


#include "lex/Lexer.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <sisodb/lex/Token.hpp>
#include <sisodb/lex/TokenType.hpp>
#include <sisodb/parse/Predicate.hpp>
#include <sisodb/parse/Statement.hpp>
#include <sisodb/util/Diagnostic.hpp>
#include <utility>


namespace siso {

namespace ast {

struct S_EXPORT Parser
{
    using follow_set_t = std::array<bool, unsigned(TokenType::TokenType_MAX) + 1>;
    ///> a half-open range of character offsets into the input
    using range_t = std::pair<std::size_t, std::size_t>;

    public:
    Lexer      &lexer;
    Diagnostic &diag;

    private:
    std::array<Token, 2> lookahead_;
    std::optional<range_t> failed_condition_;

    public:
    explicit Parser(Lexer &lexer)
        : lexer(lexer)
        , diag(lexer.diag)
        , lookahead_({Token(), Token()})
    {
        consume();
        consume();
    }

    template<unsigned Idx = 0>
    const Token & token() { return lookahead_[Idx]; }

    bool is(const TokenType tt) { return token() == tt; }
    bool no(const TokenType tt) { return token() != tt; }

    Token consume() {
        auto old = token();
        for (std::size_t i = 1; i != lookahead_.size(); ++i)
            lookahead_[i - 1] = lookahead_[i];
        lookahead_.back() = lexer.next();
        return old;
    }

    bool accept(const TokenType tt) {
        if (token() == tt or token() == TK_ERROR) {
            consume();
            return true;
        }
        return false;
    }

    bool expect(const TokenType tt) {
        if (accept(tt)) return true;
        diag.e(token().pos) << "expected " << tt << ", got " << token().text << '\n';
        return false;
    }

    /** Expects the name of a table or column.  Besides identifiers, accepts keywords that cannot be mistaken for
     * clause structure at this point, e.g. `key` or `desc`.  The name is the text of the consumed token. */
    bool expect_name();

    /** Consumes tokens until the first occurence of a token in the follow set \p FS is found. */
    void recover(const follow_set_t &FS) { while (token() and not FS[token().type]) consume(); }

    /** Consumes tokens until the first occurence of a token in the follow set \p FS is found.  Returns an empty
     * pointer to a `T`, signaling the failed parse to the caller. */
    template<typename T>
    std::unique_ptr<T> recover(const follow_set_t &FS) {
        recover(FS);
        return nullptr;
    }

    /** If the last parse failed within a `WHERE` clause, returns the range of the input covered by that clause. */
    const std::optional<range_t> & failed_condition() const { return failed_condition_; }

    /* Statements */
    /** Parses a `CREATE TABLE` statement.
     *
     * @throw invalid_argument if a column definition is malformed or the table has no columns
     */
    std::unique_ptr<CreateTableSpec> parse_CreateTableStmt();
    std::unique_ptr<DropTableSpec> parse_DropTableStmt();
    std::unique_ptr<InsertSpec> parse_InsertStmt();
    std::unique_ptr<SelectSpec> parse_SelectStmt();
    std::unique_ptr<UpdateSpec> parse_UpdateStmt();
    std::unique_ptr<DeleteSpec> parse_DeleteStmt();
    std::unique_ptr<DatabaseFileSpec> parse_SaveStmt();
    std::unique_ptr<DatabaseFileSpec> parse_LoadStmt();

    /* Clauses */
    /** Parses the condition following `WHERE`.  Returns `nullptr` and records the failed clause on error. */
    std::unique_ptr<Predicate> parse_WhereClause(const follow_set_t &FS);

    /* Predicates */
    std::unique_ptr<Predicate> parse_Predicate(int precedence_lhs = 0, std::unique_ptr<Predicate> lhs = nullptr);
    std::unique_ptr<Predicate> parse_Condition();

    /* Values */
    std::optional<Value> parse_Value();
    std::optional<std::vector<Value>> parse_Tuple();
    std::optional<uint64_t> expect_integer();

    private:
    /** Parses the definition of the column named \p name, up to the next `,` or `)`. */
    Column parse_ColumnDefinition(const Token &name);
    /** Accepts an optional `;` and expects the end of input. */
    bool expect_end();
};

/** Parses a stand-alone condition, e.g. the text of a `WHERE` clause.  Returns the predicate tree, or `nullptr` if the
 * condition is malformed.  Errors are reported to \p diag.  No partial tree is ever returned. */
std::unique_ptr<Predicate> S_EXPORT parse_predicate(const std::string &condition, Diagnostic &diag);

}

}
