#include "parse/Parser.hpp"

#include <cerrno>
#include <cstdlib>
#include <initializer_list>
#include <sisodb/util/exception.hpp>
#include <sisodb/util/fn.hpp>
#include <sstream>
#include <utility>


using namespace siso;
using namespace siso::ast;


namespace {

/** Returns the precedence of a connective.  A higher value means the connective binds stronger. */
int get_precedence(const TokenType tt)
{
    int p = 0;
    /* List all connectives.  The higher up a connective is in the switch statement, the higher its precedence. */
    switch (tt) {
        default:                    return -1;
        /* logical AND */
        case TK_And:                ++p;
        /* logical OR */
        case TK_Or:                 ++p;
    }
    return p;
}

/** Returns the predicate operator denoted by the comparison token \p tt, if any. */
std::optional<PredicateLeaf::operator_kind> get_comparison(const TokenType tt)
{
    switch (tt) {
        default:                return std::nullopt;
        case TK_EQUAL:          return PredicateLeaf::OP_Equal;
        case TK_BANG_EQUAL:
        case TK_LESS_GREATER:   return PredicateLeaf::OP_NotEqual;
        case TK_LESS:           return PredicateLeaf::OP_Less;
        case TK_GREATER:        return PredicateLeaf::OP_Greater;
        case TK_LESS_EQUAL:     return PredicateLeaf::OP_LessEqual;
        case TK_GREATER_EQUAL:  return PredicateLeaf::OP_GreaterEqual;
    }
}

}


/*======================================================================================================================
 * Follow sets
 *====================================================================================================================*/

namespace {

constexpr Parser::follow_set_t make_follow_set(std::initializer_list<TokenType> tokens)
{
    Parser::follow_set_t F{};
    for (TokenType tk : tokens) {
        S_insist(tk <= TokenType::TokenType_MAX);
        F[tk] = true;
    }
    return F;
}

#define S_FOLLOW(NAME, SET) \
const Parser::follow_set_t follow_set_##NAME = make_follow_set SET ;
#include "tables/FollowSet.tbl"
#undef S_FOLLOW

/* Tokens that can name a table or column.  Keywords that may begin or continue a clause where a name is expected, e.g.
 * `FROM` in a select list or `IF` after `CREATE TABLE`, are excluded. */
const Parser::follow_set_t name_tokens = make_follow_set({
    TK_IDENTIFIER,
    TK_Asc, TK_By, TK_Create, TK_Database, TK_Default, TK_Delete, TK_Desc, TK_Drop, TK_Exists, TK_Insert, TK_Into,
    TK_Key, TK_Load, TK_Offset, TK_Primary, TK_Save, TK_Select, TK_Set, TK_Table, TK_Update, TK_Values,
});

}


/*======================================================================================================================
 * statements
 *====================================================================================================================*/

bool Parser::expect_name()
{
    if (name_tokens[token().type]) {
        consume();
        return true;
    }
    return expect(TK_IDENTIFIER);
}

std::unique_ptr<CreateTableSpec> Parser::parse_CreateTableStmt()
{
    auto spec = std::make_unique<CreateTableSpec>();

    /* 'CREATE' 'TABLE' */
    if (not expect(TK_Create))
        return recover<CreateTableSpec>(follow_set_STATEMENT);
    if (not expect(TK_Table))
        return recover<CreateTableSpec>(follow_set_STATEMENT);

    /* [ 'IF' 'NOT' 'EXISTS' ] */
    if (accept(TK_If)) {
        if (not expect(TK_Not))
            return recover<CreateTableSpec>(follow_set_STATEMENT);
        if (not expect(TK_Exists))
            return recover<CreateTableSpec>(follow_set_STATEMENT);
        spec->if_not_exists = true;
    }

    /* identifier '(' */
    Token table_name = token();
    if (not expect_name())
        return recover<CreateTableSpec>(follow_set_STATEMENT);
    spec->table = table_name.text;
    spec->schema = Schema(table_name.text);

    if (not expect(TK_LPAR))
        return recover<CreateTableSpec>(follow_set_STATEMENT);

    if (is(TK_RPAR))
        throw invalid_argument("Table must have at least one column");

    /* column-definition { ',' column-definition } */
    do {
        Token id = token();
        if (not expect_name())
            return recover<CreateTableSpec>(follow_set_STATEMENT);
        spec->schema.add(parse_ColumnDefinition(id));
    } while (accept(TK_COMMA));

    /* ')' */
    if (not expect(TK_RPAR))
        return recover<CreateTableSpec>(follow_set_STATEMENT);

    if (not expect_end())
        return nullptr;
    return spec;
}

Column Parser::parse_ColumnDefinition(const Token &name)
{
    Column col(name.text);
    bool has_type = false;

    /* { data-type | 'PRIMARY' 'KEY' | 'NOT' 'NULL' | 'DEFAULT' value } */
    while (not follow_set_COLUMN_DEFINITION[token().type]) {
        switch (token().type) {
            /* 'PRIMARY' 'KEY' */
            case TK_Primary:
                consume();
                if (no(TK_Key))
                    throw invalid_argument("Expected KEY after PRIMARY in column '" + col.name + "'");
                consume();
                col.primary_key = true;
                col.not_nullable = true;
                break;

            /* 'NOT' 'NULL' */
            case TK_Not:
                consume();
                if (no(TK_Null))
                    throw invalid_argument("Expected NULL after NOT in column '" + col.name + "'");
                consume();
                col.not_nullable = true;
                break;

            /* 'DEFAULT' value */
            case TK_Default: {
                consume();
                if (follow_set_COLUMN_DEFINITION[token().type])
                    throw invalid_argument("Expected value after DEFAULT in column '" + col.name + "'");
                auto value = parse_Value();
                if (not value)
                    throw invalid_argument("Expected value after DEFAULT in column '" + col.name + "'");
                col.default_value = std::move(*value);
                col.has_default = true;
                break;
            }

            /* data-type */
            case TK_IDENTIFIER:
                if (auto type = parse_column_type(token().text)) {
                    if (has_type)
                        throw invalid_argument("Multiple types specified for column '" + col.name + "'");
                    col.type = *type;
                    has_type = true;
                    consume();
                    break;
                }
                /* fallthrough */

            default:
                throw invalid_argument("Unknown keyword '" + to_upper(token().text) + "' in column '" + col.name + "'");
        }
    }

    return col;
}

std::unique_ptr<DropTableSpec> Parser::parse_DropTableStmt()
{
    auto spec = std::make_unique<DropTableSpec>();

    /* 'DROP' 'TABLE' */
    if (not expect(TK_Drop))
        return recover<DropTableSpec>(follow_set_STATEMENT);
    if (not expect(TK_Table))
        return recover<DropTableSpec>(follow_set_STATEMENT);

    /* [ 'IF' 'EXISTS' ] */
    if (accept(TK_If)) {
        if (not expect(TK_Exists))
            return recover<DropTableSpec>(follow_set_STATEMENT);
        spec->if_exists = true;
    }

    /* identifier */
    Token table_name = token();
    if (not expect_name())
        return recover<DropTableSpec>(follow_set_STATEMENT);
    spec->table = table_name.text;

    if (not expect_end())
        return nullptr;
    return spec;
}

std::unique_ptr<InsertSpec> Parser::parse_InsertStmt()
{
    auto spec = std::make_unique<InsertSpec>();

    /* 'INSERT' 'INTO' identifier */
    if (not expect(TK_Insert))
        return recover<InsertSpec>(follow_set_STATEMENT);
    if (not expect(TK_Into))
        return recover<InsertSpec>(follow_set_STATEMENT);

    Token table_name = token();
    if (not expect_name())
        return recover<InsertSpec>(follow_set_STATEMENT);
    spec->table = table_name.text;

    /* [ '(' identifier { ',' identifier } ')' ] */
    if (accept(TK_LPAR)) {
        do {
            Token id = token();
            if (not expect_name())
                return recover<InsertSpec>(follow_set_STATEMENT);
            spec->columns.push_back(id.text);
        } while (accept(TK_COMMA));
        if (not expect(TK_RPAR))
            return recover<InsertSpec>(follow_set_STATEMENT);
    }

    /* 'VALUES' tuple { ',' tuple } */
    if (not expect(TK_Values))
        return recover<InsertSpec>(follow_set_STATEMENT);

    do {
        auto tuple = parse_Tuple();
        if (not tuple)
            return recover<InsertSpec>(follow_set_STATEMENT);
        spec->rows.push_back(std::move(*tuple));
    } while (accept(TK_COMMA));

    if (not expect_end())
        return nullptr;
    return spec;
}

std::unique_ptr<SelectSpec> Parser::parse_SelectStmt()
{
    auto spec = std::make_unique<SelectSpec>();

    /* 'SELECT' [ 'DISTINCT' ] */
    if (not expect(TK_Select))
        return recover<SelectSpec>(follow_set_STATEMENT);
    if (accept(TK_Distinct))
        spec->distinct = true;

    /* '*' | identifier { ',' identifier } */
    if (not accept(TK_ASTERISK)) {
        do {
            Token id = token();
            if (not expect_name())
                return recover<SelectSpec>(follow_set_STATEMENT);
            spec->columns.push_back(id.text);
        } while (accept(TK_COMMA));
    }

    /* 'FROM' identifier */
    if (not expect(TK_From))
        return recover<SelectSpec>(follow_set_STATEMENT);
    Token table_name = token();
    if (not expect_name())
        return recover<SelectSpec>(follow_set_STATEMENT);
    spec->table = table_name.text;

    /* [ 'WHERE' condition ] */
    if (accept(TK_Where)) {
        spec->where = parse_WhereClause(follow_set_WHERE_CLAUSE);
        if (not spec->where)
            return nullptr;
    }

    /* [ 'ORDER' 'BY' identifier [ 'ASC' | 'DESC' ] ] */
    if (accept(TK_Order)) {
        if (not expect(TK_By))
            return recover<SelectSpec>(follow_set_STATEMENT);
        Token id = token();
        if (not expect_name())
            return recover<SelectSpec>(follow_set_STATEMENT);
        SelectSpec::order_type order{id.text, false};
        if (accept(TK_Desc))
            order.descending = true;
        else
            accept(TK_Asc);
        spec->order_by = std::move(order);
    }

    /* [ 'LIMIT' integer [ 'OFFSET' integer ] ] */
    if (accept(TK_Limit)) {
        spec->limit = expect_integer();
        if (not spec->limit)
            return recover<SelectSpec>(follow_set_STATEMENT);
        if (accept(TK_Offset)) {
            spec->offset = expect_integer();
            if (not spec->offset)
                return recover<SelectSpec>(follow_set_STATEMENT);
        }
    }

    if (not expect_end())
        return nullptr;
    return spec;
}

std::unique_ptr<UpdateSpec> Parser::parse_UpdateStmt()
{
    auto spec = std::make_unique<UpdateSpec>();

    /* 'UPDATE' identifier 'SET' */
    if (not expect(TK_Update))
        return recover<UpdateSpec>(follow_set_STATEMENT);
    Token table_name = token();
    if (not expect_name())
        return recover<UpdateSpec>(follow_set_STATEMENT);
    spec->table = table_name.text;
    if (not expect(TK_Set))
        return recover<UpdateSpec>(follow_set_STATEMENT);

    /* identifier '=' value { ',' identifier '=' value } */
    do {
        Token id = token();
        if (not expect_name())
            return recover<UpdateSpec>(follow_set_STATEMENT);
        if (not expect(TK_EQUAL))
            return recover<UpdateSpec>(follow_set_STATEMENT);
        auto value = parse_Value();
        if (not value)
            return recover<UpdateSpec>(follow_set_STATEMENT);
        spec->assignments.emplace_back(id.text, std::move(*value));
    } while (accept(TK_COMMA));

    /* [ 'WHERE' condition ] */
    if (accept(TK_Where)) {
        spec->where = parse_WhereClause(follow_set_STATEMENT);
        if (not spec->where)
            return nullptr;
    }

    if (not expect_end())
        return nullptr;
    return spec;
}

std::unique_ptr<DeleteSpec> Parser::parse_DeleteStmt()
{
    auto spec = std::make_unique<DeleteSpec>();

    /* 'DELETE' 'FROM' identifier */
    if (not expect(TK_Delete))
        return recover<DeleteSpec>(follow_set_STATEMENT);
    if (not expect(TK_From))
        return recover<DeleteSpec>(follow_set_STATEMENT);
    Token table_name = token();
    if (not expect_name())
        return recover<DeleteSpec>(follow_set_STATEMENT);
    spec->table = table_name.text;

    /* [ 'WHERE' condition ] */
    if (accept(TK_Where)) {
        spec->where = parse_WhereClause(follow_set_STATEMENT);
        if (not spec->where)
            return nullptr;
    }

    if (not expect_end())
        return nullptr;
    return spec;
}

std::unique_ptr<DatabaseFileSpec> Parser::parse_SaveStmt()
{
    auto spec = std::make_unique<DatabaseFileSpec>();

    /* 'SAVE' 'DATABASE' string-literal */
    if (not expect(TK_Save))
        return recover<DatabaseFileSpec>(follow_set_STATEMENT);
    if (not expect(TK_Database))
        return recover<DatabaseFileSpec>(follow_set_STATEMENT);
    Token filename = token();
    if (not expect(TK_STRING_LITERAL))
        return recover<DatabaseFileSpec>(follow_set_STATEMENT);
    spec->filename = unquote(filename.text);
    if (spec->filename.empty()) {
        diag.e(filename.pos) << "expected a file name, got " << filename.text << '\n';
        return nullptr;
    }

    if (not expect_end())
        return nullptr;
    return spec;
}

std::unique_ptr<DatabaseFileSpec> Parser::parse_LoadStmt()
{
    auto spec = std::make_unique<DatabaseFileSpec>();

    /* 'LOAD' 'DATABASE' string-literal */
    if (not expect(TK_Load))
        return recover<DatabaseFileSpec>(follow_set_STATEMENT);
    if (not expect(TK_Database))
        return recover<DatabaseFileSpec>(follow_set_STATEMENT);
    Token filename = token();
    if (not expect(TK_STRING_LITERAL))
        return recover<DatabaseFileSpec>(follow_set_STATEMENT);
    spec->filename = unquote(filename.text);
    if (spec->filename.empty()) {
        diag.e(filename.pos) << "expected a file name, got " << filename.text << '\n';
        return nullptr;
    }

    if (not expect_end())
        return nullptr;
    return spec;
}

bool Parser::expect_end()
{
    accept(TK_SEMICOL);
    if (token() == TK_EOF)
        return true;
    diag.e(token().pos) << "expected end of statement, got " << token().text << '\n';
    return false;
}


/*======================================================================================================================
 * clauses
 *====================================================================================================================*/

std::unique_ptr<Predicate> Parser::parse_WhereClause(const follow_set_t &FS)
{
    const std::size_t begin = token().pos.offset;
    const unsigned num_errors_before = diag.num_errors();

    auto pred = parse_Predicate();
    if (diag.num_errors() == num_errors_before and not FS[token().type])
        diag.e(token().pos) << "unexpected " << token().text << " in condition\n";

    if (diag.num_errors() != num_errors_before) {
        recover(FS);
        failed_condition_ = range_t(begin, token().pos.offset);
        return nullptr;
    }
    return pred;
}


/*======================================================================================================================
 * predicates
 *====================================================================================================================*/

std::unique_ptr<Predicate> Parser::parse_Predicate(const int precedence_lhs, std::unique_ptr<Predicate> lhs)
{
    /*
     * predicate ::= condition | predicate 'AND' predicate | predicate 'OR' predicate ;
     */
    if (not lhs)
        lhs = parse_Condition();

    for (;;) {
        Token op = token();
        int p = get_precedence(op);
        if (precedence_lhs > p) return lhs; // left connective has higher precedence
        consume();

        auto rhs = parse_Predicate(p + 1);
        lhs = std::make_unique<PredicateBranch>(op, std::move(lhs), std::move(rhs));
    }
}

std::unique_ptr<Predicate> Parser::parse_Condition()
{
    /* '(' predicate ')' */
    if (is(TK_LPAR)) {
        consume();
        auto pred = parse_Predicate();
        if (not expect(TK_RPAR)) {
            recover(follow_set_CONDITION);
            return std::make_unique<ErrorPredicate>(token());
        }
        return pred;
    }

    /* identifier */
    Token column = token();
    if (not expect_name()) {
        recover(follow_set_CONDITION);
        return std::make_unique<ErrorPredicate>(column);
    }

    switch (token().type) {
        /* 'IS' [ 'NOT' ] 'NULL' */
        case TK_Is: {
            consume();
            const bool negated = accept(TK_Not);
            if (not expect(TK_Null)) break;
            return std::make_unique<PredicateLeaf>(column,
                                                   negated ? PredicateLeaf::OP_IsNotNull : PredicateLeaf::OP_IsNull,
                                                   std::monostate());
        }

        /* 'BETWEEN' value 'AND' value */
        case TK_Between: {
            consume();
            auto min = parse_Value();
            if (not min) break;
            if (not expect(TK_And)) break;
            auto max = parse_Value();
            if (not max) break;
            return std::make_unique<PredicateLeaf>(column, PredicateLeaf::OP_Between,
                                                   PredicateLeaf::range_type(std::move(*min), std::move(*max)));
        }

        /* 'IN' tuple */
        case TK_In: {
            consume();
            auto list = parse_Tuple();
            if (not list) break;
            return std::make_unique<PredicateLeaf>(column, PredicateLeaf::OP_In, std::move(*list));
        }

        /* 'LIKE' value */
        case TK_Like: {
            consume();
            auto pattern = parse_Value();
            if (not pattern) break;
            return std::make_unique<PredicateLeaf>(column, PredicateLeaf::OP_Like, std::move(*pattern));
        }

        /* comparison-operator value */
        default: {
            auto op = get_comparison(token().type);
            if (not op) {
                diag.e(token().pos) << "expected a comparison operator, got " << token().text << '\n';
                break;
            }
            consume();
            auto value = parse_Value();
            if (not value) break;
            return std::make_unique<PredicateLeaf>(column, *op, std::move(*value));
        }
    }

    recover(follow_set_CONDITION);
    return std::make_unique<ErrorPredicate>(column);
}


/*======================================================================================================================
 * values
 *====================================================================================================================*/

std::optional<Value> Parser::parse_Value()
{
    /* value ::= 'NULL' | string-literal | identifier | [ '+' | '-' ] number ; */
    switch (token().type) {
        case TK_Null:
            consume();
            return Value::Null();

        case TK_STRING_LITERAL:
            return Value(unquote(consume().text));

        case TK_IDENTIFIER:
            return Value(consume().text);

        case TK_DEC_INT:
        case TK_DEC_FLOAT:
            return Value::Infer(consume().text);

        case TK_PLUS:
        case TK_MINUS: {
            Token sign = consume();
            if (no(TK_DEC_INT) and no(TK_DEC_FLOAT)) {
                diag.e(token().pos) << "expected a number after " << sign.text << ", got " << token().text << '\n';
                return std::nullopt;
            }
            return Value::Infer(sign.text + consume().text);
        }

        default:
            diag.e(token().pos) << "expected a value, got " << token().text << '\n';
            return std::nullopt;
    }
}

std::optional<std::vector<Value>> Parser::parse_Tuple()
{
    /* tuple ::= '(' value { ',' value } ')' ; */
    if (not expect(TK_LPAR))
        return std::nullopt;

    std::vector<Value> values;
    do {
        auto value = parse_Value();
        if (not value)
            return std::nullopt;
        values.push_back(std::move(*value));
    } while (accept(TK_COMMA));

    if (not expect(TK_RPAR))
        return std::nullopt;
    return values;
}

std::optional<uint64_t> Parser::expect_integer()
{
    Token tok = token();
    if (tok.type != TK_DEC_INT) {
        diag.e(tok.pos) << "expected a non-negative integer, got " << tok.text << '\n';
        return std::nullopt;
    }
    consume();

    errno = 0;
    const unsigned long long i = std::strtoull(tok.text.c_str(), nullptr, 10);
    if (errno == ERANGE) {
        diag.e(tok.pos) << "integer " << tok.text << " is out of range\n";
        return std::nullopt;
    }
    return uint64_t(i);
}


/*======================================================================================================================
 * stand-alone conditions
 *====================================================================================================================*/

std::unique_ptr<Predicate> siso::ast::parse_predicate(const std::string &condition, Diagnostic &diag)
{
    std::istringstream in(condition);
    Lexer lexer(diag, "-", in);
    Parser parser(lexer);

    const unsigned num_errors_before = diag.num_errors();
    auto pred = parser.parse_Predicate();
    if (diag.num_errors() == num_errors_before and parser.token() != TK_EOF)
        diag.e(parser.token().pos) << "unexpected " << parser.token().text << " in condition\n";
    if (diag.num_errors() != num_errors_before)
        return nullptr;
    return pred;
}
