#pragma once

#include "lex/Lexer.hpp"
#include "parse/Parser.hpp"
#include <sisodb/sisodb.hpp>
#include <sisodb/util/Diagnostic.hpp>
#include <sstream>
#include <string>

#define LEXER(STR) \
    std::ostringstream out, err; \
    Diagnostic diag(false, out, err); \
    std::istringstream in((STR)); \
    ast::Lexer lexer(diag, "-", in)

#define PARSER(STR) \
    LEXER(STR); \
    ast::Parser parser(lexer)

namespace siso {

namespace testutil {

/** Creates a row from a list of column/value pairs. */
inline Row make_row(std::vector<Row::entry_type> entries) { return Row(std::move(entries)); }

/** Runs all \p statements against \p engine and returns the result of the last one. */
inline std::string run_all(Engine &engine, std::initializer_list<const char*> statements)
{
    std::string result;
    for (auto stmt : statements)
        result = engine.execute(stmt);
    return result;
}

/** Returns `true` iff \p str starts with \p prefix. */
inline bool starts_with(const std::string &str, const std::string &prefix)
{
    return str.compare(0, prefix.length(), prefix) == 0;
}

/** Returns `true` iff \p str contains \p needle. */
inline bool contains(const std::string &str, const std::string &needle)
{
    return str.find(needle) != std::string::npos;
}

}

}
