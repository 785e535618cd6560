#pragma once

#include "lex/Lexer.hpp"
#include "parse/Parser.hpp"
#include <algorithm>
#include <memory>
#include <optional>
#include <sisodb/pipeline/Payload.hpp>
#include <sisodb/util/Diagnostic.hpp>
#include <sisodb/util/fn.hpp>
#include <sstream>
#include <string>


namespace siso {

/** Lexes and parses a single statement.  Syntax errors are collected in `errors`. */
struct StatementParser
{
    private:
    std::istringstream in_;

    public:
    std::ostringstream errors;
    Diagnostic diag;
    ast::Lexer lexer;
    ast::Parser parser;

    explicit StatementParser(const std::string &text)
        : in_(text)
        , diag(false, errors, errors)
        , lexer(diag, "-", in_)
        , parser(lexer)
    { }

    bool ok() const { return diag.num_errors() == 0; }

    /** If parsing failed inside a `WHERE` clause, returns the error message naming the clause. */
    std::optional<std::string> where_error(const std::string &text) const {
        if (auto &range = parser.failed_condition()) {
            const auto begin = std::min(range->first, text.length());
            const auto end = std::min(std::max(range->second, begin), text.length());
            return "Invalid WHERE condition: " + std::string(trim(std::string_view(text).substr(begin, end - begin)));
        }
        return std::nullopt;
    }
};

inline std::shared_ptr<const Terminal> make_result(std::string text)
{
    return std::make_shared<const Terminal>(std::move(text));
}

inline std::shared_ptr<const Terminal> make_error(const std::string &message)
{
    return std::make_shared<const Terminal>(Terminal::Error(message));
}

/** Returns "`n` row" or "`n` rows". */
inline std::string rows_text(std::size_t n) { return std::to_string(n) + (n == 1 ? " row" : " rows"); }

}
