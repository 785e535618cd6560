#pragma once

#include <initializer_list>
#include <iostream>
#include <sisodb/lex/TokenType.hpp>
#include <sisodb/sisodb-config.hpp>
#include <sisodb/util/macro.hpp>
#include <string>


namespace siso {

/** The immutable content of a `WorkUnit`.  Stages recognize the kind of payload they handle by its dynamic type. */
struct S_EXPORT Payload
{
    virtual ~Payload() { }

    /** Renders this payload as text.  Used by the processing trace and by error reports. */
    virtual std::string to_string() const = 0;

S_LCOV_EXCL_START
    friend std::ostream & operator<<(std::ostream &out, const Payload &p) { return out << p.to_string(); }
    void dump(std::ostream &out) const { out << *this << std::endl; }
    void dump() const { dump(std::cerr); }
S_LCOV_EXCL_STOP
};

/** The raw text of a single statement, as submitted by the user. */
struct S_EXPORT Statement : Payload
{
    std::string text;

    explicit Statement(std::string text) : text(std::move(text)) { }

    /** Returns `true` iff the statement begins with the given sequence of keywords.  Keywords are matched
     * case-insensitively; leading whitespace and comments are skipped. */
    bool starts_with(std::initializer_list<TokenType> keywords) const;

    std::string to_string() const override { return text; }
};

/** The final outcome of a statement.  A terminal payload is captured as the result of a dispatch run. */
struct S_EXPORT Terminal : Payload
{
    std::string text;
    bool is_error;

    explicit Terminal(std::string text, bool is_error = false) : text(std::move(text)), is_error(is_error) { }

    /** Creates an error terminal.  Prepends `ERROR: ` unless \p message already starts with `ERROR:`. */
    static Terminal Error(const std::string &message);

    std::string to_string() const override { return text; }
};

}
