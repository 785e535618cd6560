#pragma once

#include <iostream>
#include <optional>
#include <sisodb/catalog/Value.hpp>
#include <sisodb/sisodb-config.hpp>
#include <sisodb/util/exception.hpp>
#include <sisodb/util/macro.hpp>
#include <string>
#include <string_view>
#include <vector>


namespace siso {

#define SISODB_COLUMN_TYPES(X) \
    X(INTEGER) \
    X(TEXT) \
    X(REAL) \
    X(BLOB)

/** The declared type of a `Column`.  Types are informational only; values are never coerced to them. */
enum column_type {
#define X(TYPE) CT_##TYPE,
    SISODB_COLUMN_TYPES(X)
#undef X
};

/** Returns the SQL spelling of \p type. */
const char * S_EXPORT get_name(column_type type);

/** Parses \p str (case-insensitive) as a column type.  Returns `std::nullopt` if \p str does not name a type. */
std::optional<column_type> S_EXPORT parse_column_type(std::string_view str);

/** A column definition of a table. */
struct S_EXPORT Column
{
    std::string name;
    column_type type = CT_TEXT;
    bool primary_key = false;
    bool not_nullable = false;
    ///> the value used for this column when an insertion does not provide one; `NULL` if there is no default
    Value default_value;
    bool has_default = false;

    Column() = default;
    explicit Column(std::string name, column_type type = CT_TEXT) : name(std::move(name)), type(type) { }

    bool operator==(const Column &other) const {
        return this->name == other.name and this->type == other.type and this->primary_key == other.primary_key and
               this->not_nullable == other.not_nullable and this->has_default == other.has_default and
               this->default_value == other.default_value;
    }
    bool operator!=(const Column &other) const { return not operator==(other); }

S_LCOV_EXCL_START
    friend std::ostream & operator<<(std::ostream &out, const Column &col);
    void dump(std::ostream &out) const;
    void dump() const;
S_LCOV_EXCL_STOP
};

/** A `Schema` is an ordered list of uniquely named `Column`s together with the name of the table it describes.  At
 * most one column may be the primary key. */
struct S_EXPORT Schema
{
    using iterator = std::vector<Column>::const_iterator;

    private:
    std::string name_;
    std::vector<Column> columns_;

    public:
    Schema() = default;
    explicit Schema(std::string name) : name_(std::move(name)) { }

    const std::string & name() const { return name_; }

    /** Appends \p col to this `Schema`.
     *
     * @throw invalid_argument if a column of the same name exists or a second primary key is added
     */
    void add(Column col);

    std::size_t num_columns() const { return columns_.size(); }
    bool empty() const { return columns_.empty(); }

    iterator begin() const { return columns_.cbegin(); }
    iterator end() const { return columns_.cend(); }
    iterator cbegin() const { return begin(); }
    iterator cend() const { return end(); }

    /** Returns `true` iff this `Schema` has a column named \p name. */
    bool has(std::string_view name) const;

    /** Returns the column named \p name.
     *
     * @throw out_of_range if no such column exists
     */
    const Column & at(std::string_view name) const;
    const Column & operator[](std::size_t idx) const { S_insist(idx < columns_.size()); return columns_[idx]; }

    /** Returns the names of all columns in declaration order. */
    std::vector<std::string> column_names() const;

    /** Returns the primary key column, if any. */
    const Column * primary_key() const;

    bool operator==(const Schema &other) const {
        return this->name_ == other.name_ and this->columns_ == other.columns_;
    }
    bool operator!=(const Schema &other) const { return not operator==(other); }

S_LCOV_EXCL_START
    friend std::ostream & operator<<(std::ostream &out, const Schema &schema);
    void dump(std::ostream &out) const;
    void dump() const;
S_LCOV_EXCL_STOP
};

}
