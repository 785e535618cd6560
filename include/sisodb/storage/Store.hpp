#pragma once

#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <sisodb/catalog/Schema.hpp>
#include <sisodb/catalog/Value.hpp>
#include <sisodb/sisodb-config.hpp>
#include <sisodb/util/macro.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


namespace siso {

/** An immutable row.  Maps column names to `Value`s, preserving the order in which the columns were given.  Rows are
 * shared by reference between the store and the row sets derived from it and are never modified in place. */
struct S_EXPORT Row
{
    using entry_type = std::pair<std::string, Value>;
    using iterator = std::vector<entry_type>::const_iterator;

    private:
    std::vector<entry_type> entries_;

    public:
    Row() = default;
    explicit Row(std::vector<entry_type> entries) : entries_(std::move(entries)) { }

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    iterator begin() const { return entries_.cbegin(); }
    iterator end() const { return entries_.cend(); }

    /** Returns `true` iff this row has a value for \p column. */
    bool has(std::string_view column) const;
    /** Returns the value of \p column, or `NULL` if this row has no such column. */
    const Value & get(std::string_view column) const;

    /** Returns a copy of this row in which \p column holds \p value.  Appends \p column if it is not yet present. */
    Row with(const std::string &column, Value value) const;
    /** Returns a new row holding exactly the values of \p columns, in that order.  Absent columns become `NULL`. */
    Row project(const std::vector<std::string> &columns) const;

    bool operator==(const Row &other) const { return this->entries_ == other.entries_; }
    bool operator!=(const Row &other) const { return not operator==(other); }

S_LCOV_EXCL_START
    friend std::ostream & operator<<(std::ostream &out, const Row &row);
    void dump(std::ostream &out) const;
    void dump() const;
S_LCOV_EXCL_STOP
};

using row_ptr = std::shared_ptr<const Row>;
/** A predicate deciding whether an operation applies to a row.  An empty function applies to every row. */
using row_predicate = std::function<bool(const Row&)>;
/** A list of column assignments. */
using assignment_list = std::vector<std::pair<std::string, Value>>;

/** A named collection of rows that conform to a `Schema`. */
struct S_EXPORT Table
{
    using iterator = std::vector<row_ptr>::const_iterator;

    private:
    Schema schema_;
    std::vector<row_ptr> rows_;

    public:
    explicit Table(Schema schema) : schema_(std::move(schema)) { }

    const std::string & name() const { return schema_.name(); }
    const Schema & schema() const { return schema_; }

    std::size_t num_rows() const { return rows_.size(); }
    const std::vector<row_ptr> & rows() const { return rows_; }
    iterator begin() const { return rows_.cbegin(); }
    iterator end() const { return rows_.cend(); }

    /** Appends \p row. */
    void insert(Row row) { rows_.push_back(std::make_shared<const Row>(std::move(row))); }

    /** Replaces every row satisfying \p pred by a copy with \p changes applied.  Returns the number of rows updated.
     *
     * @throw out_of_range if a column of \p changes does not exist
     */
    std::size_t update(const assignment_list &changes, const row_predicate &pred = row_predicate());

    /** Removes every row satisfying \p pred.  Returns the number of rows removed. */
    std::size_t remove(const row_predicate &pred = row_predicate());

    void clear() { rows_.clear(); }

S_LCOV_EXCL_START
    void dump(std::ostream &out) const;
    void dump() const;
S_LCOV_EXCL_STOP
};

/** The in-memory row store.  Owns all tables, keyed by name. */
struct S_EXPORT Database
{
    private:
    std::map<std::string, Table, std::less<>> tables_;

    public:
    Database() = default;
    Database(const Database&) = delete;
    Database(Database&&) = default;
    Database & operator=(Database&&) = default;

    std::size_t num_collections() const { return tables_.size(); }
    /** Returns the names of all tables, in lexicographical order. */
    std::vector<std::string> collection_names() const;

    bool has_collection(std::string_view name) const { return tables_.find(name) != tables_.end(); }

    /** Returns the table named \p name.
     *
     * @throw out_of_range if no such table exists
     */
    const Table & get_collection(std::string_view name) const;

    /** Creates a new, empty table with the given schema.
     *
     * @throw invalid_argument if a table of the same name exists
     */
    const Table & create_collection(Schema schema);

    /** Drops the table named \p name.
     *
     * @throw out_of_range if no such table exists
     */
    void drop_collection(std::string_view name);

    /** Appends \p row to the table named \p collection.
     *
     * @throw out_of_range if no such table exists
     */
    void insert_row(std::string_view collection, Row row);

    /** Updates all rows of \p collection that satisfy \p pred.  Returns the number of rows updated.
     *
     * @throw out_of_range if no such table or column exists
     */
    std::size_t update_rows(std::string_view collection, const assignment_list &changes,
                            const row_predicate &pred = row_predicate());

    /** Deletes all rows of \p collection that satisfy \p pred.  Returns the number of rows deleted.
     *
     * @throw out_of_range if no such table exists
     */
    std::size_t delete_rows(std::string_view collection, const row_predicate &pred = row_predicate());

    /** Drops all tables. */
    void clear() { tables_.clear(); }

    private:
    Table & get(std::string_view name);

    public:
S_LCOV_EXCL_START
    void dump(std::ostream &out) const;
    void dump() const;
S_LCOV_EXCL_STOP
};

}
