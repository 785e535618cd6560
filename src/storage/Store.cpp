#include <sisodb/storage/Store.hpp>

#include <algorithm>
#include <sisodb/util/exception.hpp>


using namespace siso;


namespace {

const Value NULL_VALUE;

}


/*======================================================================================================================
 * Row
 *====================================================================================================================*/

bool Row::has(std::string_view column) const
{
    return std::any_of(entries_.begin(), entries_.end(), [&column](const entry_type &e) { return e.first == column; });
}

const Value & Row::get(std::string_view column) const
{
    for (auto &e : entries_)
        if (e.first == column) return e.second;
    return NULL_VALUE;
}

Row Row::with(const std::string &column, Value value) const
{
    auto entries = entries_;
    auto it = std::find_if(entries.begin(), entries.end(), [&column](const entry_type &e) { return e.first == column; });
    if (it == entries.end())
        entries.emplace_back(column, std::move(value));
    else
        it->second = std::move(value);
    return Row(std::move(entries));
}

Row Row::project(const std::vector<std::string> &columns) const
{
    std::vector<entry_type> entries;
    entries.reserve(columns.size());
    for (auto &col : columns)
        entries.emplace_back(col, get(col));
    return Row(std::move(entries));
}

S_LCOV_EXCL_START
namespace siso {

std::ostream & operator<<(std::ostream &out, const Row &row)
{
    out << '{';
    for (auto it = row.begin(); it != row.end(); ++it) {
        if (it != row.begin()) out << ", ";
        out << it->first << ": " << it->second;
    }
    return out << '}';
}

}

void Row::dump(std::ostream &out) const { out << *this << std::endl; }
void Row::dump() const { dump(std::cerr); }
S_LCOV_EXCL_STOP


/*======================================================================================================================
 * Table
 *====================================================================================================================*/

std::size_t Table::update(const assignment_list &changes, const row_predicate &pred)
{
    /* Validate before touching any row. */
    for (auto &change : changes)
        (void) schema_.at(change.first);

    std::size_t count = 0;
    for (auto &row : rows_) {
        if (pred and not pred(*row)) continue;
        Row updated = *row;
        for (auto &change : changes)
            updated = updated.with(change.first, change.second);
        row = std::make_shared<const Row>(std::move(updated));
        ++count;
    }
    return count;
}

std::size_t Table::remove(const row_predicate &pred)
{
    const std::size_t before = rows_.size();
    if (not pred) {
        rows_.clear();
        return before;
    }
    rows_.erase(std::remove_if(rows_.begin(), rows_.end(), [&pred](const row_ptr &row) { return pred(*row); }),
                rows_.end());
    return before - rows_.size();
}

S_LCOV_EXCL_START
void Table::dump(std::ostream &out) const
{
    out << "Table " << schema_ << " with " << rows_.size() << " rows";
    for (auto &row : rows_)
        out << "\n  " << *row;
    out << std::endl;
}
void Table::dump() const { dump(std::cerr); }
S_LCOV_EXCL_STOP


/*======================================================================================================================
 * Database
 *====================================================================================================================*/

std::vector<std::string> Database::collection_names() const
{
    std::vector<std::string> names;
    names.reserve(tables_.size());
    for (auto &t : tables_)
        names.push_back(t.first);
    return names;
}

const Table & Database::get_collection(std::string_view name) const
{
    auto it = tables_.find(name);
    if (it == tables_.end())
        throw out_of_range("Table '" + std::string(name) + "' does not exist");
    return it->second;
}

Table & Database::get(std::string_view name)
{
    auto it = tables_.find(name);
    if (it == tables_.end())
        throw out_of_range("Table '" + std::string(name) + "' does not exist");
    return it->second;
}

const Table & Database::create_collection(Schema schema)
{
    if (has_collection(schema.name()))
        throw invalid_argument("Table '" + schema.name() + "' already exists");
    std::string name = schema.name();
    auto res = tables_.emplace(std::move(name), Table(std::move(schema)));
    S_insist(res.second);
    return res.first->second;
}

void Database::drop_collection(std::string_view name)
{
    auto it = tables_.find(name);
    if (it == tables_.end())
        throw out_of_range("Table '" + std::string(name) + "' does not exist");
    tables_.erase(it);
}

void Database::insert_row(std::string_view collection, Row row) { get(collection).insert(std::move(row)); }

std::size_t Database::update_rows(std::string_view collection, const assignment_list &changes,
                                  const row_predicate &pred)
{
    return get(collection).update(changes, pred);
}

std::size_t Database::delete_rows(std::string_view collection, const row_predicate &pred)
{
    return get(collection).remove(pred);
}

S_LCOV_EXCL_START
void Database::dump(std::ostream &out) const
{
    out << "Database with " << tables_.size() << " tables" << std::endl;
    for (auto &t : tables_)
        t.second.dump(out);
}
void Database::dump() const { dump(std::cerr); }
S_LCOV_EXCL_STOP
