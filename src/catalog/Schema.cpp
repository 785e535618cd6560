#include <sisodb/catalog/Schema.hpp>

#include <algorithm>
#include <sisodb/util/fn.hpp>


using namespace siso;


const char * siso::get_name(column_type type)
{
    switch (type) {
#define X(TYPE) case CT_##TYPE: return #TYPE;
        SISODB_COLUMN_TYPES(X)
#undef X
    }
    S_unreachable("invalid column type");
}

std::optional<column_type> siso::parse_column_type(std::string_view str)
{
#define X(TYPE) if (iequals(str, #TYPE)) return CT_##TYPE;
    SISODB_COLUMN_TYPES(X)
#undef X
    return std::nullopt;
}


/*======================================================================================================================
 * Column
 *====================================================================================================================*/

S_LCOV_EXCL_START
namespace siso {

std::ostream & operator<<(std::ostream &out, const Column &col)
{
    out << col.name << ' ' << get_name(col.type);
    if (col.primary_key) out << " PRIMARY KEY";
    if (col.not_nullable and not col.primary_key) out << " NOT NULL";
    if (col.has_default) {
        out << " DEFAULT ";
        if (col.default_value.is_string())
            out << quote(col.default_value.as_s());
        else
            out << col.default_value;
    }
    return out;
}

}

void Column::dump(std::ostream &out) const { out << *this << std::endl; }
void Column::dump() const { dump(std::cerr); }
S_LCOV_EXCL_STOP


/*======================================================================================================================
 * Schema
 *====================================================================================================================*/

void Schema::add(Column col)
{
    if (has(col.name))
        throw invalid_argument("Duplicate column '" + col.name + "'");
    if (col.primary_key) {
        if (primary_key())
            throw invalid_argument("Table can have only one PRIMARY KEY");
        col.not_nullable = true;
    }
    columns_.push_back(std::move(col));
}

bool Schema::has(std::string_view name) const
{
    return std::any_of(columns_.begin(), columns_.end(), [&name](const Column &c) { return c.name == name; });
}

const Column & Schema::at(std::string_view name) const
{
    auto it = std::find_if(columns_.begin(), columns_.end(), [&name](const Column &c) { return c.name == name; });
    if (it == columns_.end())
        throw out_of_range("Column '" + std::string(name) + "' does not exist in table '" + name_ + "'");
    return *it;
}

std::vector<std::string> Schema::column_names() const
{
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (auto &c : columns_)
        names.push_back(c.name);
    return names;
}

const Column * Schema::primary_key() const
{
    for (auto &c : columns_)
        if (c.primary_key) return &c;
    return nullptr;
}

S_LCOV_EXCL_START
namespace siso {

std::ostream & operator<<(std::ostream &out, const Schema &schema)
{
    out << schema.name() << " (";
    for (auto it = schema.begin(); it != schema.end(); ++it) {
        if (it != schema.begin()) out << ", ";
        out << *it;
    }
    return out << ')';
}

}

void Schema::dump(std::ostream &out) const { out << *this << std::endl; }
void Schema::dump() const { dump(std::cerr); }
S_LCOV_EXCL_STOP
