#include <sisodb/pipeline/RowSet.hpp>

#include <sisodb/util/fn.hpp>
#include <sstream>


using namespace siso;


const char * siso::get_name(RowSet::phase_t phase)
{
    switch (phase) {
#define X(NAME) case RowSet::P_##NAME: return #NAME;
        SISODB_ROWSET_PHASES(X)
#undef X
    }
    S_unreachable("invalid phase");
}

bool RowSet::calls_for(phase_t phase) const
{
    switch (phase) {
        case P_Scan:     return true;
        case P_Filter:   return bool(select->where);
        case P_Order:    return select->order_by.has_value();
        case P_Project:  return not select->selects_all();
        case P_Distinct: return select->distinct;
        case P_Limit:    return select->limit.has_value();
        case P_Done:     return true;
    }
    S_unreachable("invalid phase");
}

RowSet::phase_t RowSet::next_phase() const
{
    if (phase == P_Done) return P_Done;
    auto next = phase_t(phase + 1);
    while (not calls_for(next))
        next = phase_t(next + 1);
    return next;
}

std::string RowSet::render() const
{
    if (rows.empty())
        return "0 rows returned";

    std::ostringstream oss;
    oss << rows.size() << (rows.size() == 1 ? " row" : " rows") << " returned\n\n";

    const std::string header = join(columns, "\t");
    oss << header << '\n'
        << std::string(header.length() + 3 * columns.size(), '-');

    for (auto &row : rows) {
        oss << '\n';
        for (auto it = columns.begin(); it != columns.end(); ++it) {
            if (it != columns.begin()) oss << '\t';
            oss << row->get(*it);
        }
    }
    return oss.str();
}

std::string RowSet::to_string() const
{
    std::ostringstream oss;
    oss << "RowSet(" << rows.size() << (rows.size() == 1 ? " row" : " rows") << " of '" << select->table
        << "' after " << get_name(phase) << ')';
    return oss.str();
}
