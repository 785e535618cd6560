#include <sisodb/pipeline/WorkUnit.hpp>

#include <algorithm>
#include <sstream>


using namespace siso;


const char * siso::get_name(LoggingLevel level)
{
    switch (level) {
        case LoggingLevel::NONE:     return "NONE";
        case LoggingLevel::MINIMAL:  return "MINIMAL";
        case LoggingLevel::DETAILED: return "DETAILED";
    }
    S_unreachable("invalid logging level");
}


/*======================================================================================================================
 * Trace
 *====================================================================================================================*/

bool Trace::has_declined(std::string_view stage) const
{
    return std::find(declined_by.begin(), declined_by.end(), stage) != declined_by.end();
}

Trace Trace::declined(const std::string &stage) const
{
    Trace T(*this);
    if (not has_declined(stage))
        T.declined_by.push_back(stage);
    return T;
}

Trace Trace::entered(std::size_t num_stages) const
{
    Trace T(*this);
    T.total_stages = num_stages;
    return T;
}

Trace Trace::derived(const std::string &stage, std::string before, std::string after, LoggingLevel level) const
{
    Trace T;
    T.transformed_by = transformed_by;
    T.history = history;
    if (level >= LoggingLevel::MINIMAL)
        T.transformed_by.push_back(stage);
    if (level >= LoggingLevel::DETAILED)
        T.history.push_back({ stage, std::move(before), std::move(after) });
    return T;
}

namespace siso {

std::ostream & operator<<(std::ostream &out, const Trace &trace)
{
    out << "Trace(declined by " << trace.declined_by.size() << " of " << trace.total_stages << " stages";
    if (not trace.transformed_by.empty())
        out << ", transformed by " << join(trace.transformed_by, " -> ");
    return out << ')';
}

}

S_LCOV_EXCL_START
void Trace::dump(std::ostream &out) const
{
    out << *this << std::endl;
    for (auto &t : history)
        out << "  " << t.stage << ": " << t.before << " => " << t.after << '\n';
    out.flush();
}
void Trace::dump() const { dump(std::cerr); }
S_LCOV_EXCL_STOP


/*======================================================================================================================
 * WorkUnit
 *====================================================================================================================*/

std::string WorkUnit::error_report() const
{
    std::ostringstream oss;
    oss << "=== EVENT PROCESSING ERROR ===\n"
        << "Input: " << *payload << '\n'
        << "Stream ID: " << origin << '\n'
        << "Gates attempted: " << trace.total_stages << '\n'
        << "Rejected by:\n";
    for (auto &stage : trace.declined_by)
        oss << "  - " << stage << '\n';
    if (not trace.transformed_by.empty()) {
        oss << "\nSuccessfully transformed by:\n";
        for (auto &stage : trace.transformed_by)
            oss << "  - " << stage << '\n';
    }
    oss << "\nSuggestion: Check SQL syntax or add appropriate gate to handle this input.\n"
        << "==============================";
    return oss.str();
}

S_LCOV_EXCL_START
void WorkUnit::dump(std::ostream &out) const
{
    out << *this << '\n';
    trace.dump(out);
}
void WorkUnit::dump() const { dump(std::cerr); }
S_LCOV_EXCL_STOP
