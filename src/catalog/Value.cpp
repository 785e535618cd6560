#include <sisodb/catalog/Value.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <sisodb/util/fn.hpp>
#include <sstream>


using namespace siso;


namespace {

/** Returns `true` iff `str` is an optionally signed sequence of decimal digits. */
bool is_integer_literal(const std::string &str)
{
    std::size_t i = 0;
    if (i < str.length() and (str[i] == '-' or str[i] == '+')) ++i;
    if (i == str.length()) return false;
    for (; i != str.length(); ++i)
        if (not is_dec(str[i])) return false;
    return true;
}

/** Parses `str` as a decimal number.  Returns `true` and sets `out` iff the entire string was consumed. */
bool parse_decimal(const std::string &str, double &out)
{
    if (str.empty() or std::isspace(static_cast<unsigned char>(str.front()))) return false;
    const char *begin = str.c_str();
    char *end = nullptr;
    errno = 0;
    const double d = std::strtod(begin, &end);
    if (end != begin + str.length() or errno == ERANGE) return false;
    /* reject `inf`, `nan`, and hexadecimal floats accepted by `strtod` */
    for (char c : str)
        if (not (is_dec(c) or c == '.' or c == '-' or c == '+' or c == 'e' or c == 'E')) return false;
    out = d;
    return true;
}

}

Value Value::Infer(const std::string &literal)
{
    if (iequals(literal, "NULL"))
        return Value::Null();
    if (literal.length() >= 2 and (literal.front() == '\'' or literal.front() == '"') and
        literal.back() == literal.front())
        return Value(unquote(literal));
    if (is_integer_literal(literal)) {
        errno = 0;
        const long long i = std::strtoll(literal.c_str(), nullptr, 10);
        if (errno != ERANGE)
            return Value(int64_t(i));
    }
    if (double d; parse_decimal(literal, d))
        return Value(d);
    return Value(literal);
}

bool Value::is_numeric() const
{
    switch (kind()) {
        case V_Null:    return false;
        case V_Integer:
        case V_Real:    return true;
        case V_String: {
            double d;
            return parse_decimal(as_s(), d);
        }
    }
    S_unreachable("invalid value kind");
}

double Value::to_double() const
{
    switch (kind()) {
        case V_Integer: return double(as_i());
        case V_Real:    return as_d();
        case V_String: {
            double d = 0;
            if (not parse_decimal(as_s(), d))
                throw invalid_argument("value '" + as_s() + "' is not numeric");
            return d;
        }
        case V_Null:
            throw invalid_argument("NULL has no numeric value");
    }
    S_unreachable("invalid value kind");
}

std::string Value::to_string() const
{
    switch (kind()) {
        case V_Null:    return "NULL";
        case V_Integer: return std::to_string(as_i());
        case V_String:  return as_s();
        case V_Real: {
            std::ostringstream oss;
            oss << std::setprecision(15) << as_d();
            return oss.str();
        }
    }
    S_unreachable("invalid value kind");
}

S_LCOV_EXCL_START
void Value::dump(std::ostream &out) const { out << *this << std::endl; }
void Value::dump() const { dump(std::cerr); }
S_LCOV_EXCL_STOP

int siso::compare(const Value &left, const Value &right)
{
    S_insist(not left.is_null() and not right.is_null(), "NULL values are not comparable");
    if (left.is_numeric() and right.is_numeric()) {
        const double l = left.to_double();
        const double r = right.to_double();
        return (l > r) - (l < r);
    }
    const int cmp = left.to_string().compare(right.to_string());
    return (cmp > 0) - (cmp < 0);
}
