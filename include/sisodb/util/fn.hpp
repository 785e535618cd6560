#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <sisodb/sisodb-config.hpp>
#include <sisodb/util/exception.hpp>
#include <sisodb/util/macro.hpp>
#include <string>
#include <string_view>
#include <vector>


namespace siso {

inline bool streq(const char *first, const char *second) { return 0 == strcmp(S_notnull(first), S_notnull(second)); }
inline bool strneq(const char *first, const char *second, std::size_t n)
{
    return 0 == strncmp(S_notnull(first), S_notnull(second), n);
}

/** Compares two strings for equality, ignoring the case of ASCII letters. */
inline bool iequals(std::string_view first, std::string_view second)
{
    return first.size() == second.size() and
           std::equal(first.begin(), first.end(), second.begin(), [](char l, char r) {
               return std::tolower(static_cast<unsigned char>(l)) == std::tolower(static_cast<unsigned char>(r));
           });
}

inline std::string to_upper(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::toupper(c); });
    return str;
}

inline std::string to_lower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::tolower(c); });
    return str;
}

/** Removes leading and trailing whitespace. */
inline std::string_view trim(std::string_view sv)
{
    constexpr const char *WS = " \t\n\v\f\r";
    const auto first = sv.find_first_not_of(WS);
    if (first == std::string_view::npos) return std::string_view();
    const auto last = sv.find_last_not_of(WS);
    return sv.substr(first, last - first + 1);
}

/** Joins the elements of `parts` with `delimiter`. */
inline std::string join(const std::vector<std::string> &parts, std::string_view delimiter)
{
    std::string res;
    for (auto it = parts.begin(); it != parts.end(); ++it) {
        if (it != parts.begin()) res.append(delimiter);
        res.append(*it);
    }
    return res;
}

/*===== Casts ========================================================================================================*/

/** Short version of dynamic_cast that works for pointers and references. */
template<typename To, typename From>
To * S_EXPORT cast(From *v) { return dynamic_cast<To*>(v); }

template<typename To, typename From>
To * S_EXPORT cast(From &v) { return dynamic_cast<To*>(&v); }

/** Short version of static_cast that works for pointers and references.  In debug build, check that the cast is legit.
 */
template<typename To, typename From>
To * S_EXPORT as(From *v) { S_insist(cast<To>(v)); return static_cast<To*>(v); }

template<typename To, typename From>
To & S_EXPORT as(From &v) { return *as<To>(&v); }

/** Simple test whether expression v is of type To.  Works with pointers and references. */
template<typename To, typename From>
bool S_EXPORT is(From *v) { return cast<To>(v) != nullptr; }

template<typename To, typename From>
bool S_EXPORT is(From &v) { return is<To>(&v); }

template<typename To, typename From>
bool S_EXPORT is(const std::shared_ptr<From> &v) { return is<To>(v.get()); }

/** Returns a quoted version of `str`. */
inline std::string quote(const std::string &str, char quote = '\'') { return std::string(1, quote) + str + quote; }

/** Removes surrounding quotes from `str`, if present, and collapses doubled quote characters within. */
inline std::string unquote(const std::string &str)
{
    if (str.length() < 2) return str;
    const char q = str.front();
    if ((q != '\'' and q != '"') or str.back() != q) return str;
    std::string res;
    res.reserve(str.length() - 2);
    for (std::size_t i = 1; i + 1 < str.length(); ++i) {
        res += str[i];
        if (str[i] == q and str[i + 1] == q and i + 2 < str.length())
            ++i; // skip the second quote of a doubled pair
    }
    return res;
}

/** Compares a SQL-style LIKE pattern with the given `std::string`, ignoring case.  `%` matches any sequence of
 * characters, `_` matches exactly one character.  The pattern must match the entire string. */
bool S_EXPORT like(const std::string &str, const std::string &pattern);

inline bool is_dec  (int c) { return '0' <= c && c <= '9'; }
inline bool is_alpha(int c) { return ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z'); }
inline bool is_alnum(int c) { return is_dec(c) || is_alpha(c); }

/** Returns path of the user's home directory. */
inline std::filesystem::path get_home_path()
{
    std::filesystem::path path;
#if __linux || __APPLE__
    auto home = std::getenv("HOME");
    if (home)
        path = home;
#else
    path = ".";
#endif
    return path;
}

/** Returns true iff the character sequence only consists of white spaces. */
inline bool isspace(const char *s, std::size_t len)
{
    return std::all_of(s, s + len, [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

inline bool isspace(const char *s) { return isspace(s, strlen(s)); }

}
