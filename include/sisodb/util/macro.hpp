/*--- macro.hpp --------------------------------------------------------------------------------------------------------
 *
 * Assertion macros for internal invariants.  All of them are checked in debug builds only.
 *
 *--------------------------------------------------------------------------------------------------------------------*/

#pragma once

#include <cstdlib>
#include <iostream>
#include <memory>

namespace siso {

/* Brackets code that coverage reports should skip, e.g. dump() helpers for debugging. */
#define S_LCOV_EXCL_START
#define S_LCOV_EXCL_STOP

#ifndef NDEBUG
[[noreturn]] inline void _fail(const char *filename, const unsigned line, const char *what, const char *detail)
{
    std::cout.flush();
    std::cerr << filename << ':' << line << ": " << what;
    if (detail)
        std::cerr << "  " << detail << '.';
    std::cerr << std::endl;
    std::abort();
}
#endif

/*======================================================================================================================
 * S_insist(COND [, MSG])
 *
 * Aborts with the source location if COND is false.
 *====================================================================================================================*/

#ifndef NDEBUG
#define S_INSIST2_(COND, MSG) \
    do { if (not (COND)) ::siso::_fail(__FILE__, __LINE__, "Invariant '" #COND "' violated.", (MSG)); } while (0)
#define S_INSIST1_(COND) S_INSIST2_(COND, nullptr)
#else
#define S_INSIST2_(COND, MSG) while (0) { ((void) (COND), (void) (MSG)); }
#define S_INSIST1_(COND) while (0) { ((void) (COND)); }
#endif

#define S_SELECT_INSIST_(_1, _2, NAME, ...) NAME
#define S_insist(...) S_SELECT_INSIST_(__VA_ARGS__, S_INSIST2_, S_INSIST1_, XXX)(__VA_ARGS__)

/*======================================================================================================================
 * S_unreachable(MSG)
 *
 * Marks code that control flow must never reach.
 *====================================================================================================================*/

#ifndef NDEBUG
#define S_unreachable(MSG) ::siso::_fail(__FILE__, __LINE__, "Reached unreachable code:", (MSG))
#else
#define S_unreachable(MSG) __builtin_unreachable()
#endif

/*======================================================================================================================
 * S_notnull(ARG)
 *
 * Evaluates to ARG.  Aborts in debug build if ARG is null.  ARG may be a raw, unique, or shared pointer.
 *====================================================================================================================*/

#ifndef NDEBUG
template<typename Ptr>
Ptr _check_notnull(Ptr arg, const char *filename, const unsigned line, const char *argstr)
{
    if (not bool(arg))
        _fail(filename, line, argstr, "was NULL");
    return arg;
}

template<typename T>
T * _notnull(T *arg, const char *filename, const unsigned line, const char *argstr)
{
    return _check_notnull(arg, filename, line, argstr);
}

template<typename T>
std::unique_ptr<T> _notnull(std::unique_ptr<T> arg, const char *filename, const unsigned line, const char *argstr)
{
    return _check_notnull(std::move(arg), filename, line, argstr);
}

template<typename T>
std::shared_ptr<T> _notnull(std::shared_ptr<T> arg, const char *filename, const unsigned line, const char *argstr)
{
    return _check_notnull(std::move(arg), filename, line, argstr);
}
#define S_notnull(ARG) ::siso::_notnull((ARG), __FILE__, __LINE__, #ARG)

#else
#define S_notnull(ARG) (ARG)

#endif

}
