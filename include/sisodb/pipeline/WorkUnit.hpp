#pragma once

#include <iostream>
#include <memory>
#include <sisodb/pipeline/Payload.hpp>
#include <sisodb/sisodb-config.hpp>
#include <sisodb/util/fn.hpp>
#include <sisodb/util/macro.hpp>
#include <string>
#include <string_view>
#include <vector>


namespace siso {

/** Controls how much of its processing history a `WorkUnit` records. */
enum class LoggingLevel
{
    NONE,       ///< record nothing but the decliners
    MINIMAL,    ///< record the names of the stages that transformed a unit
    DETAILED,   ///< additionally record a before/after rendering of every transformation
};

/** Returns the name of the logging level \p level. */
const char * S_EXPORT get_name(LoggingLevel level);

/** The processing history of a `WorkUnit`.  A `Trace` is a value: every update produces a new `Trace` that replaces
 * the previous one as a whole. */
struct S_EXPORT Trace
{
    struct transformation
    {
        std::string stage;
        std::string before;
        std::string after;
    };

    ///> the stages that declined the unit, in the order they were visited; free of duplicates
    std::vector<std::string> declined_by;
    ///> the stages that transformed the unit or one of its ancestors, in order
    std::vector<std::string> transformed_by;
    ///> a before/after record per transformation; only filled at `LoggingLevel::DETAILED`
    std::vector<transformation> history;
    ///> the number of stages of the dispatcher in the current pass
    std::size_t total_stages = 0;

    bool has_declined(std::string_view stage) const;

    /** Returns `true` iff every stage of the current pass declined the unit. */
    bool exhausted() const { return declined_by.size() == total_stages; }

    /** Returns a copy of this trace that records \p stage as a decliner.  Declining twice has no effect. */
    Trace declined(const std::string &stage) const;

    /** Returns a copy of this trace for a new pass over \p num_stages stages. */
    Trace entered(std::size_t num_stages) const;

    /** Returns the trace inherited by a unit that \p stage derived from the unit of this trace.  The decliners are
     * not inherited, the transformations are recorded according to \p level. */
    Trace derived(const std::string &stage, std::string before, std::string after, LoggingLevel level) const;

S_LCOV_EXCL_START
    friend std::ostream & S_EXPORT operator<<(std::ostream &out, const Trace &trace);
    void dump(std::ostream &out) const;
    void dump() const;
S_LCOV_EXCL_STOP
};

/** A unit of work in flight.  Combines an immutable `Payload` with the `Trace` of its processing. */
struct S_EXPORT WorkUnit
{
    std::shared_ptr<const Payload> payload;
    std::string origin; ///< the id of the dispatcher the unit was submitted to
    Trace trace;

    WorkUnit(std::shared_ptr<const Payload> payload, std::string origin, Trace trace = Trace())
        : payload(S_notnull(std::move(payload)))
        , origin(std::move(origin))
        , trace(std::move(trace))
    { }

    /** Returns the payload as a `T`, or `nullptr` if the payload is no `T`. */
    template<typename T>
    const T * get() const { return cast<const T>(payload.get()); }

    /** Returns `true` iff the payload is a `T`. */
    template<typename T>
    bool is() const { return get<T>() != nullptr; }

    /** Renders the detailed report of a unit that no stage was able to process. */
    std::string error_report() const;

S_LCOV_EXCL_START
    friend std::ostream & S_EXPORT operator<<(std::ostream &out, const WorkUnit &unit) {
        return out << "WorkUnit(" << *unit.payload << ", origin " << unit.origin << ')';
    }
    void dump(std::ostream &out) const;
    void dump() const;
S_LCOV_EXCL_STOP
};

}
