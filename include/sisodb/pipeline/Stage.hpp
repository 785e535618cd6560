#pragma once

#include <sisodb/pipeline/WorkUnit.hpp>
#include <sisodb/sisodb-config.hpp>


namespace siso {

struct Dispatcher;

/** A stage of the dispatcher's pipeline.  A stage decides whether it applies to a `WorkUnit` and, if so, transforms
 * the unit into zero or more new units that it emits to the dispatcher.  Stages never modify the unit they are given.
 */
struct S_EXPORT Stage
{
    virtual ~Stage() { }

    /** Returns the name of this stage.  The name identifies the stage in the trace of a `WorkUnit`. */
    virtual const char * name() const = 0;

    /** Returns `true` iff this stage applies to \p unit. */
    virtual bool matches(const WorkUnit &unit) const = 0;

    /** Transforms \p unit and emits the resulting units to \p D. */
    virtual void transform(const WorkUnit &unit, Dispatcher &D) const = 0;
};

}
