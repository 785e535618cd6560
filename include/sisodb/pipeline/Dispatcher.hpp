#pragma once

#include <deque>
#include <iostream>
#include <memory>
#include <optional>
#include <sisodb/pipeline/Payload.hpp>
#include <sisodb/pipeline/Stage.hpp>
#include <sisodb/pipeline/WorkUnit.hpp>
#include <sisodb/sisodb-config.hpp>
#include <sisodb/util/exception.hpp>
#include <string>
#include <utility>
#include <vector>


namespace siso {

/** Signals that a dispatch run exceeded its iteration budget.  This indicates a faulty pipeline, e.g. a stage that
 * re-emits its own input. */
struct budget_exceeded : runtime_error
{
    explicit budget_exceeded(std::string message) : runtime_error(std::move(message)) { }
};

/** Routes `WorkUnit`s through an ordered pipeline of `Stage`s.
 *
 * Every unit taken from the worklist is offered to the stages in registration order.  The first stage that matches
 * transforms the unit and possibly emits new units into the worklist.  All stages visited before are recorded as
 * decliners of the unit.  A unit that no stage matched and that was declined by all stages is rejected.  Processing
 * continues until the worklist is empty.
 */
struct S_EXPORT Dispatcher
{
    static constexpr std::size_t DEFAULT_MAX_ITERATIONS = 1000;

    private:
    std::string id_;
    std::vector<std::unique_ptr<Stage>> stages_;
    std::deque<WorkUnit> worklist_;
    std::vector<WorkUnit> rejected_;
    std::optional<std::string> result_;
    LoggingLevel logging_level_;
    std::size_t max_iterations_;
    std::size_t iterations_ = 0;

    ///> the unit being transformed and the stage transforming it
    std::pair<const WorkUnit*, const Stage*> active_ = { nullptr, nullptr };

    public:
    explicit Dispatcher(LoggingLevel logging_level = LoggingLevel::MINIMAL,
                        std::size_t max_iterations = DEFAULT_MAX_ITERATIONS);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher(Dispatcher&&) = default;

    const std::string & id() const { return id_; }

    LoggingLevel logging_level() const { return logging_level_; }
    void logging_level(LoggingLevel level) { logging_level_ = level; }

    std::size_t max_iterations() const { return max_iterations_; }
    void max_iterations(std::size_t n) { max_iterations_ = n; }

    /** Appends \p stage to the pipeline. */
    Stage & register_stage(std::unique_ptr<Stage> stage) {
        stages_.push_back(S_notnull(std::move(stage)));
        return *stages_.back();
    }

    /** Constructs a `T` from \p args and appends it to the pipeline. */
    template<typename T, typename... Args>
    T & register_stage(Args&&... args) {
        auto stage = std::make_unique<T>(std::forward<Args>(args)...);
        auto &ref = *stage;
        stages_.push_back(std::move(stage));
        return ref;
    }

    std::size_t num_stages() const { return stages_.size(); }
    const Stage & stage(std::size_t i) const { return *stages_.at(i); }

    /** Enqueues a fresh unit carrying \p payload. */
    void submit(std::shared_ptr<const Payload> payload) { submit(WorkUnit(std::move(payload), id_)); }
    /** Enqueues \p unit. */
    void submit(WorkUnit unit) { worklist_.push_back(std::move(unit)); }

    /** Enqueues a unit carrying \p payload that is derived from \p parent.  May only be called by the stage that is
     * currently transforming \p parent. */
    void emit(const WorkUnit &parent, std::shared_ptr<const Payload> payload);

    /** Processes the worklist until it is empty.
     *
     * @throw budget_exceeded if the worklist is not empty after `max_iterations()` dequeues
     */
    void run();

    std::size_t iterations() const { return iterations_; }
    std::size_t num_pending() const { return worklist_.size(); }

    /** Returns the result captured by the last run, if any. */
    const std::optional<std::string> & result() const { return result_; }
    /** Sets the result of this run.  A later result replaces an earlier one. */
    void set_result(std::string result) { result_ = std::move(result); }

    /** Returns the units that no stage was able to process. */
    const std::vector<WorkUnit> & rejected() const { return rejected_; }

    /** Prints a report of the last run to \p out. */
    void print_report(std::ostream &out) const;

S_LCOV_EXCL_START
    void dump(std::ostream &out) const;
    void dump() const;
S_LCOV_EXCL_STOP
};

}
