#include <sisodb/pipeline/Dispatcher.hpp>

#include <sisodb/util/fn.hpp>
#include <sstream>


using namespace siso;


namespace {

std::string next_dispatcher_id()
{
    static std::size_t counter = 0;
    return "dispatch_" + std::to_string(++counter);
}

}

Dispatcher::Dispatcher(LoggingLevel logging_level, std::size_t max_iterations)
    : id_(next_dispatcher_id())
    , logging_level_(logging_level)
    , max_iterations_(max_iterations)
{ }

void Dispatcher::emit(const WorkUnit &parent, std::shared_ptr<const Payload> payload)
{
    S_insist(active_.first == &parent, "units may only be emitted by the stage transforming their parent");
    const Stage &stage = *S_notnull(active_.second);

    std::string before, after;
    if (logging_level_ >= LoggingLevel::DETAILED) {
        before = parent.payload->to_string();
        after = payload->to_string();
    }
    Trace trace = parent.trace.derived(stage.name(), std::move(before), std::move(after), logging_level_);
    worklist_.emplace_back(std::move(payload), parent.origin, std::move(trace));
}

void Dispatcher::run()
{
    iterations_ = 0;

    while (not worklist_.empty()) {
        if (iterations_ == max_iterations_) {
            std::ostringstream oss;
            oss << "Stream exceeded maximum iterations (" << max_iterations_ << "). Possible infinite loop detected.";
            throw budget_exceeded(oss.str());
        }
        ++iterations_;

        WorkUnit unit = std::move(worklist_.front());
        worklist_.pop_front();
        unit.trace = unit.trace.entered(stages_.size());

        bool processed = false;
        for (auto &stage : stages_) {
            if (stage->matches(unit)) {
                active_ = { &unit, stage.get() };
                try {
                    stage->transform(unit, *this);
                } catch (...) {
                    active_ = { nullptr, nullptr };
                    throw;
                }
                active_ = { nullptr, nullptr };
                processed = true;
                break;
            }
            unit.trace = unit.trace.declined(stage->name());
        }

        if (not processed and unit.trace.exhausted())
            rejected_.push_back(std::move(unit));
    }
}

void Dispatcher::print_report(std::ostream &out) const
{
    out << "=== Stream Processing Report ===\n"
        << "Stream ID: " << id_ << '\n'
        << "Iterations: " << iterations_ << '\n'
        << "Stages: " << stages_.size() << '\n'
        << "Result: " << (result_ ? *result_ : std::string("(none)")) << '\n'
        << "Rejected Units: " << rejected_.size() << '\n';

    if (logging_level_ >= LoggingLevel::DETAILED) {
        out << "\n--- Stage Pipeline ---\n";
        for (std::size_t i = 0; i != stages_.size(); ++i)
            out << (i + 1) << ". " << stages_[i]->name() << '\n';

        if (not rejected_.empty()) {
            out << "\n--- Rejected Units ---\n";
            for (auto &unit : rejected_) {
                out << "Input: " << *unit.payload << '\n'
                    << "Rejected by: " << join(unit.trace.declined_by, ", ") << "\n\n";
            }
        }
    }

    out << "================================" << std::endl;
}

S_LCOV_EXCL_START
void Dispatcher::dump(std::ostream &out) const
{
    out << "Dispatcher " << id_ << " with " << stages_.size() << " stages, " << worklist_.size()
        << " pending units, and " << rejected_.size() << " rejected units" << std::endl;
    for (auto &stage : stages_)
        out << "  " << stage->name() << '\n';
    out.flush();
}
void Dispatcher::dump() const { dump(std::cerr); }
S_LCOV_EXCL_STOP
