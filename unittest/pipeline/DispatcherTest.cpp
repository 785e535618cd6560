#include "catch2/catch.hpp"

#include "testutil.hpp"
#include <sisodb/pipeline/Dispatcher.hpp>
#include <sisodb/pipeline/RowSet.hpp>
#include <sstream>


using namespace siso;
using namespace siso::testutil;


namespace {

/** A payload counting down to zero. */
struct Counter : Payload
{
    int n;

    explicit Counter(int n) : n(n) { }

    std::string to_string() const override { return "Counter(" + std::to_string(n) + ")"; }
};

/** Emits the next lower counter, or a terminal once zero is reached. */
struct CountdownStage : Stage
{
    const char * name() const override { return "Countdown"; }
    bool matches(const WorkUnit &unit) const override { return unit.is<Counter>(); }
    void transform(const WorkUnit &unit, Dispatcher &D) const override {
        const int n = unit.get<Counter>()->n;
        if (n == 0)
            D.emit(unit, std::make_shared<const Terminal>("liftoff"));
        else
            D.emit(unit, std::make_shared<const Counter>(n - 1));
    }
};

/** Re-emits every statement unchanged. */
struct LoopStage : Stage
{
    const char * name() const override { return "Loop"; }
    bool matches(const WorkUnit &unit) const override { return unit.is<Statement>(); }
    void transform(const WorkUnit &unit, Dispatcher &D) const override { D.emit(unit, unit.payload); }
};

/** Matches nothing. */
struct NeverStage : Stage
{
    const char *name_;

    explicit NeverStage(const char *name) : name_(name) { }

    const char * name() const override { return name_; }
    bool matches(const WorkUnit&) const override { return false; }
    void transform(const WorkUnit&, Dispatcher&) const override { }
};

/** Captures terminals as the result and records the trace of every captured unit. */
struct RecordStage : Stage
{
    std::vector<Trace> &traces;

    explicit RecordStage(std::vector<Trace> &traces) : traces(traces) { }

    const char * name() const override { return "Record"; }
    bool matches(const WorkUnit &unit) const override { return unit.is<Terminal>(); }
    void transform(const WorkUnit &unit, Dispatcher &D) const override {
        traces.push_back(unit.trace);
        D.set_result(unit.get<Terminal>()->text);
    }
};

}


/*======================================================================================================================
 * Dispatcher
 *====================================================================================================================*/

TEST_CASE("Dispatcher c'tor", "[core][pipeline][unit]")
{
    Dispatcher D1, D2(LoggingLevel::DETAILED, 42);

    CHECK(D1.id() != D2.id());
    CHECK(starts_with(D1.id(), "dispatch_"));
    CHECK(D1.logging_level() == LoggingLevel::MINIMAL);
    CHECK(D1.max_iterations() == Dispatcher::DEFAULT_MAX_ITERATIONS);
    CHECK(D2.logging_level() == LoggingLevel::DETAILED);
    CHECK(D2.max_iterations() == 42);
    CHECK(D1.num_stages() == 0);
    CHECK_FALSE(D1.result());
}

TEST_CASE("Dispatcher::register_stage()", "[core][pipeline][unit]")
{
    Dispatcher D;
    D.register_stage<NeverStage>("A");
    D.register_stage(std::make_unique<NeverStage>("B"));
    auto &C = D.register_stage<CountdownStage>();

    REQUIRE(D.num_stages() == 3);
    CHECK(streq(D.stage(0).name(), "A"));
    CHECK(streq(D.stage(1).name(), "B"));
    CHECK(&D.stage(2) == &C);
}

TEST_CASE("Dispatcher::run()", "[core][pipeline][unit]")
{
    std::vector<Trace> traces;
    Dispatcher D;
    D.register_stage<NeverStage>("Never");
    D.register_stage<CountdownStage>();
    D.register_stage<RecordStage>(traces);

    D.submit(std::make_shared<const Counter>(3));
    D.run();

    /* 4 counters and 1 terminal */
    CHECK(D.iterations() == 5);
    CHECK(D.num_pending() == 0);
    CHECK(D.rejected().empty());
    REQUIRE(D.result());
    CHECK(*D.result() == "liftoff");

    REQUIRE(traces.size() == 1);
    auto &T = traces.front();
    CHECK(T.transformed_by == std::vector<std::string>{ "Countdown", "Countdown", "Countdown", "Countdown" });
    /* decliners are not inherited from the parent */
    CHECK(T.declined_by == std::vector<std::string>{ "Never", "Countdown" });
    CHECK(T.total_stages == 3);
    CHECK(T.history.empty());
}

TEST_CASE("Dispatcher::run() rejects exhausted units", "[core][pipeline][unit]")
{
    Dispatcher D;
    D.register_stage<NeverStage>("First");
    D.register_stage<NeverStage>("Second");

    D.submit(std::make_shared<const Statement>("SELECT 1"));
    D.submit(std::make_shared<const Statement>("SELECT 2"));
    D.run();

    CHECK(D.iterations() == 2);
    CHECK_FALSE(D.result());
    REQUIRE(D.rejected().size() == 2);

    auto &unit = D.rejected().front();
    CHECK(unit.payload->to_string() == "SELECT 1");
    CHECK(unit.origin == D.id());
    CHECK(unit.trace.exhausted());
    CHECK(unit.trace.declined_by == std::vector<std::string>{ "First", "Second" });
    CHECK(D.rejected().back().payload->to_string() == "SELECT 2");
}

TEST_CASE("Dispatcher::run() budget", "[core][pipeline][unit]")
{
    SECTION("exceeded")
    {
        Dispatcher D(LoggingLevel::MINIMAL, 5);
        D.register_stage<LoopStage>();
        D.submit(std::make_shared<const Statement>("loop"));

        try {
            D.run();
            FAIL("expected budget_exceeded");
        } catch (const budget_exceeded &e) {
            CHECK(std::string(e.what()) == "Stream exceeded maximum iterations (5). Possible infinite loop detected.");
        }
        CHECK(D.iterations() == 5);
        CHECK(D.num_pending() == 1);
    }

    SECTION("exactly exhausted")
    {
        std::vector<Trace> traces;
        Dispatcher D(LoggingLevel::MINIMAL, 5);
        D.register_stage<CountdownStage>();
        D.register_stage<RecordStage>(traces);

        /* 4 counters and 1 terminal take exactly 5 dequeues */
        D.submit(std::make_shared<const Counter>(3));
        REQUIRE_NOTHROW(D.run());
        CHECK(D.iterations() == 5);
        CHECK(*D.result() == "liftoff");
    }

    SECTION("budget exceeded is a runtime error")
    {
        Dispatcher D(LoggingLevel::NONE, 1);
        D.register_stage<LoopStage>();
        D.submit(std::make_shared<const Statement>("loop"));
        CHECK_THROWS_AS(D.run(), runtime_error);
    }
}

TEST_CASE("Dispatcher::set_result()", "[core][pipeline][unit]")
{
    std::vector<Trace> traces;
    Dispatcher D;
    D.register_stage<RecordStage>(traces);

    D.submit(std::make_shared<const Terminal>("first"));
    D.submit(std::make_shared<const Terminal>("second"));
    D.run();

    REQUIRE(D.result());
    CHECK(*D.result() == "second");
    CHECK(traces.size() == 2);
}

TEST_CASE("Dispatcher logging levels", "[core][pipeline][unit]")
{
    std::vector<Trace> traces;

    SECTION("NONE")
    {
        Dispatcher D(LoggingLevel::NONE);
        D.register_stage<CountdownStage>();
        D.register_stage<RecordStage>(traces);
        D.submit(std::make_shared<const Counter>(1));
        D.run();

        REQUIRE(traces.size() == 1);
        CHECK(traces[0].transformed_by.empty());
        CHECK(traces[0].history.empty());
        CHECK(traces[0].declined_by == std::vector<std::string>{ "Countdown" });
    }

    SECTION("MINIMAL")
    {
        Dispatcher D(LoggingLevel::MINIMAL);
        D.register_stage<CountdownStage>();
        D.register_stage<RecordStage>(traces);
        D.submit(std::make_shared<const Counter>(1));
        D.run();

        REQUIRE(traces.size() == 1);
        CHECK(traces[0].transformed_by == std::vector<std::string>{ "Countdown", "Countdown" });
        CHECK(traces[0].history.empty());
    }

    SECTION("DETAILED")
    {
        Dispatcher D(LoggingLevel::DETAILED);
        D.register_stage<CountdownStage>();
        D.register_stage<RecordStage>(traces);
        D.submit(std::make_shared<const Counter>(1));
        D.run();

        REQUIRE(traces.size() == 1);
        auto &history = traces[0].history;
        REQUIRE(history.size() == 2);
        CHECK(history[0].stage == "Countdown");
        CHECK(history[0].before == "Counter(1)");
        CHECK(history[0].after == "Counter(0)");
        CHECK(history[1].before == "Counter(0)");
        CHECK(history[1].after == "liftoff");
    }
}

TEST_CASE("Dispatcher::print_report()", "[core][pipeline][unit]")
{
    SECTION("minimal")
    {
        Dispatcher D;
        D.register_stage<NeverStage>("Never");
        D.submit(std::make_shared<const Statement>("SELECT 1"));
        D.run();

        std::ostringstream oss;
        D.print_report(oss);
        CHECK(oss.str() == "=== Stream Processing Report ===\n"
                           "Stream ID: " + D.id() + "\n"
                           "Iterations: 1\n"
                           "Stages: 1\n"
                           "Result: (none)\n"
                           "Rejected Units: 1\n"
                           "================================\n");
    }

    SECTION("detailed")
    {
        Dispatcher D(LoggingLevel::DETAILED);
        D.register_stage<NeverStage>("A");
        D.register_stage<NeverStage>("B");
        D.submit(std::make_shared<const Statement>("SELECT 1"));
        D.run();
        D.set_result("done");

        std::ostringstream oss;
        D.print_report(oss);
        const std::string report = oss.str();
        CHECK(contains(report, "Result: done\n"));
        CHECK(contains(report, "--- Stage Pipeline ---\n1. A\n2. B\n"));
        CHECK(contains(report, "--- Rejected Units ---\nInput: SELECT 1\nRejected by: A, B\n"));
    }
}


/*======================================================================================================================
 * WorkUnit and Trace
 *====================================================================================================================*/

TEST_CASE("Trace", "[core][pipeline][unit]")
{
    Trace T = Trace().entered(2);
    CHECK_FALSE(T.exhausted());

    Trace T1 = T.declined("A");
    CHECK(T.declined_by.empty());
    CHECK(T1.has_declined("A"));
    CHECK_FALSE(T1.has_declined("B"));

    Trace T2 = T1.declined("A");
    CHECK(T2.declined_by.size() == 1);

    Trace T3 = T2.declined("B");
    CHECK(T3.exhausted());

    Trace child = T3.derived("C", "before", "after", LoggingLevel::DETAILED);
    CHECK(child.declined_by.empty());
    CHECK(child.transformed_by == std::vector<std::string>{ "C" });
    REQUIRE(child.history.size() == 1);
    CHECK(child.history[0].before == "before");
}

TEST_CASE("WorkUnit and RowSet share their payload", "[core][pipeline][unit]")
{
    auto stmt = std::make_shared<const Statement>("SELECT * FROM users");
    WorkUnit unit(stmt, "dispatch_1");
    CHECK(unit.payload == stmt);
    CHECK(stmt.use_count() == 2);

    auto select = std::make_shared<const SelectSpec>();
    RowSet R({}, { "name" }, select, RowSet::P_Scan);
    CHECK(R.select == select);
    CHECK(select.use_count() == 2);
}

TEST_CASE("WorkUnit::error_report()", "[core][pipeline][unit]")
{
    Trace T = Trace().entered(2).declined("SelectGate").declined("InsertGate");
    T.transformed_by = { "Parse" };
    WorkUnit unit(std::make_shared<const Statement>("FOO BAR"), "dispatch_7", T);

    CHECK(unit.is<Statement>());
    CHECK_FALSE(unit.is<Terminal>());
    CHECK(unit.get<Statement>()->text == "FOO BAR");

    CHECK(unit.error_report() == "=== EVENT PROCESSING ERROR ===\n"
                                 "Input: FOO BAR\n"
                                 "Stream ID: dispatch_7\n"
                                 "Gates attempted: 2\n"
                                 "Rejected by:\n"
                                 "  - SelectGate\n"
                                 "  - InsertGate\n"
                                 "\n"
                                 "Successfully transformed by:\n"
                                 "  - Parse\n"
                                 "\n"
                                 "Suggestion: Check SQL syntax or add appropriate gate to handle this input.\n"
                                 "==============================");
}


/*======================================================================================================================
 * Payloads
 *====================================================================================================================*/

TEST_CASE("Statement::starts_with()", "[core][pipeline][unit]")
{
    Statement S("  -- create a table\n  create TABLE users (id)");
    CHECK(S.starts_with({ TK_Create }));
    CHECK(S.starts_with({ TK_Create, TK_Table }));
    CHECK_FALSE(S.starts_with({ TK_Create, TK_Table, TK_If }));
    CHECK_FALSE(S.starts_with({ TK_Drop }));
    CHECK_FALSE(Statement("").starts_with({ TK_Select }));
}

TEST_CASE("Terminal::Error()", "[core][pipeline][unit]")
{
    auto T = Terminal::Error("Table 'x' does not exist");
    CHECK(T.is_error);
    CHECK(T.text == "ERROR: Table 'x' does not exist");
    CHECK(Terminal::Error("ERROR: already prefixed").text == "ERROR: already prefixed");
    CHECK_FALSE(Terminal("ok").is_error);
}

TEST_CASE("RowSet", "[core][pipeline][unit]")
{
    auto select = std::make_shared<SelectSpec>();
    select->table = "users";

    std::vector<row_ptr> rows = {
        std::make_shared<const Row>(make_row({ {"name", "Alice"}, {"age", 30} })),
        std::make_shared<const Row>(make_row({ {"name", "Bob"} })),
    };

    SECTION("render()")
    {
        RowSet R(rows, { "name", "age" }, select, RowSet::P_Done);
        CHECK(R.size() == 2);
        CHECK(R.render() == "2 rows returned\n\n"
                            "name\tage\n"
                            "--------------\n"
                            "Alice\t30\n"
                            "Bob\tNULL");
        CHECK(R.to_string() == "RowSet(2 rows of 'users' after Done)");

        RowSet one({ rows[0] }, { "name" }, select, RowSet::P_Done);
        CHECK(one.render() == "1 row returned\n\nname\n-------\nAlice");

        RowSet none({}, { "name" }, select, RowSet::P_Done);
        CHECK(none.render() == "0 rows returned");
    }

    SECTION("next_phase() of a plain scan")
    {
        RowSet R(rows, { "name", "age" }, select, RowSet::P_Scan);
        CHECK(R.next_phase() == RowSet::P_Done);
    }

    SECTION("next_phase() skips phases not called for")
    {
        select->order_by = SelectSpec::order_type{ "age", false };
        select->limit = 1;
        RowSet R(rows, { "name", "age" }, select, RowSet::P_Scan);
        CHECK(R.next_phase() == RowSet::P_Order);

        auto ordered = R.advance(RowSet::P_Order, rows);
        CHECK(ordered->phase == RowSet::P_Order);
        CHECK(ordered->next_phase() == RowSet::P_Limit);
        CHECK(ordered->advance(RowSet::P_Limit, {})->next_phase() == RowSet::P_Done);
    }

    SECTION("next_phase() visits all phases in order")
    {
        std::ostringstream out, err;
        Diagnostic diag(false, out, err);
        select->where = ast::parse_predicate("age > 1", diag);
        select->order_by = SelectSpec::order_type{ "age", true };
        select->columns = { "name" };
        select->distinct = true;
        select->limit = 5;

        std::vector<RowSet::phase_t> phases;
        auto R = std::make_shared<const RowSet>(rows, std::vector<std::string>{ "name" }, select, RowSet::P_Scan);
        while (R->phase != RowSet::P_Done) {
            auto next = R->next_phase();
            phases.push_back(next);
            R = R->advance(next, R->rows);
        }
        CHECK(phases == std::vector<RowSet::phase_t>{ RowSet::P_Filter, RowSet::P_Order, RowSet::P_Project,
                                                      RowSet::P_Distinct, RowSet::P_Limit, RowSet::P_Done });
    }
}
