#pragma once

#include <sisodb/sisodb-config.hpp>

#include <iostream>
#include <memory>
#include <sisodb/catalog/Schema.hpp>
#include <sisodb/catalog/Value.hpp>
#include <sisodb/io/StorageEngine.hpp>
#include <sisodb/lex/Token.hpp>
#include <sisodb/lex/TokenType.hpp>
#include <sisodb/parse/Predicate.hpp>
#include <sisodb/parse/PredicateEvaluator.hpp>
#include <sisodb/parse/Statement.hpp>
#include <sisodb/pipeline/Dispatcher.hpp>
#include <sisodb/pipeline/Payload.hpp>
#include <sisodb/pipeline/RowSet.hpp>
#include <sisodb/pipeline/Stage.hpp>
#include <sisodb/pipeline/WorkUnit.hpp>
#include <sisodb/stages/Stages.hpp>
#include <sisodb/storage/Store.hpp>
#include <sisodb/util/Diagnostic.hpp>
#include <sisodb/util/exception.hpp>
#include <sisodb/util/fn.hpp>
#include <sisodb/util/macro.hpp>
#include <sisodb/util/Position.hpp>
#include <string>
#include <vector>


namespace siso {

/** Splits the script read from \p in into its statements.  Statements are separated by `;`.  Separators within
 * string literals or comments are ignored, as are empty statements.  The separators are not part of the returned
 * statements. */
std::vector<std::string> S_EXPORT split_statements(std::istream &in);

/** Executes statements against an in-memory database.  Every statement is run through a fresh `Dispatcher` that has
 * all stages registered. */
struct S_EXPORT Engine
{
    struct config
    {
        ///> whether unrecognized statements are reported tersely
        bool production = false;
        LoggingLevel logging_level = LoggingLevel::MINIMAL;
        std::size_t max_iterations = Dispatcher::DEFAULT_MAX_ITERATIONS;
        ///> whether `process_stream()` prints the report of the dispatcher after each statement
        bool report = false;
        ///> whether `process_stream()` prints each statement before its result
        bool echo = false;
    };

    private:
    config config_;
    Database db_;

    public:
    Engine() : Engine(config()) { }
    explicit Engine(config cfg) : config_(std::move(cfg)) { }

    Engine(const Engine&) = delete;

    const config & configuration() const { return config_; }

    Database & database() { return db_; }
    const Database & database() const { return db_; }

    /** Runs \p statement through a fresh dispatcher and returns the dispatcher after the run.
     *
     * @throw budget_exceeded if the dispatcher exceeds its iteration budget
     */
    std::unique_ptr<Dispatcher> dispatch(const std::string &statement);

    /** Executes \p statement and returns its result, or `(no result)` if no result was produced.
     *
     * @throw budget_exceeded if the dispatcher exceeds its iteration budget
     */
    std::string execute(const std::string &statement);

    /** Executes all statements read from \p in and prints their results to `diag.out()`.  A run that exceeds its
     * iteration budget is reported as an error through \p diag. */
    void process_stream(std::istream &in, const char *filename, Diagnostic &diag);
};

}
