#pragma once

#include <exception>
#include <string>


namespace siso {

struct exception : std::exception
{
    private:
    const std::string message_;

    public:
    explicit exception(std::string message) : message_(std::move(message)) { }

    const char * what() const noexcept override { return message_.c_str(); }
};

/**
 * Base class for exceptions signaling an error in the logic.  Try to use a more precise subclass of `logic_error`
 * whenever you can.
 */
struct logic_error : exception
{
    explicit logic_error(std::string message) : exception(std::move(message)) { }
};

/** Signals that an argument to a function or method was invalid, e.g. a table name that is already taken. */
struct invalid_argument : logic_error
{
    explicit invalid_argument(std::string message) : logic_error(std::move(message)) { }
};

/** Signals that an index-based or key-based access was out of range, e.g. an unknown table or column. */
struct out_of_range : logic_error
{
    explicit out_of_range(std::string message) : logic_error(std::move(message)) { }
};

/** Signals a runtime error that sisodb is not responsible for and was not able to recover from, e.g. an unreadable
 * database file. */
struct runtime_error : exception
{
    explicit runtime_error(std::string message) : exception(std::move(message)) { }
};

}
