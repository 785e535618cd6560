#pragma once

#include <cstddef>
#include <sisodb/sisodb-config.hpp>


namespace siso {

/** Singleton class representing options provided as command line argument to the binaries.  Implements Scott Meyer's
 * singleton pattern.  */
struct S_EXPORT Options
{
    /*----- Help -----------------------------------------------------------------------------------------------------*/
    bool show_help = false;
    bool show_version = false;

    /*----- Shell configuration --------------------------------------------------------------------------------------*/
    bool has_color = false;
    bool show_prompt = true;
    bool quiet = false;

    /*----- Additional outputs ---------------------------------------------------------------------------------------*/
    bool echo = false;
    /** If `true`, print the processing report of the dispatcher after every statement. */
    bool report = false;

    /*----- Engine configuration -------------------------------------------------------------------------------------*/
    /** If `true`, statements that no stage recognizes are reported without their processing trace. */
    bool production = false;
    /** The logging level of the dispatcher: 0 is none, 1 is minimal, 2 is detailed. */
    unsigned log_level = 1;
    /** The maximum number of work units a dispatcher processes per statement. */
    std::size_t max_iterations = 1000;

    private:
    Options() = default;
    public:
    Options(const Options&) = delete;
    Options & operator=(const Options&) = delete;

    /** Return a reference to the single `Options` instance. */
    static Options & Get();
};

}
