#include <sisodb/util/ArgParser.hpp>

#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sisodb/util/exception.hpp>
#include <sisodb/util/fn.hpp>
#include <stdexcept>
#include <string>


using namespace siso;


namespace {

/** Returns the argument of the option at `*argv` and advances \p argv to it. */
const char * next_argument(const char **&argv)
{
    const char *option = *argv;
    if (not *++argv)
        throw invalid_argument(std::string("missing argument for option ") + option);
    return *argv;
}

/** Helper function to parse integral values. */
template<typename T>
requires integral<T>
void help_parse(const char **&argv, const std::function<void(T)> &callback)
{
    const char *option = *argv;
    const char *arg = next_argument(argv);

    T i;
    try {
        /*----- Signed integer types. -----*/
        if constexpr (std::same_as<T, int>)
            i = std::stoi(arg);
        if constexpr (std::same_as<T, long>)
            i = std::stol(arg);
        /*----- Unsigned integer types. -----*/
        if constexpr (unsigned_integral<T>) {
            if (*arg == '-')
                throw std::invalid_argument("negative value for unsigned option");
        }
        if constexpr (std::same_as<T, unsigned>) {
            const unsigned long v = std::stoul(arg);
            if (v > std::numeric_limits<unsigned>::max())
                throw std::out_of_range("input exceeds range of type unsigned int");
            i = unsigned(v);
        }
        if constexpr (std::same_as<T, unsigned long>)
            i = std::stoul(arg);
    } catch (const std::invalid_argument&) {
        throw invalid_argument(std::string("not a valid integer for option ") + option + ": " + arg);
    } catch (const std::out_of_range&) {
        throw invalid_argument(std::string("value out of range for option ") + option + ": " + arg);
    }
    callback(i);
}

}

#define PARSE(TYPE) \
template<> void ArgParser::OptionImpl<TYPE>::parse(const char **&argv) const { help_parse<TYPE>(argv, callback); }

/*----- Boolean ------------------------------------------------------------------------------------------------------*/
template<> void ArgParser::OptionImpl<bool>::parse(const char **&) const { callback(true); }

/*----- Integral -----------------------------------------------------------------------------------------------------*/
PARSE(int);
PARSE(long);
PARSE(unsigned);
PARSE(unsigned long);

/*----- String -------------------------------------------------------------------------------------------------------*/
template<>
void ArgParser::OptionImpl<const char*>::parse(const char **&argv) const { callback(next_argument(argv)); }

#undef PARSE

//----------------------------------------------------------------------------------------------------------------------

void ArgParser::print_args(std::ostream &out) const
{
    auto print = [this, &out](const char *Short, const char *Long, const char *Descr) {
        using std::setw, std::left, std::right;
        out << "    "
            << left << setw(short_len_) << Short << right
            << "  "
            << left << setw(long_len_) << Long << right
            << "    -    "
            << Descr
            << '\n';
    };

    for (auto &opt : options_)
        print(opt->short_name ? opt->short_name : "", opt->long_name ? opt->long_name : "", opt->description);
}

void ArgParser::parse_args(int, const char **argv) {
    for (++argv; *argv; ++argv) {
        if (streq(*argv, "--"))
            goto positional;
        auto it = key_map_.find(*argv);
        if (it != key_map_.end()) {
            it->second.get().parse(argv); // option
        } else {
            if (strneq(*argv, "--", 2))
                std::cerr << "warning: ignore unknown option " << *argv << std::endl;
            else
                args_.emplace_back(*argv); // positional argument
        }
    }
    return;

    /* Read all following arguments as positional arguments. */
positional:
    for (++argv; *argv; ++argv)
        args_.emplace_back(*argv);
}
