#pragma once

#include <cstring>
#include <functional>
#include <iostream>
#include <memory>
#include <sisodb/sisodb-config.hpp>
#include <sisodb/util/concepts.hpp>
#include <sisodb/util/macro.hpp>
#include <string_view>
#include <unordered_map>
#include <vector>


namespace siso {

/** A parser for command line arguments.  Automates the parsing of command line arguments such as short options `-s`,
 * long options `--long`, and positional arguments.  Can print a nicely formatted help message with a synopsis and
 * explanations of all available options.  */
class S_EXPORT ArgParser
{
    /* Option for the ArgParser. */
    struct Option
    {
        Option(const char *short_name, const char *long_name, const char *description)
            : short_name(short_name)
            , long_name(long_name)
            , description(description)
        { }

        virtual ~Option() { }

        /** Parses the option at `*argv`.  Options taking an argument advance \p argv to their argument.
         *
         * @throw invalid_argument if the argument is missing or malformed
         */
        virtual void parse(const char **&argv) const = 0;

        const char *short_name;
        const char *long_name;
        const char *description;
    };

    template<typename T>
    struct OptionImpl : public Option
    {
        template<is_invocable<T> Callback>
        OptionImpl(const char *short_name, const char *long_name, const char *description, Callback &&callback)
            : Option(short_name, long_name, description)
            , callback(std::forward<Callback>(callback))
        { }

        void parse(const char **&argv) const override;

        std::function<void(T)> callback;
    };

    private:
    ///> options type
    using options_t = std::vector<std::unique_ptr<const Option>>;
    ///> all options, in the order they were added
    options_t options_;
    ///> positional arguments
    std::vector<const char*> args_;
    ///> maps the option name to the option object
    std::unordered_map<std::string_view, std::reference_wrapper<const Option>> key_map_;
    ///> the deducted maximum length of all short options
    std::size_t short_len_ = 0;
    ///> the deducted maximum length of all long options
    std::size_t long_len_  = 0;

    public:
    ArgParser() { }
    ~ArgParser() { }

    /** Adds a new option to the `ArgParser`.  The names and the description must outlive the `ArgParser`.
     *
     * @param short_name name of the short option, e.g. "-s"; can be `nullptr`
     * @param long_name name of the long option, e.g. "--long"; can be `nullptr`
     * @param description a textual description of the option
     * @param callback a callback function that is invoked if the option is given
     */
    template<typename T, is_invocable<T> Callback>
    void add(const char *short_name, const char *long_name, const char *description, Callback &&callback)
    {
        options_.push_back(std::make_unique<const OptionImpl<T>>(
            short_name, long_name, description, std::forward<Callback>(callback)
        ));
        auto &opt = *options_.back();

        if (short_name) {
            auto res = key_map_.emplace(short_name, opt);
            S_insist(res.second, "name already in list");
            short_len_ = std::max(short_len_, strlen(short_name));
        }

        if (long_name) {
            auto res = key_map_.emplace(long_name, opt);
            S_insist(res.second, "name already in list");
            long_len_ = std::max(long_len_, strlen(long_name));
        }
    }

    /** Prints a list of all options to `out`. */
    void print_args(std::ostream &out) const;
    /** Prints a list of all options to `std::cout`. */
    void print_args() const { print_args(std::cout); }

    /** Parses the arguments from `argv`.  Unknown long options are ignored with a warning.
     *
     * @param argc number of arguments
     * @param argv array of c-strings; last element must be `nullptr`
     * @throw invalid_argument if the argument of an option is missing or malformed
     */
    void parse_args(int argc, const char **argv);

    /** Parses the arguments from `argv`.
     *
     * @param argc number of arguments
     * @param argv array of c-strings; last element must be `nullptr`
     */
    void operator()(int argc, const char **argv) { parse_args(argc, argv); }

    /** Returns all positional arguments. */
    const std::vector<const char*> & args() const { return args_; }
};

S_LCOV_EXCL_START
inline std::ostream & operator<<(std::ostream &out, const ArgParser &AP)
{
    AP.print_args(out);
    return out;
}
S_LCOV_EXCL_STOP

}
