#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <functional>
#include <iostream>
#include <regex>
#include <replxx.hxx>
#include <sisodb/Options.hpp>
#include <sisodb/sisodb.hpp>
#include <sisodb/util/ArgParser.hpp>
#include <sisodb/util/terminal.hpp>
#include <sstream>
#include <vector>

#ifndef SISODB_VERSION
#define SISODB_VERSION "unknown"
#endif


using namespace siso;
using Replxx = replxx::Replxx;


void usage(std::ostream &out, const char *name)
{
    out << "An interactive shell to run SQL statements against an in-memory database.\n"
        << "USAGE:\n\t" << name << " [<FILE>...]"
        << std::endl;
}

std::string prompt(bool is_editing)
{
    unsigned bg = 238;
    std::ostringstream prompt;
    if (not is_editing)
        prompt << term::bg(bg) << term::fg(255) << " siso" << term::fg(30) << term::ITALIC << "db " << term::RESET;
    else
        prompt << term::bg(bg) << term::fg(242) << "  ... " << term::RESET;
    prompt << term::fg(bg) << "> " << term::RESET;
    return prompt.str();
}

/** Determine codepoint length of utf-8 string. */
int utf8str_codepoint_len(const char *s, int utf8_len) {
    int codepoint_len = 0;
    unsigned char m4 = 128 + 64 + 32 + 16;
    unsigned char m3 = 128 + 64 + 32;
    unsigned char m2 = 128 + 64;
    for (int i = 0; i < utf8_len; ++i, ++codepoint_len ) {
        char c = s[i];
        if ((c & m4) == m4)
            i += 3;
        else if (( c & m3 ) == m3)
            i += 2;
        else if (( c & m2 ) == m2)
            i += 1;
    }
    return codepoint_len;
}

/** Determines the amount of chars after a word breaker (i.e. a non-alphanumeric character). */
int context_len(const std::string &prefix)
{
    auto it = prefix.rbegin();
    for (; it != prefix.rend(); ++it) {
        if (not is_alnum(*it) and *it != '_')
            break;
    }

    return it - prefix.rbegin();
}

static constexpr const char *KW[] = {
#define S_KEYWORD(tt, name) #name,
#include <sisodb/tables/Keywords.tbl>
#undef S_KEYWORD
};

/* Completion */
Replxx::completions_t hook_completion(const std::string &prefix, int &context_len)
{
    Replxx::completions_t completions;
    context_len = ::context_len(prefix);
    std::string context = to_upper(prefix.substr(prefix.size() - context_len));
    for (auto const &kw : KW) {
        if (strneq(kw, context.c_str(), context_len))
            completions.emplace_back(kw, Replxx::Color::DEFAULT);
    }
    return completions;
}

/* Highlighter */
void hook_highlighter(const std::string &context, Replxx::colors_t &colors)
{
    std::vector<std::pair<std::regex, Replxx::Color>> regex_color = {
        /* Keywords */
#define S_KEYWORD(tt, name)\
        { std::regex("\\b" #name "\\b", std::regex::icase), Replxx::Color::BROWN },
#include <sisodb/tables/Keywords.tbl>
#undef S_KEYWORD
        /* Operators */
        { std::regex("\\("),  Replxx::Color::NORMAL},
        { std::regex("\\)"),  Replxx::Color::NORMAL},
        { std::regex("\\*"),  Replxx::Color::NORMAL},
        { std::regex("\\="),  Replxx::Color::NORMAL},
        { std::regex("\\!="), Replxx::Color::NORMAL},
        { std::regex("\\<"),  Replxx::Color::NORMAL},
        { std::regex("\\>"),  Replxx::Color::NORMAL},
        /* Constants */
        { std::regex("[\\-|+]{0,1}[0-9]+"),          Replxx::Color::BLUE}, // integral numbers
        { std::regex("[\\-|+]{0,1}[0-9]*\\.[0-9]+"), Replxx::Color::BLUE}, // fixed-point numbers
        { std::regex("'([^']|'')*'"),                Replxx::Color::BRIGHTMAGENTA}, // single quoted strings
        { std::regex("\"([^\"]|\"\")*\""),           Replxx::Color::BRIGHTMAGENTA}, // double quoted strings
    };
    for (const auto &e : regex_color) {
        std::size_t pos = 0;
        std::string str = context; // string that is yet to be searched
        std::smatch match;

        while (std::regex_search(str, match, e.first)) {
            std::string c = match[0]; // first match for regex
            std::string prefix = match.prefix().str(); // substring until first match
            pos += utf8str_codepoint_len(prefix.c_str(), prefix.size());
            int len = utf8str_codepoint_len(c.c_str(), c.size());
            if (len == 0) break;

            for (int i = 0; i < len; ++i)
                colors.at(pos + i) = e.second; // set colors according to match

            pos += len; // search for regex from pos onward
            str = match.suffix();
        }
    }
}

/* Hints */
Replxx::hints_t hook_hint(const std::string &prefix, int &context_len, Replxx::Color &color)
{
    Replxx::hints_t hints;
    context_len = ::context_len(prefix);
    std::string context = to_upper(prefix.substr(prefix.size() - context_len));
    if (context.size() >= 2) {
        for (auto const &kw : KW) {
            if (strneq(kw, context.c_str(), context_len))
                hints.emplace_back(kw);
        }
    }
    if (hints.size() == 1)
        color = Replxx::Color::GREEN;
    return hints;
}

int main(int argc, const char **argv)
{
    /* Identify whether the terminal supports colors. */
    const bool term_has_color = term::has_color();

    /*----- Parse command line arguments. ----------------------------------------------------------------------------*/
    ArgParser AP;
#define ADD(TYPE, VAR, INIT, SHORT, LONG, DESCR, CALLBACK)\
    VAR = INIT;\
    {\
        AP.add<TYPE>(SHORT, LONG, DESCR, CALLBACK);\
    }
    /*----- Help message ---------------------------------------------------------------------------------------------*/
    ADD(bool, Options::Get().show_help, false,              /* Type, Var, Init  */
        "-h", "--help",                                     /* Short, Long      */
        "prints this help message",                         /* Description      */
        [&](bool) { Options::Get().show_help = true; });    /* Callback         */
    ADD(bool, Options::Get().show_version, false,           /* Type, Var, Init  */
        nullptr, "--version",                               /* Short, Long      */
        "shows version information",                        /* Description      */
        [&](bool) { Options::Get().show_version = true; }); /* Callback         */
    /*----- Shell configuration --------------------------------------------------------------------------------------*/
    ADD(bool, Options::Get().has_color, false,              /* Type, Var, Init  */
        nullptr, "--color",                                 /* Short, Long      */
        "use colors",                                       /* Description      */
        [&](bool) { Options::Get().has_color = true; });    /* Callback         */
    ADD(bool, Options::Get().show_prompt, true,             /* Type, Var, Init  */
        nullptr, "--noprompt",                              /* Short, Long      */
        "disable prompt",                                   /* Description      */
        [&](bool) { Options::Get().show_prompt = false; }); /* Callback         */
    ADD(bool, Options::Get().quiet, false,                  /* Type, Var, Init  */
        "-q", "--quiet",                                    /* Short, Long      */
        "work in quiet mode",                               /* Description      */
        [&](bool) { Options::Get().quiet = true; });        /* Callback         */
    /*----- Additional output ----------------------------------------------------------------------------------------*/
    ADD(bool, Options::Get().echo, false,                   /* Type, Var, Init  */
        nullptr, "--echo",                                  /* Short, Long      */
        "echo statements",                                  /* Description      */
        [&](bool) { Options::Get().echo = true; });         /* Callback         */
    ADD(bool, Options::Get().report, false,                 /* Type, Var, Init  */
        "-r", "--report",                                   /* Short, Long      */
        "print the processing report of every statement",   /* Description      */
        [&](bool) { Options::Get().report = true; });       /* Callback         */
    /*----- Engine configuration -------------------------------------------------------------------------------------*/
    ADD(bool, Options::Get().production, false,                 /* Type, Var, Init  */
        nullptr, "--production",                                /* Short, Long      */
        "report unrecognized statements without diagnostics",   /* Description      */
        [&](bool) { Options::Get().production = true; });       /* Callback         */
    ADD(unsigned, Options::Get().log_level, 1,                              /* Type, Var, Init  */
        nullptr, "--log-level",                                             /* Short, Long      */
        "how much processing history to record (0 none, 1 minimal, 2 detailed)",  /* Description */
        [&](unsigned level) { Options::Get().log_level = level; });         /* Callback         */
    ADD(unsigned long, Options::Get().max_iterations, Dispatcher::DEFAULT_MAX_ITERATIONS, /* Type, Var, Init */
        nullptr, "--max-iterations",                                                      /* Short, Long     */
        "the maximum number of work units processed per statement",                       /* Description     */
        [&](unsigned long n) { Options::Get().max_iterations = n; });                     /* Callback        */
#undef ADD
    try {
        AP.parse_args(argc, argv);
    } catch (const invalid_argument &e) {
        std::cerr << "error: " << e.what() << std::endl;
        std::exit(EXIT_FAILURE);
    }

    if (Options::Get().show_version) {
        if (term_has_color)
            std::cout << term::BOLD << "siso" << term::ITALIC << term::fg(30) << "db" << term::RESET;
        else
            std::cout << "sisodb";
        std::cout << "\nversion " << SISODB_VERSION << std::endl;
        std::exit(EXIT_SUCCESS);
    }

    if (Options::Get().show_help) {
        usage(std::cout, argv[0]);
        std::cout << "WHERE\n" << AP;
        std::exit(EXIT_SUCCESS);
    }

    if (Options::Get().log_level > unsigned(LoggingLevel::DETAILED)) {
        std::cerr << "error: invalid logging level " << Options::Get().log_level << std::endl;
        std::exit(EXIT_FAILURE);
    }
    if (Options::Get().max_iterations == 0) {
        std::cerr << "error: the maximum number of iterations must be positive" << std::endl;
        std::exit(EXIT_FAILURE);
    }

    /* Disable synchronisation between C and C++ I/O (e.g. stdin vs std::cin). */
    std::ios_base::sync_with_stdio(false);

    /* Create the diagnostics object. */
    Diagnostic diag(Options::Get().has_color, std::cout, std::cerr);

    /* Create the engine. */
    Engine::config cfg;
    cfg.production = Options::Get().production;
    cfg.logging_level = LoggingLevel(Options::Get().log_level);
    cfg.max_iterations = Options::Get().max_iterations;
    cfg.report = Options::Get().report;
    cfg.echo = Options::Get().echo;
    Engine engine(cfg);

    /* ----- Replxx configuration ------------------------------------------------------------------------------------*/
    Replxx rx;
    rx.install_window_change_handler();

    /* History setup */
    auto history_file = get_home_path() / ".sisodb_history";
    rx.history_load(history_file);
    rx.set_max_history_size(1024);
    rx.set_unique_history(false);

    /* Key bindings */
#define KEY_BIND(BUTTON, RESULT)\
    rx.bind_key(Replxx::KEY::BUTTON, std::bind(&Replxx::invoke, &rx, Replxx::ACTION::RESULT, std::placeholders::_1));
    KEY_BIND(BACKSPACE,                   DELETE_CHARACTER_LEFT_OF_CURSOR);
    KEY_BIND(DELETE,                      DELETE_CHARACTER_UNDER_CURSOR);
    KEY_BIND(LEFT,                        MOVE_CURSOR_LEFT);
    KEY_BIND(RIGHT,                       MOVE_CURSOR_RIGHT);
    KEY_BIND(UP,                          HISTORY_PREVIOUS);
    KEY_BIND(DOWN,                        HISTORY_NEXT);
    KEY_BIND(HOME,                        MOVE_CURSOR_TO_BEGINING_OF_LINE);
    KEY_BIND(END,                         MOVE_CURSOR_TO_END_OF_LINE);
    KEY_BIND(TAB,                         COMPLETE_LINE);
    KEY_BIND(control('R'),                HISTORY_INCREMENTAL_SEARCH);
    KEY_BIND(control('W'),                KILL_TO_BEGINING_OF_WORD);
    KEY_BIND(control('U'),                KILL_TO_BEGINING_OF_LINE);
    KEY_BIND(control('K'),                KILL_TO_END_OF_LINE);
    KEY_BIND(control('L'),                CLEAR_SCREEN);
    KEY_BIND(control('D'),                SEND_EOF);
    KEY_BIND(control(Replxx::KEY::LEFT),  MOVE_CURSOR_ONE_WORD_LEFT);
    KEY_BIND(control(Replxx::KEY::RIGHT), MOVE_CURSOR_ONE_WORD_RIGHT);
#undef KEY_BIND

    if (Options::Get().show_prompt) {
        /* Completion */
        rx.set_completion_callback(std::bind(&hook_completion, std::placeholders::_1, std::placeholders::_2));
        rx.set_completion_count_cutoff(128);
        rx.set_double_tab_completion(false);
        rx.set_complete_on_empty(false);
        rx.set_beep_on_ambiguous_completion(false);

        /* Hints */
        rx.set_hint_callback(std::bind(&hook_hint, std::placeholders::_1, std::placeholders::_2,
                                       std::placeholders::_3));
        rx.set_max_hint_rows(3);
        rx.set_hint_delay(500);

        /* Highlighter */
        rx.set_highlighter_callback(std::bind(&hook_highlighter, std::placeholders::_1, std::placeholders::_2));
    }

    /* Other options */
    rx.set_word_break_characters(" \t.,-%!;:=*~^'\"/?<>|[](){}");
    rx.set_no_color(not Options::Get().show_prompt);

    auto args = AP.args();
    if (args.empty())
        args.push_back("-"); // start in interactive mode

    /* Process all the inputs. */
    for (auto filename : args) {
        /*----- Open the input stream. -------------------------------------------------------------------------------*/
        if (streq("-", filename)) {
            const char *cinput = nullptr;
            std::stringstream ss;
            for (;;) {
                do
                    cinput = rx.input(Options::Get().show_prompt ? prompt(ss.str().size() != 0) : ""); // Read one line of input
                while ((cinput == nullptr) and (errno == EAGAIN));

                /* User sent EOF */
                if (cinput == nullptr) {
                    if (Options::Get().show_prompt)
                        std::cout << std::endl;
                    if (not isspace(ss.str().c_str()))
                        engine.process_stream(ss, filename, diag); // run a trailing statement without `;`
                    break;
                }

                /* User sent input */
                auto len = strlen(cinput);
                if (not isspace(cinput, len)) {
                    ss.write(cinput, len); // append replxx line to stream
                    rx.history_add(cinput);
                    if (cinput[len - 1] == ';') {
                        engine.process_stream(ss, filename, diag);
                        ss.str(""); // empty the stream
                        ss.clear(); // and clear EOF bit
                    } else
                        ss.put('\n');
                }
                rx.history_save(history_file);
            }
        } else {
            std::ifstream in(filename);
            if (not in) {
                const auto errsv = errno;
                diag.err() << "Could not open file '" << filename << '\'';
                if (errsv)
                    std::cerr << ": " << strerror(errsv);
                std::cerr << ".  Aborting." << std::endl;
                break;
            }
            engine.process_stream(in, filename, diag);
        }
    }

    std::exit(diag.num_errors() ? EXIT_FAILURE : EXIT_SUCCESS);
}
