#include <sisodb/sisodb.hpp>

#include "lex/Lexer.hpp"
#include <algorithm>
#include <iterator>
#include <sstream>


using namespace siso;


std::vector<std::string> siso::split_statements(std::istream &in)
{
    const std::string script((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    std::istringstream iss(script);
    std::ostringstream devnull;
    Diagnostic diag(false, devnull, devnull);
    ast::Lexer lexer(diag, "-", iss);

    std::vector<std::string> statements;
    std::size_t begin = 0;
    bool empty = true;
    for (auto tok = lexer.next(); ; tok = lexer.next()) {
        if (tok == TK_SEMICOL or tok == TK_EOF) {
            const std::size_t end = std::min(tok.pos.offset, script.length());
            if (not empty)
                statements.emplace_back(trim(std::string_view(script).substr(begin, end - begin)));
            if (tok == TK_EOF) break;
            begin = end + 1;
            empty = true;
        } else {
            empty = false;
        }
    }
    return statements;
}

std::unique_ptr<Dispatcher> Engine::dispatch(const std::string &statement)
{
    auto D = std::make_unique<Dispatcher>(config_.logging_level, config_.max_iterations);
    register_stages(*D, db_, config_.production);
    D->submit(std::make_shared<const Statement>(statement));
    D->run();
    return D;
}

std::string Engine::execute(const std::string &statement)
{
    auto D = dispatch(statement);
    return D->result().value_or("(no result)");
}

void Engine::process_stream(std::istream &in, const char *filename, Diagnostic &diag)
{
    std::size_t num = 0;
    for (auto &stmt : split_statements(in)) {
        ++num;
        if (config_.echo)
            diag.out() << stmt << ";\n";
        try {
            auto D = dispatch(stmt);
            diag.out() << D->result().value_or("(no result)") << '\n';
            if (config_.report)
                D->print_report(diag.out());
        } catch (const budget_exceeded &e) {
            diag.err() << filename << ": statement " << num << ": " << e.what() << std::endl;
        }
    }
    diag.out().flush();
}
