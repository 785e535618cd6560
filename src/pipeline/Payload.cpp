#include <sisodb/pipeline/Payload.hpp>

#include "lex/Lexer.hpp"
#include <sisodb/util/Diagnostic.hpp>
#include <sstream>


using namespace siso;


bool Statement::starts_with(std::initializer_list<TokenType> keywords) const
{
    std::istringstream in(text);
    std::ostringstream devnull;
    Diagnostic diag(false, devnull, devnull);
    ast::Lexer lexer(diag, "-", in);

    for (auto tt : keywords) {
        if (lexer.next().type != tt)
            return false;
    }
    return true;
}

Terminal Terminal::Error(const std::string &message)
{
    if (message.compare(0, 6, "ERROR:") == 0)
        return Terminal(message, true);
    return Terminal("ERROR: " + message, true);
}
