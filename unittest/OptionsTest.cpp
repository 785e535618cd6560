#include "catch2/catch.hpp"

#include <sisodb/Options.hpp>
#include <sisodb/pipeline/Dispatcher.hpp>


using namespace siso;


TEST_CASE("Options", "[core][options]")
{
    Options &options = Options::Get();
    REQUIRE(&options == &Options::Get());

    SECTION("defaults")
    {
        CHECK(options.show_prompt);
        CHECK_FALSE(options.production);
        CHECK(options.log_level == unsigned(LoggingLevel::MINIMAL));
        CHECK(options.max_iterations == Dispatcher::DEFAULT_MAX_ITERATIONS);
    }

    SECTION("modification")
    {
        const bool quiet = options.quiet;
        options.quiet = not quiet;
        CHECK(Options::Get().quiet == not quiet);
        options.quiet = quiet;
    }
}
