#include <sisodb/Options.hpp>


using namespace siso;


Options & Options::Get()
{
    static Options the_options;
    return the_options;
}
