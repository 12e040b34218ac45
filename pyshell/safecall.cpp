#include "safecall.hpp"

#include <iostream>

namespace pyshell {

auto report_error(char const* const location, char const* const what) -> void
{
    std::cerr << "error in " << location << ": " << what << std::endl;
}

} // namespace pyshell
