#include <sstream>
#include <strata/version.hpp>

namespace strata
{

std::string version_string()
{
    std::ostringstream oss;
    oss << VERSION_MAJOR << "." << VERSION_MINOR << "." << VERSION_PATCH << " (protocol "
        << PROTOCOL_REVISION << ")";
    return oss.str();
}

} // namespace strata
