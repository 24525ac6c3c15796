#ifndef STRATA_VERSION_HPP
#define STRATA_VERSION_HPP

#include <string>

namespace strata
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;
// Bridge wire protocol revision understood by this build
constexpr int PROTOCOL_REVISION = 1;

std::string version_string();

} // namespace strata

#endif // STRATA_VERSION_HPP
