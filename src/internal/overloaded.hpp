#ifndef STRATA_INTERNAL_OVERLOADED_HPP
#define STRATA_INTERNAL_OVERLOADED_HPP

namespace strata
{
namespace internal
{

// Visitor built from a set of lambdas, for std::visit
template <class... Ts> struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace internal
} // namespace strata

#endif // STRATA_INTERNAL_OVERLOADED_HPP
