#ifndef STRATA_HPP
#define STRATA_HPP

// Main header that includes everything

#include <strata/client.hpp>
#include <strata/dispatcher.hpp>
#include <strata/errors.hpp>
#include <strata/protocol/events.hpp>
#include <strata/session.hpp>
#include <strata/snapshot.hpp>
#include <strata/tools.hpp>
#include <strata/transport.hpp>
#include <strata/types.hpp>
#include <strata/version.hpp>

#endif // STRATA_HPP
