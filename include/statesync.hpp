#pragma once

/*
===============================================================================
statesync - Public API Entry Point
===============================================================================

Primary public entry point of the statesync library.

statesync::Client is the user-facing facade. The header-only core under
statesync/core/ (transport, protocol, sync) can be used directly to plug in
another transport or to drive a Session with a custom clock.
===============================================================================
*/

#include <statesync/version.hpp>
#include <statesync/client.hpp>
