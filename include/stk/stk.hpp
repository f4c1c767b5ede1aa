// include/stk/stk.hpp
// Umbrella header for the STK Connect client library.

#pragma once

#include "config.hpp"
#include "connection.hpp"
#include "error.hpp"
#include "session.hpp"
#include "supervisor.hpp"
#include "types.hpp"
