// Convenience header to include all of the Turnstile library.
//
#pragma once

#include "turnstile/assert.hpp"
#include "turnstile/async/completion_gate.hpp"
#include "turnstile/async/fake_clock.hpp"
#include "turnstile/async/polling_policy.hpp"
#include "turnstile/async/polling_wait_loop.hpp"
#include "turnstile/async/predicate_gate.hpp"
#include "turnstile/async/wait_loop.hpp"
#include "turnstile/int_types.hpp"
#include "turnstile/logging.hpp"
#include "turnstile/optional.hpp"
#include "turnstile/status.hpp"
#include "turnstile/type_traits.hpp"
#include "turnstile/utility.hpp"
