#ifndef COCHAN_SHARED_STATE_HPP
#define COCHAN_SHARED_STATE_HPP

// =============================================================================
// cochan Shared State
// =============================================================================
//
// Task-aware primitives for sharing data between tasks. A task that cannot
// proceed suspends and is queued on the primitive; it never blocks the
// worker thread running it.
//
// Primitives:
// - channel: typed conduit, unbuffered (rendezvous) or bounded FIFO, closable
// - mutex: lock owned by a task, handed over to waiters in arrival order
// - safe_counter / unsafe_counter: per-key counts behind a mutex, and the
//   unguarded counter they are compared against
//
// =============================================================================

// Foundation headers
#include "shared_state/concepts.hpp"
#include "shared_state/policies.hpp"
#include "shared_state/crtp_base.hpp"

// Primitive headers
#include "shared_state/channel.hpp"
#include "shared_state/mutex.hpp"
#include "shared_state/safe_counter.hpp"

#endif // COCHAN_SHARED_STATE_HPP
