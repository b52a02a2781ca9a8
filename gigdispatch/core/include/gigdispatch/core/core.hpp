#pragma once

/// @defgroup core Core Library
/// @brief Domain records, value types, errors, collaborator contracts and
///        the live worker state registry.
///
/// The core library holds everything the allocation algorithms share: the
/// GigWorker / Task / TaskOffer records, strong time and money types, the
/// exception taxonomy, the clock and call-context plumbing, the abstract
/// collaborators and the TraceWriter interface. It has no dependency on the
/// algorithms or on any storage or I/O format.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Strong types for time, money and coordinates.

/// @defgroup core_model Domain Model
/// @ingroup core
/// @brief Workers, tasks and offers.

/// @defgroup core_collaborators Collaborators
/// @ingroup core
/// @brief Repository, geo, pricing and notification contracts.

/// @defgroup core_registry Worker State Registry
/// @ingroup core
/// @brief Concurrency-safe live worker location and availability.

#include <gigdispatch/core/types.hpp>
#include <gigdispatch/core/error.hpp>
#include <gigdispatch/core/clock.hpp>
#include <gigdispatch/core/call_context.hpp>
#include <gigdispatch/core/trace_writer.hpp>
#include <gigdispatch/core/tracer.hpp>

#include <gigdispatch/core/task.hpp>
#include <gigdispatch/core/worker.hpp>
#include <gigdispatch/core/offer.hpp>
#include <gigdispatch/core/collaborators.hpp>
#include <gigdispatch/core/worker_state_registry.hpp>
