#pragma once

/// @defgroup io I/O Library
/// @brief JSON loaders, trace writers and dispatch metrics.
///
/// The io library loads allocation configs and dispatch scenarios from JSON
/// (RapidJSON), writes engine traces in several formats and derives
/// dispatch metrics from them. Depends on core and algo.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Config and scenario loading.

/// @defgroup io_writers Trace Writers
/// @ingroup io
/// @brief TraceWriter implementations.

/// @defgroup io_metrics Metrics
/// @ingroup io
/// @brief Metrics computed from traces.

#include <gigdispatch/io/config_loader.hpp>
#include <gigdispatch/io/error.hpp>
#include <gigdispatch/io/metrics.hpp>
#include <gigdispatch/io/scenario_loader.hpp>
#include <gigdispatch/io/trace_writers.hpp>
