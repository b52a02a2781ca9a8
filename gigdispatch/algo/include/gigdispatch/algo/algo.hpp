#pragma once

/// @defgroup algo Algo Library
/// @brief Candidate discovery, scoring, allocation strategies and the offer
///        lifecycle.
///
/// The algo library implements the dispatch algorithms on top of the core
/// records and collaborator contracts. It provides candidate discovery with
/// hard eligibility filtering, multi-factor scoring and ranking, the
/// Nearest / Broadcast / AIOptimized strategy table, bounded broadcast
/// fan-out and the AllocationEngine that drives offers from creation to
/// acceptance. Depends on core only.

/// @defgroup algo_discovery Candidate Discovery
/// @ingroup algo
/// @brief Required worker types and eligibility filtering.

/// @defgroup algo_scoring Scoring
/// @ingroup algo
/// @brief Sub-scores, weight profiles and ranking.

/// @defgroup algo_strategy Strategies
/// @ingroup algo
/// @brief Strategy table, offer dispatch and allocation results.

#include <gigdispatch/algo/allocation_engine.hpp>
#include <gigdispatch/algo/candidate.hpp>
#include <gigdispatch/algo/candidate_discovery.hpp>
#include <gigdispatch/algo/config.hpp>
#include <gigdispatch/algo/error.hpp>
#include <gigdispatch/algo/offer_dispatcher.hpp>
#include <gigdispatch/algo/scoring.hpp>
#include <gigdispatch/algo/strategy.hpp>
#include <gigdispatch/algo/task_group.hpp>
