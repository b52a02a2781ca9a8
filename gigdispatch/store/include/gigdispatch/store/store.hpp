#pragma once

/// @defgroup store Store Library
/// @brief In-memory collaborators for simulation and tests.
///
/// The store library implements the core collaborator contracts on plain
/// in-memory containers: repositories with compare-and-set updates, a
/// haversine GeoService, a flat-rate earning calculator and a notifier
/// that records every message. Depends on core only.

#include <gigdispatch/store/earning_calculator.hpp>
#include <gigdispatch/store/geo_service.hpp>
#include <gigdispatch/store/notifier.hpp>
#include <gigdispatch/store/offer_repository.hpp>
#include <gigdispatch/store/task_repository.hpp>
#include <gigdispatch/store/worker_repository.hpp>
