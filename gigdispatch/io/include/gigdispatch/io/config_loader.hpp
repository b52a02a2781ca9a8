#pragma once

/// @file config_loader.hpp
/// @brief Loading AllocationConfig from JSON.
/// @ingroup io_loaders

#include <gigdispatch/algo/config.hpp>

#include <filesystem>
#include <ostream>
#include <string_view>

namespace gigdispatch::io {

/// @brief Load an allocation config from a JSON file.
///
/// The file holds one flat object whose keys are the AllocationConfig field
/// names; missing keys keep their defaults and unknown keys are ignored.
///
/// @code{.json}
/// {
///   "offer_timeout_seconds": 45,
///   "max_concurrent_offers": 3,
///   "distance_weight": 0.4,
///   "enable_ai_optimization": false
/// }
/// @endcode
///
/// @throws LoaderError if the file cannot be read, a value has the wrong
///         type, or the resulting config fails validate_config().
/// @ingroup io_loaders
algo::AllocationConfig load_config(const std::filesystem::path& path);

/// @brief Load an allocation config from a JSON string.
/// @see load_config
algo::AllocationConfig load_config_from_string(std::string_view json);

/// @brief Write @p config as a JSON object accepted by load_config().
void write_config_to_stream(const algo::AllocationConfig& config, std::ostream& out);

} // namespace gigdispatch::io
