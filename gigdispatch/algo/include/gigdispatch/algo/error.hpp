#pragma once

#include <stdexcept>
#include <string>

namespace gigdispatch::algo {

/// @brief Exception thrown when an AllocationConfig fails validation.
/// @ingroup algo
///
/// Raised by validate_config() and by the AllocationEngine constructor.
///
/// @see validate_config, AllocationConfig
class ConfigError : public std::runtime_error {
public:
    /// @brief Construct a ConfigError for one configuration field.
    ///
    /// @param field    Name of the offending field (as spelled in JSON).
    /// @param message  What is wrong with its value.
    ConfigError(const std::string& field, const std::string& message)
        : std::runtime_error("invalid allocation config '" + field + "': " + message)
        , field_(field) {}

    /// @brief Name of the field that failed validation.
    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

} // namespace gigdispatch::algo
