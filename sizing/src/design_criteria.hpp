#pragma once

#include <stdexcept>

#include "constants.hpp"
#include "line_type.hpp"

namespace linesizer {

/**
 * @brief Velocity and temperature loss limits shared by the warnings and the selector.
 */
struct DesignCriteria {
    double max_dt_liquid = MAX_DT_LIQUID;                      // [F]
    double max_dt_vapor = MAX_DT_VAPOR;                        // [F]
    double riser_min_velocity = RISER_MIN_VELOCITY;            // [m/s]
    double riser_max_velocity = RISER_MAX_VELOCITY;            // [m/s]
    double horizontal_min_velocity = HORIZONTAL_MIN_VELOCITY;  // [m/s]
    double liquid_max_velocity = LIQUID_MAX_VELOCITY;          // [ft/min]

    double max_temperature_loss(LineType line_type) const {
        return line_type == LineType::Liquid ? max_dt_liquid : max_dt_vapor;
    }

    void validate() const {
        if (max_dt_liquid <= 0.0 || max_dt_vapor <= 0.0) {
            throw std::invalid_argument("Temperature loss limits must be positive");
        }
        if (riser_min_velocity <= 0.0 || horizontal_min_velocity <= 0.0 || liquid_max_velocity <= 0.0) {
            throw std::invalid_argument("Velocity limits must be positive");
        }
        if (riser_min_velocity > riser_max_velocity) {
            throw std::invalid_argument("Riser minimum velocity exceeds riser maximum velocity");
        }
    }
};

} // namespace linesizer
