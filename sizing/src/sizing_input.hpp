#pragma once

#include <stdexcept>
#include <string>

#include "line_type.hpp"

namespace linesizer {

/**
 * @brief One sizing request.
 *
 * The temperatures are carried for display only, the calculation does not use them.
 */
struct SizingInput {
    std::string refrigerant;
    LineType line_type = LineType::Suction;
    double capacity = 0.0;               // [BTU/h]
    double equivalent_length = 0.0;      // [ft], floored before use
    double vertical_rise = 0.0;          // [ft], > 0 marks a riser
    double evaporating_temperature = 0.0; // [F]
    double condensing_temperature = 0.0;  // [F]
    double liquid_temperature = 0.0;      // [F]

    bool is_riser() const { return vertical_rise > 0.0; }

    // Negative capacity is rejected; length and rise are floored instead
    void validate() const {
        if (capacity < 0.0) {
            throw std::invalid_argument("Capacity must not be negative");
        }
    }
};

} // namespace linesizer
