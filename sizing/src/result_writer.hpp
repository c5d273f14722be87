#pragma once

#include <string>

#include "line_sizer.hpp"
#include "sizing_input.hpp"

namespace linesizer {

/**
 * @brief Export a sizing request and its result to an HDF5 file.
 *
 * Layout:
 *   /INPUT    refrigerant, line_type, capacity, equivalent_length, vertical_rise, temperatures
 *   /TUBES    nominal, outer_diameter, inner_diameter, wall_thickness_mm
 *   /RESULTS  velocity_ft_min, velocity_m_s, pressure_drop_psi, temperature_loss, reynolds,
 *             friction_factor, warning_count, mass_flow, selected_index (-1 when none)
 *
 * An existing file is overwritten.
 */
void write_sizing_result(const std::string& filename, const SizingInput& input, const SizingResult& result);

} // namespace linesizer
