#pragma once

#include <string>
#include <vector>

namespace linesizer {

/**
 * @brief Raw catalog row as stocked: nominal size, outer diameter [mm], wall thickness [mm].
 */
struct RawTube {
    std::string nominal;
    double outer_diameter_mm;
    double wall_thickness_mm;
};

/**
 * @brief Copper tube candidate with diameters in inches.
 *
 * The nominal label is not unique, two wall thicknesses may share a nominal size.
 */
struct Tube {
    std::string nominal;
    double outer_diameter;    // [in]
    double inner_diameter;    // [in]
    double wall_thickness_mm; // [mm], as stocked
};

/**
 * @brief Build a catalog from raw metric rows.
 * @param rows Raw rows in any order.
 * @return Tubes sorted ascending by inner diameter, duplicates of a nominal size kept.
 * @throws std::invalid_argument if a row yields a non-positive inner diameter.
 */
std::vector<Tube> build_tube_catalog(const std::vector<RawTube>& rows);

// Standard stocked ACR copper sizes, 1/4 through 4 1/8
const std::vector<RawTube>& standard_raw_tubes();

// Catalog built once from standard_raw_tubes()
const std::vector<Tube>& list_copper_tubes();

} // namespace linesizer
