#include "tube_catalog.hpp"
#include "constants.hpp"

#include <algorithm>
#include <stdexcept>

namespace linesizer {

namespace {

double mm_to_in(double mm) {
    return mm / MM_PER_IN;
}

} // namespace

std::vector<Tube> build_tube_catalog(const std::vector<RawTube>& rows) {
    std::vector<Tube> catalog;
    catalog.reserve(rows.size());

    for (const auto& row : rows) {
        double od_in = mm_to_in(row.outer_diameter_mm);
        double wall_in = mm_to_in(row.wall_thickness_mm);
        double id_in = od_in - 2.0 * wall_in;

        if (!(id_in > 0.0)) {
            throw std::invalid_argument("Tube " + row.nominal + " has a non-positive inner diameter");
        }
        catalog.push_back({row.nominal, od_in, id_in, row.wall_thickness_mm});
    }

    // the selector scans in this order and stops at the first fit
    std::stable_sort(catalog.begin(), catalog.end(), [](const Tube& a, const Tube& b) {
        return a.inner_diameter < b.inner_diameter;
    });

    return catalog;
}

const std::vector<RawTube>& standard_raw_tubes() {
    static const std::vector<RawTube> rows = {
        {"1/4",   6.35,   0.8},
        {"3/8",   9.52,   0.8},
        {"1/2",   12.7,   0.8},
        {"5/8",   15.87,  0.8},
        {"5/8",   15.87,  1.0},
        {"3/4",   19.06,  1.0},
        {"7/8",   22.22,  1.0},
        {"7/8",   22.22,  1.14},
        {"1",     25.4,   1.0},
        {"1 1/8", 28.57,  1.0},
        {"1 1/8", 28.57,  1.25},
        {"1 3/8", 34.92,  1.25},
        {"1 3/8", 34.92,  1.4},
        {"1 5/8", 41.27,  1.25},
        {"1 5/8", 41.27,  1.5},
        {"2 1/8", 53.97,  1.25},
        {"2 1/8", 53.97,  1.8},
        {"2 5/8", 66.67,  1.65},
        {"2 5/8", 66.67,  2.03},
        {"3 1/8", 79.37,  1.65},
        {"3 5/8", 92.08,  2.11},
        {"4 1/8", 104.78, 2.5},
    };
    return rows;
}

const std::vector<Tube>& list_copper_tubes() {
    static const std::vector<Tube> catalog = build_tube_catalog(standard_raw_tubes());
    return catalog;
}

} // namespace linesizer
