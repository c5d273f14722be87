#pragma once

#include <string>
#include <vector>
#include <Kokkos_Core.hpp>

#include "constants.hpp"
#include "design_criteria.hpp"
#include "refrigerants.hpp"
#include "sizing_input.hpp"
#include "tube_catalog.hpp"

namespace linesizer {

/**
 * @brief Numeric flow solution for one tube.
 *
 * Plain data so it can live in a Kokkos::View.
 */
struct FlowState {
    double velocity_ft_s;     // [ft/s]
    double velocity_ft_min;   // [ft/min]
    double velocity_m_s;      // [m/s], thresholds and display only
    double reynolds;          // [-]
    double friction_factor;   // [-], Darcy
    double pressure_drop_psi; // [lbf/in^2]
    double temperature_loss;  // [F]

    // Default constructor (required by Kokkos, must be trivial)
    KOKKOS_FUNCTION FlowState() = default;
};

/**
 * @brief Full evaluation of one catalog tube for one request.
 */
struct TubeEvaluation {
    Tube tube;
    double velocity_ft_min = 0.0;   // [ft/min]
    double velocity_m_s = 0.0;      // [m/s]
    double pressure_drop_psi = 0.0; // [lbf/in^2]
    double temperature_loss = 0.0;  // [F]
    double reynolds = 0.0;          // [-]
    double friction_factor = 0.0;   // [-]
    std::vector<std::string> warnings;
};

/**
 * @brief Darcy friction factor.
 *
 * Laminar 64/Re below Re = 2300, Blasius 0.3164 Re^-0.25 at and above it. Blasius is a
 * smooth pipe correlation for moderate Re and is only an approximation elsewhere.
 */
KOKKOS_INLINE_FUNCTION double friction_factor(double Re) {
    if (Re <= 0.0) return 0.0;
    if (Re < RE_TRANSITION) {
        return LAMINAR_COEFF / Re;
    }
    return BLASIUS_COEFF * Kokkos::pow(Re, BLASIUS_EXP);
}

// 1 psi ~ 1 F on suction lines, coarser 0.5 F/psi for discharge and liquid lines
KOKKOS_INLINE_FUNCTION double temperature_loss_factor(bool suction) {
    return suction ? SUCTION_DT_PER_PSI : OTHER_DT_PER_PSI;
}

/**
 * @brief Solve velocity, Reynolds number, friction and pressure drop in a round tube.
 * @param mass_flow Mass flow rate [lbm/s].
 * @param rho Density [lbm/ft^3].
 * @param mu Dynamic viscosity [lbm/ft-s].
 * @param inner_diameter Inner diameter [in].
 * @param length Equivalent length [ft], floored to MIN_EQUIVALENT_LENGTH.
 * @param dt_per_psi Pressure drop to temperature loss factor [F/psi].
 */
KOKKOS_INLINE_FUNCTION FlowState solve_flow(double mass_flow, double rho, double mu,
                                            double inner_diameter, double length, double dt_per_psi) {
    FlowState state;

    double D = inner_diameter / IN_PER_FT;  // [ft]
    double A = PI * D * D / 4.0;            // [ft^2]

    state.velocity_ft_s = A > 0.0 ? (mass_flow / rho) / A : 0.0;
    state.velocity_ft_min = state.velocity_ft_s * S_PER_MIN;
    state.velocity_m_s = (state.velocity_ft_min / S_PER_MIN) * M_PER_FT;

    state.reynolds = mu > 0.0 ? (rho * state.velocity_ft_s * D) / mu : 0.0;
    state.friction_factor = friction_factor(state.reynolds);

    double L = length > MIN_EQUIVALENT_LENGTH ? length : MIN_EQUIVALENT_LENGTH;
    double v = state.velocity_ft_s;
    double dP = D > 0.0 ? state.friction_factor * (L / D) * (rho * v * v) / (2.0 * GC) : 0.0; // [lbf/ft^2]
    state.pressure_drop_psi = dP / IN2_PER_FT2;
    state.temperature_loss = state.pressure_drop_psi * dt_per_psi;

    return state;
}

/**
 * @brief Refrigerant mass flow needed to carry the capacity.
 * @param capacity Capacity [BTU/h].
 * @param refrigerant Refrigerant properties.
 * @return Mass flow rate [lbm/s].
 * @throws InvalidRefrigeratingEffect if the refrigerating effect is not positive.
 */
double compute_mass_flow(double capacity, const RefrigerantProperties& refrigerant);

// Advisory messages for the velocity bands of the line type and orientation
std::vector<std::string> flow_warnings(const SizingInput& input, const FlowState& state,
                                       const DesignCriteria& criteria = DesignCriteria());

// Attach the host side data (tube, warnings) to a numeric solution
TubeEvaluation make_evaluation(const Tube& tube, const FlowState& state, std::vector<std::string> warnings);

/**
 * @brief Evaluate one tube for one request. Pure function of its arguments.
 * @throws UnsupportedRefrigerant if the refrigerant is not in the table.
 * @throws InvalidRefrigeratingEffect if the refrigerating effect is not positive.
 */
TubeEvaluation evaluate_tube(const SizingInput& input, const Tube& tube,
                             const RefrigerantTable& table = RefrigerantTable::standard(),
                             const DesignCriteria& criteria = DesignCriteria());

} // namespace linesizer
