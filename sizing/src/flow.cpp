#include "flow.hpp"

#include <sstream>
#include <utility>

namespace linesizer {

namespace {

std::string format_limit(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

} // namespace

double compute_mass_flow(double capacity, const RefrigerantProperties& refrigerant) {
    double q = capacity / S_PER_H; // [BTU/s]
    if (refrigerant.refrigerating_effect <= 0.0) {
        throw InvalidRefrigeratingEffect(refrigerant.code);
    }
    return q / refrigerant.refrigerating_effect;
}

std::vector<std::string> flow_warnings(const SizingInput& input, const FlowState& state,
                                       const DesignCriteria& criteria) {
    std::vector<std::string> warnings;

    if (is_vapor_line(input.line_type)) {
        // discharge shares the suction bands
        if (input.is_riser()) {
            if (state.velocity_m_s < criteria.riser_min_velocity) {
                warnings.push_back("Riser velocity below " + format_limit(criteria.riser_min_velocity)
                                   + " m/s: possible oil return problem.");
            } else if (state.velocity_m_s > criteria.riser_max_velocity) {
                warnings.push_back("Riser velocity above " + format_limit(criteria.riser_max_velocity)
                                   + " m/s: possible noise and high pressure drop.");
            }
        } else if (state.velocity_m_s < criteria.horizontal_min_velocity) {
            warnings.push_back("Horizontal run velocity below " + format_limit(criteria.horizontal_min_velocity)
                               + " m/s: insufficient oil return.");
        }
    } else if (state.velocity_ft_min > criteria.liquid_max_velocity) {
        warnings.push_back("Liquid line velocity above " + format_limit(criteria.liquid_max_velocity)
                           + " ft/min: higher pressure drop and flash gas risk.");
    }

    return warnings;
}

TubeEvaluation make_evaluation(const Tube& tube, const FlowState& state, std::vector<std::string> warnings) {
    TubeEvaluation evaluation;
    evaluation.tube = tube;
    evaluation.velocity_ft_min = state.velocity_ft_min;
    evaluation.velocity_m_s = state.velocity_m_s;
    evaluation.pressure_drop_psi = state.pressure_drop_psi;
    evaluation.temperature_loss = state.temperature_loss;
    evaluation.reynolds = state.reynolds;
    evaluation.friction_factor = state.friction_factor;
    evaluation.warnings = std::move(warnings);
    return evaluation;
}

TubeEvaluation evaluate_tube(const SizingInput& input, const Tube& tube,
                             const RefrigerantTable& table, const DesignCriteria& criteria) {
    const RefrigerantProperties& refrigerant = table.lookup(input.refrigerant);
    double rho = table.select_density(input.refrigerant, input.line_type);
    double mu = table.select_viscosity(input.refrigerant, input.line_type);
    double mass_flow = compute_mass_flow(input.capacity, refrigerant);

    FlowState state = solve_flow(mass_flow, rho, mu, tube.inner_diameter, input.equivalent_length,
                                 temperature_loss_factor(input.line_type == LineType::Suction));

    return make_evaluation(tube, state, flow_warnings(input, state, criteria));
}

} // namespace linesizer
