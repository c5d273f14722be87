#include "line_sizer.hpp"

#include <algorithm>

namespace linesizer {

bool is_acceptable(const TubeEvaluation& evaluation, const SizingInput& input, const DesignCriteria& criteria) {
    bool ok_dt = evaluation.temperature_loss <= criteria.max_temperature_loss(input.line_type);

    bool ok_velocity = true;
    if (is_vapor_line(input.line_type)) {
        if (input.is_riser()) {
            ok_velocity = evaluation.velocity_m_s >= criteria.riser_min_velocity
                       && evaluation.velocity_m_s <= criteria.riser_max_velocity;
        } else {
            ok_velocity = evaluation.velocity_m_s >= criteria.horizontal_min_velocity;
        }
    } else {
        ok_velocity = evaluation.velocity_ft_min <= criteria.liquid_max_velocity;
    }

    return ok_dt && ok_velocity;
}

std::optional<size_t> select_first_fit(const std::vector<TubeEvaluation>& evaluations,
                                       const SizingInput& input, const DesignCriteria& criteria) {
    for (size_t i = 0; i < evaluations.size(); ++i) {
        if (is_acceptable(evaluations[i], input, criteria)) {
            return i;
        }
    }
    return std::nullopt;
}

template <typename ExecutionSpace>
LineSizer<ExecutionSpace>::LineSizer(const DesignCriteria& criteria)
    : LineSizer(list_copper_tubes(), RefrigerantTable::standard(), criteria) {}

template <typename ExecutionSpace>
LineSizer<ExecutionSpace>::LineSizer(const std::vector<Tube>& catalog, const RefrigerantTable& table,
                                     const DesignCriteria& criteria)
    : _catalog(catalog), _table(&table), _criteria(criteria) {

    _criteria.validate();

    // first fit only yields the smallest tube over ascending inner diameters
    std::stable_sort(_catalog.begin(), _catalog.end(), [](const Tube& a, const Tube& b) {
        return a.inner_diameter < b.inner_diameter;
    });

    // stage inner diameters on the host and copy to the execution space
    _inner_diameter = View1D("inner_diameter", _catalog.size());
    auto h_inner_diameter = Kokkos::create_mirror_view(_inner_diameter);
    for (size_t i = 0; i < _catalog.size(); ++i) {
        h_inner_diameter(i) = _catalog[i].inner_diameter;
    }
    Kokkos::deep_copy(_inner_diameter, h_inner_diameter);
}

template <typename ExecutionSpace>
typename LineSizer<ExecutionSpace>::FlowView
LineSizer<ExecutionSpace>::solve(double mass_flow, double rho, double mu, double length, double dt_per_psi) const {
    FlowView flow("flow", _catalog.size());
    auto inner_diameter = _inner_diameter;

    // each tube writes only its own slot
    Kokkos::parallel_for("LineSizer: solve_flow", Kokkos::RangePolicy<ExecutionSpace>(0, _catalog.size()),
        KOKKOS_LAMBDA(const size_t i)
        {
            flow(i) = solve_flow(mass_flow, rho, mu, inner_diameter(i), length, dt_per_psi);
        });

    Kokkos::fence();
    return flow;
}

template <typename ExecutionSpace>
SizingOutcome LineSizer<ExecutionSpace>::size_line(const SizingInput& input) const {
    double rho, mu, mass_flow;
    try {
        const RefrigerantProperties& refrigerant = _table->lookup(input.refrigerant);
        rho = _table->select_density(input.refrigerant, input.line_type);
        mu = _table->select_viscosity(input.refrigerant, input.line_type);
        mass_flow = compute_mass_flow(input.capacity, refrigerant);
    } catch (const UnsupportedRefrigerant& err) {
        return SizingError{SizingErrorKind::UnsupportedRefrigerant, err.what()};
    } catch (const InvalidRefrigeratingEffect& err) {
        return SizingError{SizingErrorKind::InvalidRefrigeratingEffect, err.what()};
    }

    double dt_per_psi = temperature_loss_factor(input.line_type == LineType::Suction);
    FlowView flow = solve(mass_flow, rho, mu, input.equivalent_length, dt_per_psi);
    auto h_flow = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), flow);

    SizingResult result;
    result.mass_flow = mass_flow;
    result.evaluations.reserve(_catalog.size());
    for (size_t i = 0; i < _catalog.size(); ++i) {
        const FlowState& state = h_flow(i);
        result.evaluations.push_back(make_evaluation(_catalog[i], state, flow_warnings(input, state, _criteria)));
    }
    result.selected = select_first_fit(result.evaluations, input, _criteria);

    return result;
}

SizingOutcome size_line(const SizingInput& input) {
    // built per request, nothing is cached between requests
    LineSizer<Kokkos::DefaultHostExecutionSpace> sizer;
    return sizer.size_line(input);
}

// Explicit template instantiations
#if defined(KOKKOS_ENABLE_SERIAL)
template class LineSizer<Kokkos::Serial>;
#endif
#if defined(KOKKOS_ENABLE_OPENMP)
template class LineSizer<Kokkos::OpenMP>;
#endif
#if defined(KOKKOS_ENABLE_THREADS)
template class LineSizer<Kokkos::Threads>;
#endif
#if defined(KOKKOS_ENABLE_CUDA)
template class LineSizer<Kokkos::Cuda>;
#endif

} // namespace linesizer
