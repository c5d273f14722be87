#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <Kokkos_Core.hpp>

#include "design_criteria.hpp"
#include "flow.hpp"
#include "refrigerants.hpp"
#include "sizing_input.hpp"
#include "tube_catalog.hpp"

namespace linesizer {

/**
 * @brief Every catalog tube evaluated in catalog order, plus the first tube meeting the criteria.
 *
 * An empty selection is a valid outcome: no standard size fits.
 */
struct SizingResult {
    std::vector<TubeEvaluation> evaluations;
    std::optional<size_t> selected;   // index into evaluations
    double mass_flow = 0.0;           // [lbm/s]

    const TubeEvaluation* selected_evaluation() const {
        return selected ? &evaluations[*selected] : nullptr;
    }
};

enum class SizingErrorKind { UnsupportedRefrigerant, InvalidRefrigeratingEffect };

inline std::string to_string(SizingErrorKind kind) {
    switch (kind) {
        case SizingErrorKind::UnsupportedRefrigerant:     return "UnsupportedRefrigerant";
        case SizingErrorKind::InvalidRefrigeratingEffect: return "InvalidRefrigeratingEffect";
    }
    return "Unknown";
}

/**
 * @brief Request failure. Not retryable, the input or the property table is wrong.
 */
struct SizingError {
    SizingErrorKind kind;
    std::string message;
};

using SizingOutcome = std::variant<SizingResult, SizingError>;

// Temperature loss and velocity band of the line type both satisfied
bool is_acceptable(const TubeEvaluation& evaluation, const SizingInput& input, const DesignCriteria& criteria);

// First acceptable evaluation in the given (ascending diameter) order
std::optional<size_t> select_first_fit(const std::vector<TubeEvaluation>& evaluations,
                                       const SizingInput& input, const DesignCriteria& criteria);


template <typename ExecutionSpace = Kokkos::DefaultHostExecutionSpace>
class LineSizer {

    using MemorySpace = typename ExecutionSpace::memory_space;
    using View1D = Kokkos::View<double *, MemorySpace>;
    using FlowView = Kokkos::View<FlowState *, MemorySpace>;

public:
    // Constructor over the standard copper catalog and refrigerant table
    LineSizer(const DesignCriteria& criteria = DesignCriteria());
    // Constructor for a custom catalog, reordered by ascending inner diameter
    LineSizer(const std::vector<Tube>& catalog, const RefrigerantTable& table, const DesignCriteria& criteria);
    ~LineSizer() = default;

    SizingOutcome size_line(const SizingInput& input) const;

    const std::vector<Tube>& catalog() const { return _catalog; }
    const DesignCriteria& criteria() const { return _criteria; }
    size_t ntubes() const { return _catalog.size(); }

    // Flow solution for every tube, left in the execution space memory
    FlowView solve(double mass_flow, double rho, double mu, double length, double dt_per_psi) const;

private:
    std::vector<Tube> _catalog;         // host copy, ascending inner diameter
    const RefrigerantTable* _table;     // not owned
    DesignCriteria _criteria;
    View1D _inner_diameter;             // [in], one per tube
};

// Size with the standard catalog, table and criteria on the default host execution space
SizingOutcome size_line(const SizingInput& input);

} // namespace linesizer
