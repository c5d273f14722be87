#include "report.hpp"

#include <iomanip>
#include <ios>
#include <string>

namespace linesizer {

namespace {

// Restores the caller's stream formatting on scope exit
class StreamFormatGuard {
public:
    explicit StreamFormatGuard(std::ostream& os) : os_(os), flags_(os.flags()), precision_(os.precision()) {}
    ~StreamFormatGuard() {
        os_.flags(flags_);
        os_.precision(precision_);
    }

private:
    std::ostream& os_;
    std::ios::fmtflags flags_;
    std::streamsize precision_;
};

} // namespace

void print_input(std::ostream& os, const SizingInput& input) {
    StreamFormatGuard guard(os);
    os << std::fixed << std::setprecision(1);
    os << "Refrigerant:            " << input.refrigerant << '\n';
    os << "Line type:              " << to_string(input.line_type) << '\n';
    os << "Capacity:               " << input.capacity << " BTU/h" << '\n';
    os << "Equivalent length:      " << input.equivalent_length << " ft" << '\n';
    os << "Vertical rise:          " << input.vertical_rise << " ft" << '\n';
    os << "Evaporating temp.:      " << input.evaporating_temperature << " F" << '\n';
    os << "Condensing temp.:       " << input.condensing_temperature << " F" << '\n';
    os << "Liquid temp.:           " << input.liquid_temperature << " F" << '\n';
    os << std::endl;
}

void print_results_table(std::ostream& os, const SizingResult& result) {
    StreamFormatGuard guard(os);
    os << std::fixed;
    os << std::setw(2)  << ""
       << std::setw(8)  << "Nominal"
       << std::setw(10) << "OD"
       << std::setw(10) << "ID"
       << std::setw(14) << "Velocity"
       << std::setw(12) << "Press."
       << std::setw(12) << "Temp."
       << std::setw(12) << "Re"
       << '\n';

    os << std::setw(2)  << ""
       << std::setw(8)  << ""
       << std::setw(10) << "(in)"
       << std::setw(10) << "(in)"
       << std::setw(14) << "(ft/min)"
       << std::setw(12) << "(psi)"
       << std::setw(12) << "(F)"
       << std::setw(12) << "(-)"
       << '\n';

    for (size_t i = 0; i < result.evaluations.size(); ++i) {
        const TubeEvaluation& ev = result.evaluations[i];
        bool is_selected = result.selected && *result.selected == i;
        os << std::setw(2)  << (is_selected ? "*" : "")
           << std::setw(8)  << ev.tube.nominal
           << std::setw(10) << std::setprecision(3) << ev.tube.outer_diameter
           << std::setw(10) << std::setprecision(3) << ev.tube.inner_diameter
           << std::setw(14) << std::setprecision(1) << ev.velocity_ft_min
           << std::setw(12) << std::setprecision(3) << ev.pressure_drop_psi
           << std::setw(12) << std::setprecision(3) << ev.temperature_loss
           << std::setw(12) << std::setprecision(0) << ev.reynolds
           << '\n';
    }
    os << std::endl;
}

void print_selection(std::ostream& os, const SizingResult& result, LineType line_type) {
    StreamFormatGuard guard(os);
    const TubeEvaluation* selected = result.selected_evaluation();
    if (selected == nullptr) {
        os << "No standard size meets both the temperature loss and velocity criteria. "
           << "Review equivalent length, capacity or design criteria." << std::endl;
        return;
    }

    os << std::fixed;
    os << "Selected tube: " << selected->tube.nominal
       << " (OD ~ " << std::setprecision(3) << selected->tube.outer_diameter << " in"
       << ", ID ~ " << std::setprecision(3) << selected->tube.inner_diameter << " in)" << '\n';
    os << "  Velocity ~ " << std::setprecision(1) << selected->velocity_ft_min << " ft/min"
       << " (" << std::setprecision(2) << selected->velocity_m_s << " m/s)" << '\n';
    os << "  Pressure drop ~ " << std::setprecision(3) << selected->pressure_drop_psi << " psi" << '\n';
    os << "  Equivalent temperature loss ~ " << std::setprecision(3) << selected->temperature_loss << " F" << '\n';
    os << "  Reynolds number ~ " << std::setprecision(0) << selected->reynolds << '\n';

    if (!selected->warnings.empty()) {
        os << "Warnings:" << '\n';
        for (const auto& warning : selected->warnings) {
            os << "  - " << warning << '\n';
        }
    } else {
        os << "No basic velocity or temperature loss warnings for this selection." << '\n';
    }

    if (line_type == LineType::Liquid) {
        os << "Also check the available subcooling and the static head losses "
           << "to avoid flashing in the liquid line." << '\n';
    } else if (line_type == LineType::Suction) {
        os << "Check traps, slopes and the possible need for a double riser "
           << "if the part load is very low." << '\n';
    }
    os << std::endl;
}

void print_error(std::ostream& os, const SizingError& error) {
    os << "Error: " << error.message << " [" << to_string(error.kind) << "]" << std::endl;
}

} // namespace linesizer
