#include "result_writer.hpp"

#include <vector>
#include <highfive/H5File.hpp>

#include "hdf5_utils.hpp"

namespace linesizer {

void write_sizing_result(const std::string& filename, const SizingInput& input, const SizingResult& result) {
    HighFive::File file(filename, HighFive::File::Overwrite);

    HighFive::Group input_group = file.createGroup("INPUT");
    write_hdf5_dataset(input_group, "refrigerant", input.refrigerant);
    write_hdf5_dataset(input_group, "line_type", to_string(input.line_type));
    write_hdf5_dataset(input_group, "capacity", input.capacity);
    write_hdf5_dataset(input_group, "equivalent_length", input.equivalent_length);
    write_hdf5_dataset(input_group, "vertical_rise", input.vertical_rise);
    write_hdf5_dataset(input_group, "evaporating_temperature", input.evaporating_temperature);
    write_hdf5_dataset(input_group, "condensing_temperature", input.condensing_temperature);
    write_hdf5_dataset(input_group, "liquid_temperature", input.liquid_temperature);

    size_t n = result.evaluations.size();
    std::vector<std::string> nominal(n);
    std::vector<double> outer_diameter(n), inner_diameter(n), wall_thickness(n);
    std::vector<double> velocity_ft_min(n), velocity_m_s(n), pressure_drop(n), temperature_loss(n);
    std::vector<double> reynolds(n), friction(n);
    std::vector<int> warning_count(n);

    for (size_t i = 0; i < n; ++i) {
        const TubeEvaluation& ev = result.evaluations[i];
        nominal[i] = ev.tube.nominal;
        outer_diameter[i] = ev.tube.outer_diameter;
        inner_diameter[i] = ev.tube.inner_diameter;
        wall_thickness[i] = ev.tube.wall_thickness_mm;
        velocity_ft_min[i] = ev.velocity_ft_min;
        velocity_m_s[i] = ev.velocity_m_s;
        pressure_drop[i] = ev.pressure_drop_psi;
        temperature_loss[i] = ev.temperature_loss;
        reynolds[i] = ev.reynolds;
        friction[i] = ev.friction_factor;
        warning_count[i] = static_cast<int>(ev.warnings.size());
    }

    HighFive::Group tubes = file.createGroup("TUBES");
    write_hdf5_dataset(tubes, "nominal", nominal);
    write_hdf5_dataset(tubes, "outer_diameter", outer_diameter);
    write_hdf5_dataset(tubes, "inner_diameter", inner_diameter);
    write_hdf5_dataset(tubes, "wall_thickness_mm", wall_thickness);

    HighFive::Group results = file.createGroup("RESULTS");
    write_hdf5_dataset(results, "velocity_ft_min", velocity_ft_min);
    write_hdf5_dataset(results, "velocity_m_s", velocity_m_s);
    write_hdf5_dataset(results, "pressure_drop_psi", pressure_drop);
    write_hdf5_dataset(results, "temperature_loss", temperature_loss);
    write_hdf5_dataset(results, "reynolds", reynolds);
    write_hdf5_dataset(results, "friction_factor", friction);
    write_hdf5_dataset(results, "warning_count", warning_count);
    write_hdf5_dataset(results, "mass_flow", result.mass_flow);
    write_hdf5_dataset(results, "selected_index", result.selected ? static_cast<int>(*result.selected) : -1);
}

} // namespace linesizer
