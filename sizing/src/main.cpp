#include <Kokkos_Core.hpp>
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <highfive/H5Exception.hpp>

#include "argument_parser.hpp"
#include "design_criteria.hpp"
#include "line_sizer.hpp"
#include "refrigerants.hpp"
#include "report.hpp"
#include "result_writer.hpp"
#include "sizing_input.hpp"

using namespace linesizer;

template <typename ExecutionSpace>
int run(const SizingInput& input, const DesignCriteria& criteria, const std::string& output, bool verbose) {
    LineSizer<ExecutionSpace> sizer(criteria);
    SizingOutcome outcome = sizer.size_line(input);

    if (std::holds_alternative<SizingError>(outcome)) {
        print_error(std::cerr, std::get<SizingError>(outcome));
        return 1;
    }

    const SizingResult& result = std::get<SizingResult>(outcome);
    if (verbose) {
        std::cout << "Mass flow: " << result.mass_flow << " lb/s" << std::endl;
        std::cout << "Tubes evaluated: " << result.evaluations.size() << std::endl << std::endl;
    }

    print_results_table(std::cout, result);
    print_selection(std::cout, result, input.line_type);

    if (!output.empty()) {
        try {
            write_sizing_result(output, input, result);
            std::cout << "Results written to " << output << std::endl;
        } catch (const HighFive::Exception& err) {
            std::cerr << "Error: could not write " << output << ": " << err.what() << std::endl;
            return 1;
        }
    }
    return 0;
}

int main(int argc, char* argv[]) {
	Kokkos::initialize(argc, argv);
	int status = 0;
	{
		// Create argument parser with pre-configured arguments
		ArgumentParser parser = ArgumentParser::line_sizer_parser(argv[0], RefrigerantTable::standard().codes());

		// Parse arguments
		if (!parser.parse(argc, argv)) {
			Kokkos::finalize();
			return 1;
		}

		bool verbose = parser.get_flag("verbose");

		SizingInput input;
		DesignCriteria criteria;
		try {
			input.refrigerant = parser.get_option("refrigerant");
			input.line_type = parse_line_type(parser.get_option("line_type"));
			input.capacity = parser.get_double("capacity");
			input.equivalent_length = parser.get_double("length");
			input.vertical_rise = parser.get_double("rise");
			input.evaporating_temperature = parser.get_double("evap_temp");
			input.condensing_temperature = parser.get_double("cond_temp");
			input.liquid_temperature = parser.get_double("liquid_temp");

			criteria.max_dt_liquid = parser.get_double("max_dt_liquid");
			criteria.max_dt_vapor = parser.get_double("max_dt_vapor");
			criteria.riser_min_velocity = parser.get_double("riser_min_vel");
			criteria.riser_max_velocity = parser.get_double("riser_max_vel");
			criteria.horizontal_min_velocity = parser.get_double("horizontal_min_vel");
			criteria.liquid_max_velocity = parser.get_double("liquid_max_vel");
			input.validate();
			criteria.validate();
		} catch (const std::invalid_argument& err) {
			std::cerr << "Error: " << err.what() << std::endl;
			Kokkos::finalize();
			return 1;
		}

		if (verbose) {
			print_input(std::cout, input);
			std::cout << "Device: " << parser.get_option("device") << std::endl;
			std::cout << "Output: " << (parser.get_option("output").empty() ? "none" : parser.get_option("output")) << std::endl;

			std::cout << "Kokkos execution spaces enabled:\n";
			#ifdef KOKKOS_ENABLE_SERIAL
				std::cout << "  - SERIAL\n";
			#endif
			#ifdef KOKKOS_ENABLE_OPENMP
				std::cout << "  - OPENMP\n";
			#endif
			#ifdef KOKKOS_ENABLE_CUDA
				std::cout << "  - CUDA\n";
			#endif
			std::cout << std::endl;
		}

		std::string device = parser.get_option("device");
		std::string output = parser.get_option("output");

		if (device == "serial") {
			#ifdef KOKKOS_ENABLE_SERIAL
				status = run<Kokkos::Serial>(input, criteria, output, verbose);
			#else
				std::cerr << "Error: SERIAL execution space is not enabled in Kokkos build." << std::endl;
				status = 1;
			#endif
		} else if (device == "openmp") {
			#ifdef KOKKOS_ENABLE_OPENMP
				status = run<Kokkos::OpenMP>(input, criteria, output, verbose);
			#else
				std::cerr << "Error: OPENMP execution space is not enabled in Kokkos build." << std::endl;
				status = 1;
			#endif
		} else if (device == "cuda") {
			#ifdef KOKKOS_ENABLE_CUDA
				status = run<Kokkos::Cuda>(input, criteria, output, verbose);
			#else
				std::cerr << "Error: CUDA execution space is not enabled in Kokkos build." << std::endl;
				status = 1;
			#endif
		} else {
			std::cerr << "Error: Unsupported device '" << device << "'." << std::endl;
			status = 1;
		}
	}
	Kokkos::finalize();
	return status;
}
