#pragma once

#include <ostream>

#include "line_sizer.hpp"
#include "sizing_input.hpp"

namespace linesizer {

// Echo of the request
void print_input(std::ostream& os, const SizingInput& input);

// One row per evaluated tube, the selected row marked with '*'
void print_results_table(std::ostream& os, const SizingResult& result);

// Selected tube summary with warnings and line type notes, or the no-fit advisory
void print_selection(std::ostream& os, const SizingResult& result, LineType line_type);

// Blocking error, no result is shown
void print_error(std::ostream& os, const SizingError& error);

} // namespace linesizer
