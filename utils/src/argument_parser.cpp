#include "argument_parser.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

ArgumentParser::ArgumentParser(const std::string& program_name,
                                 const std::string& description)
    : program_name_(program_name), description_(description) {}

void ArgumentParser::add_argument(const std::string& name, const std::string& help) {
    Argument arg;
    arg.name = name;
    arg.help = help;
    arg.required = true;
    arg.is_flag = false;
    positional_args_.push_back(arg);
}

void ArgumentParser::add_option(const std::string& name, const std::string& help,
                const std::string& default_value) {
    Argument arg;
    arg.name = name;
    arg.help = help;
    arg.required = false;
    arg.is_flag = false;
    arg.default_value = default_value;
    optional_args_[name] = arg;
}

// Add a flag (boolean option)
void ArgumentParser::add_flag(const std::string& name, const std::string& help) {
    Argument arg;
    arg.name = name;
    arg.help = help;
    arg.required = false;
    arg.is_flag = true;
    arg.default_value = "false";
    optional_args_[name] = arg;
}

// Add the new overload of add_option
void ArgumentParser::add_option(const std::string& name, const std::string& help,
                              const std::string& default_value,
                              const std::vector<std::string>& valid_values) {
    Argument arg;
    arg.name = name;
    arg.help = help;
    arg.required = false;
    arg.is_flag = false;
    arg.default_value = default_value;
    arg.valid_values = valid_values;
    arg.has_validation = true;

    // Validate default value against valid_values
    if (!default_value.empty() && !valid_values.empty()) {
        if (std::find(valid_values.begin(), valid_values.end(), default_value) == valid_values.end()) {
            std::cerr << "Warning: Default value '" << default_value << "' for option '"
                      << name << "' is not in the list of valid values." << std::endl;
        }
    }

    optional_args_[name] = arg;
}

// Parse command-line arguments
bool ArgumentParser::parse(int argc, char* argv[]) {
    std::vector<std::string> args(argv, argv + argc);

    // Check for help flag
    for (const auto& arg : args) {
        if (arg == "-h" || arg == "--help") {
            print_help();
            return false;
        }
    }

    // Process optional arguments and flags
    size_t pos_arg_index = 0;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg.substr(0, 9) == "--kokkos-") {
            continue;
        } else if (arg.substr(0, 1) == "-" && !is_number(arg)) {
            // It's an optional argument or flag
            std::string name = arg;
            if (name.size() > 1 && name[1] == '-') {
                // Handle --name format
                name = name.substr(2);
            } else {
                // Handle -name format
                name = name.substr(1);
            }

            auto it = optional_args_.find(name);
            if (it == optional_args_.end()) {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_help();
                return false;
            }

            if (it->second.is_flag) {
                // It's a flag
                it->second.value = "true";
            } else {
                // It's an optional argument that needs a value
                // negative numbers (temperatures, rise) are values, not options
                if (i + 1 >= args.size() || (args[i+1].substr(0, 1) == "-" && !is_number(args[i+1]))) {
                    std::cerr << "Option " << arg << " requires a value" << std::endl;
                    print_help();
                    return false;
                }

                std::string value = args[++i];

                // Validate value against valid_values if needed
                if (it->second.has_validation && !it->second.valid_values.empty()) {
                    if (std::find(it->second.valid_values.begin(), it->second.valid_values.end(), value)
                        == it->second.valid_values.end()) {
                        std::cerr << "Error: Invalid value '" << value << "' for option '"
                                 << name << "'." << std::endl;
                        std::cerr << "Valid values are: ";
                        for (size_t j = 0; j < it->second.valid_values.size(); ++j) {
                            std::cerr << "'" << it->second.valid_values[j] << "'";
                            if (j < it->second.valid_values.size() - 1) {
                                std::cerr << ", ";
                            }
                        }
                        std::cerr << std::endl;
                        print_help();
                        return false;
                    }
                }

                it->second.value = value;
            }
        } else {
            // It's a positional argument
            if (pos_arg_index >= positional_args_.size()) {
                std::cerr << "Too many positional arguments" << std::endl;
                print_help();
                return false;
            }

            positional_args_[pos_arg_index].value = arg;
            pos_arg_index++;
        }
    }

    // Check if all required arguments are provided
    if (pos_arg_index < positional_args_.size()) {
        std::cerr << "Not enough positional arguments" << std::endl;
        print_help();
        return false;
    }

    // Set default values for optional arguments not provided
    for (auto& pair : optional_args_) {
        if (pair.second.value.empty()) {
            pair.second.value = pair.second.default_value;
        }
    }

    return true;
}

// Get the value of a positional argument
std::string ArgumentParser::get_positional(size_t index) const {
    if (index < positional_args_.size()) {
        return positional_args_[index].value;
    }
    return "";
}

// Get the value of an optional argument
std::string ArgumentParser::get_option(const std::string& name) const {
    auto it = optional_args_.find(name);
    if (it != optional_args_.end()) {
        return it->second.value;
    }
    return "";
}

// Get the value of an optional argument as a number
double ArgumentParser::get_double(const std::string& name) const {
    std::string value = get_option(name);
    if (!is_number(value)) {
        throw std::invalid_argument("Option --" + name + " requires a numeric value, got '" + value + "'");
    }
    return std::strtod(value.c_str(), nullptr);
}

bool ArgumentParser::is_number(const std::string& text) {
    if (text.empty()) return false;
    const char* begin = text.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    return end != begin && *end == '\0' && std::isfinite(value);
}

// Check if a flag is set
bool ArgumentParser::get_flag(const std::string& name) const {
    auto it = optional_args_.find(name);
    if (it != optional_args_.end() && it->second.is_flag) {
        return it->second.value == "true";
    }
    return false;
}

// Print help message
void ArgumentParser::print_help() const {
    std::cerr << "Usage: " << program_name_;

    for (const auto& arg : positional_args_) {
        std::cerr << " <" << arg.name << ">";
    }

    if (!optional_args_.empty()) {
        std::cerr << " [options]";
    }

    std::cerr << std::endl << std::endl;
    std::cerr << description_ << std::endl << std::endl;

    if (!positional_args_.empty()) {
        std::cerr << "Positional arguments:" << std::endl;
        for (const auto& arg : positional_args_) {
            std::cerr << "  " << arg.name << "\t" << arg.help << std::endl;
        }
        std::cerr << std::endl;
    }

    if (!optional_args_.empty()) {
        std::cerr << "Optional arguments:" << std::endl;
        std::cerr << "  -h, --help\tShow this help message and exit" << std::endl;
        for (const auto& pair : optional_args_) {
            const auto& arg = pair.second;
            std::cerr << "  --" << arg.name;
            if (!arg.is_flag) {
                std::cerr << " VALUE";
            }
            std::cerr << "\t" << arg.help;

            // Show default value if present
            if (!arg.is_flag && !arg.default_value.empty()) {
                std::cerr << " (default: " << arg.default_value << ")";
            }

            // Show valid values if present
            if (arg.has_validation && !arg.valid_values.empty()) {
                std::cerr << " [choices: ";
                for (size_t i = 0; i < arg.valid_values.size(); ++i) {
                    std::cerr << arg.valid_values[i];
                    if (i < arg.valid_values.size() - 1) {
                        std::cerr << ", ";
                    }
                }
                std::cerr << "]";
            }

            std::cerr << std::endl;
        }
    }
}

ArgumentParser ArgumentParser::line_sizer_parser(const std::string& program_name,
                                                 const std::vector<std::string>& refrigerants) {
    ArgumentParser parser(program_name, "Refrigerant copper line sizing: evaluates standard tube sizes "
                                        "and selects the smallest one meeting velocity and temperature loss criteria");

    // Request
    std::string default_refrigerant = refrigerants.empty() ? "" : refrigerants.front();
    if (std::find(refrigerants.begin(), refrigerants.end(), "R134a") != refrigerants.end()) {
        default_refrigerant = "R134a";
    }
    parser.add_option("refrigerant", "Refrigerant code", default_refrigerant, refrigerants);
    parser.add_option("line_type", "Line type", "suction",
                      {"liquid", "suction", "discharge", "liquido", "succion", "descarga"});
    parser.add_option("capacity", "System capacity [BTU/h]");
    parser.add_option("length", "Equivalent length including fittings [ft]");
    parser.add_option("rise", "Vertical rise, > 0 for a riser [ft]", "0");
    parser.add_option("evap_temp", "Evaporating temperature [F]", "40");
    parser.add_option("cond_temp", "Condensing temperature [F]", "105");
    parser.add_option("liquid_temp", "Liquid temperature [F]", "95");

    // Design criteria
    parser.add_option("max_dt_liquid", "Maximum temperature loss, liquid lines [F]", "1.0");
    parser.add_option("max_dt_vapor", "Maximum temperature loss, suction and discharge lines [F]", "2.0");
    parser.add_option("riser_min_vel", "Minimum riser velocity [m/s]", "8.0");
    parser.add_option("riser_max_vel", "Maximum riser velocity [m/s]", "12.0");
    parser.add_option("horizontal_min_vel", "Minimum horizontal run velocity [m/s]", "4.0");
    parser.add_option("liquid_max_vel", "Maximum liquid line velocity [ft/min]", "300.0");

    // Execution and output
    parser.add_option("device", "Device to use (serial, openmp, cuda)", "serial", {"serial", "openmp", "cuda"});
    parser.add_option("output", "HDF5 file to write the full result to");
    parser.add_flag("verbose", "Enable verbose output");

    return parser;
}
