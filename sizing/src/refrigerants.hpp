#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "line_type.hpp"

namespace linesizer {

/**
 * @brief Thrown when a refrigerant code is not in the property table.
 */
class UnsupportedRefrigerant : public std::invalid_argument {
public:
    explicit UnsupportedRefrigerant(const std::string& code)
        : std::invalid_argument("Unsupported refrigerant: " + code), code_(code) {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

/**
 * @brief Thrown when a refrigerating effect is not positive, since capacity is divided by it.
 */
class InvalidRefrigeratingEffect : public std::runtime_error {
public:
    explicit InvalidRefrigeratingEffect(const std::string& code)
        : std::runtime_error("Invalid refrigerating effect for refrigerant " + code) {}
};

/**
 * @brief Constant property approximation for one refrigerant.
 *
 * Properties are not temperature dependent.
 */
struct RefrigerantProperties {
    std::string code;
    double vapor_density;        // [lbm/ft^3]
    double liquid_density;       // [lbm/ft^3]
    double vapor_viscosity;      // [lbm/ft-s]
    double refrigerating_effect; // [BTU/lbm]
};

/**
 * @brief Read-only table of refrigerant properties keyed by code.
 */
class RefrigerantTable {
public:
    explicit RefrigerantTable(const std::vector<RefrigerantProperties>& entries);
    ~RefrigerantTable() = default;

    // Table with R134a, R22, R410A and R12
    static const RefrigerantTable& standard();

    const RefrigerantProperties& lookup(const std::string& code) const;
    bool contains(const std::string& code) const { return table_.count(code) > 0; }
    std::vector<std::string> codes() const;
    size_t size() const { return table_.size(); }

    // liquid density for liquid lines, vapor density for suction and discharge [lbm/ft^3]
    double select_density(const std::string& code, LineType line_type) const;
    // always the vapor viscosity, the table carries no liquid viscosity [lbm/ft-s]
    double select_viscosity(const std::string& code, LineType line_type) const;
    // [BTU/lbm]
    double select_refrigerating_effect(const std::string& code) const;

private:
    std::map<std::string, RefrigerantProperties> table_;
};

// lookup in the standard table
const RefrigerantProperties& lookup_refrigerant(const std::string& code);

} // namespace linesizer
