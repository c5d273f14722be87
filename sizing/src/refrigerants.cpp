#include "refrigerants.hpp"

namespace linesizer {

RefrigerantTable::RefrigerantTable(const std::vector<RefrigerantProperties>& entries) {
    for (const auto& entry : entries) {
        table_[entry.code] = entry;
    }
}

const RefrigerantTable& RefrigerantTable::standard() {
    static const RefrigerantTable table({
        // code, rho_vapor, rho_liquid, mu_vapor, refrigerating effect
        {"R134a", 0.30, 75.0, 2.5e-5, 70.0},
        {"R22",   0.35, 66.0, 2.5e-5, 85.0},
        {"R410A", 0.40, 64.0, 2.3e-5, 75.0},
        {"R12",   0.28, 80.0, 2.6e-5, 65.0},
    });
    return table;
}

const RefrigerantProperties& RefrigerantTable::lookup(const std::string& code) const {
    auto it = table_.find(code);
    if (it == table_.end()) {
        throw UnsupportedRefrigerant(code);
    }
    return it->second;
}

std::vector<std::string> RefrigerantTable::codes() const {
    std::vector<std::string> result;
    result.reserve(table_.size());
    for (const auto& pair : table_) {
        result.push_back(pair.first);
    }
    return result;
}

double RefrigerantTable::select_density(const std::string& code, LineType line_type) const {
    const RefrigerantProperties& ref = lookup(code);
    return line_type == LineType::Liquid ? ref.liquid_density : ref.vapor_density;
}

double RefrigerantTable::select_viscosity(const std::string& code, LineType /*line_type*/) const {
    return lookup(code).vapor_viscosity; // simplification
}

double RefrigerantTable::select_refrigerating_effect(const std::string& code) const {
    return lookup(code).refrigerating_effect;
}

const RefrigerantProperties& lookup_refrigerant(const std::string& code) {
    return RefrigerantTable::standard().lookup(code);
}

} // namespace linesizer
