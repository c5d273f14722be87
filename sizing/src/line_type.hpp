#pragma once

#include <string>
#include <stdexcept>

namespace linesizer {

// Refrigerant line category
enum class LineType { Liquid, Suction, Discharge };

// Accepts the English names and the Spanish form codes (liquido, succion, descarga)
inline LineType parse_line_type(const std::string& name) {
    if (name == "liquid" || name == "liquido") return LineType::Liquid;
    if (name == "suction" || name == "succion") return LineType::Suction;
    if (name == "discharge" || name == "descarga") return LineType::Discharge;
    throw std::invalid_argument("Unknown line type: '" + name + "'");
}

inline std::string to_string(LineType type) {
    switch (type) {
        case LineType::Liquid:    return "liquid";
        case LineType::Suction:   return "suction";
        case LineType::Discharge: return "discharge";
    }
    return "unknown";
}

// suction and discharge lines carry vapor
inline bool is_vapor_line(LineType type) {
    return type == LineType::Suction || type == LineType::Discharge;
}

} // namespace linesizer
