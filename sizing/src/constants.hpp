#ifndef LINESIZER_CONSTANTS_HPP
#define LINESIZER_CONSTANTS_HPP

namespace linesizer {

// Mathematical constants
constexpr double PI = 3.14159265358979323846;

// Physical constants
constexpr double GC = 32.174;                       // gravitational conversion [lbm*ft/(lbf*s^2)]

// Conversion factors
constexpr double MM_PER_IN = 25.4;                  // [in] -> [mm]
constexpr double IN_PER_FT = 12.0;                  // [ft] -> [in]
constexpr double IN2_PER_FT2 = 144.0;               // [ft^2] -> [in^2]
constexpr double S_PER_H = 3600.0;                  // [h] -> [s]
constexpr double S_PER_MIN = 60.0;                  // [min] -> [s]
constexpr double M_PER_FT = 0.3048;                 // [ft] -> [m]

// Flow regime
constexpr double RE_TRANSITION = 2300.0;            // laminar/turbulent switch
constexpr double LAMINAR_COEFF = 64.0;              // f = 64/Re
constexpr double BLASIUS_COEFF = 0.3164;            // f = 0.3164 Re^-0.25
constexpr double BLASIUS_EXP = -0.25;

// Numerical floors
constexpr double MIN_EQUIVALENT_LENGTH = 0.01;      // [ft]

// Pressure drop to saturation temperature loss [F/psi]
constexpr double SUCTION_DT_PER_PSI = 1.0;
constexpr double OTHER_DT_PER_PSI = 0.5;

// Default design criteria
constexpr double MAX_DT_LIQUID = 1.0;               // [F]
constexpr double MAX_DT_VAPOR = 2.0;                // [F], suction and discharge
constexpr double RISER_MIN_VELOCITY = 8.0;          // [m/s]
constexpr double RISER_MAX_VELOCITY = 12.0;         // [m/s]
constexpr double HORIZONTAL_MIN_VELOCITY = 4.0;     // [m/s]
constexpr double LIQUID_MAX_VELOCITY = 300.0;       // [ft/min]

} // namespace linesizer

#endif // LINESIZER_CONSTANTS_HPP
