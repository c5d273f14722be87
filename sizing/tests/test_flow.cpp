#include <gtest/gtest.h>
#include <cmath>
#include <string>
#include <vector>
#include <Kokkos_Core.hpp>

#include "flow.hpp"
#include "refrigerants.hpp"
#include "sizing_input.hpp"
#include "tube_catalog.hpp"

using namespace linesizer;

namespace {

SizingInput make_input(const std::string& refrigerant, LineType line_type, double capacity,
                       double length, double rise) {
    SizingInput input;
    input.refrigerant = refrigerant;
    input.line_type = line_type;
    input.capacity = capacity;
    input.equivalent_length = length;
    input.vertical_rise = rise;
    return input;
}

FlowState state_with_velocity(double velocity_m_s) {
    FlowState state{};
    state.velocity_m_s = velocity_m_s;
    state.velocity_ft_min = velocity_m_s / M_PER_FT * S_PER_MIN;
    return state;
}

} // namespace

TEST(FlowTest, FrictionFactorBranches) {
    EXPECT_DOUBLE_EQ(friction_factor(0.0), 0.0);
    EXPECT_DOUBLE_EQ(friction_factor(-10.0), 0.0);
    EXPECT_DOUBLE_EQ(friction_factor(1000.0), 64.0 / 1000.0);

    // switch by threshold, no interpolation
    EXPECT_DOUBLE_EQ(friction_factor(2299.0), 64.0 / 2299.0);
    EXPECT_DOUBLE_EQ(friction_factor(2300.0), 0.3164 * std::pow(2300.0, -0.25));
    EXPECT_DOUBLE_EQ(friction_factor(1.0e5), 0.3164 * std::pow(1.0e5, -0.25));
}

TEST(FlowTest, TemperatureLossFactor) {
    EXPECT_DOUBLE_EQ(temperature_loss_factor(true), 1.0);
    EXPECT_DOUBLE_EQ(temperature_loss_factor(false), 0.5);
}

TEST(FlowTest, MassFlow) {
    double m_dot = compute_mass_flow(60000.0, lookup_refrigerant("R134a"));
    EXPECT_NEAR(m_dot, (60000.0 / 3600.0) / 70.0, 1e-12);
    EXPECT_NEAR(m_dot, 0.2381, 1e-4);

    RefrigerantProperties broken{"RX", 0.3, 70.0, 2.5e-5, 0.0};
    EXPECT_THROW(compute_mass_flow(60000.0, broken), InvalidRefrigeratingEffect);
    broken.refrigerating_effect = -5.0;
    EXPECT_THROW(compute_mass_flow(60000.0, broken), InvalidRefrigeratingEffect);
}

TEST(FlowTest, SolveFlowGeometry) {
    // 1 lbm/s of 1 lbm/ft^3 through a 12 in bore: v = 1 / (pi/4) ft/s
    FlowState state = solve_flow(1.0, 1.0, 1.0e-5, 12.0, 100.0, 1.0);
    EXPECT_NEAR(state.velocity_ft_s, 4.0 / PI, 1e-12);
    EXPECT_NEAR(state.velocity_ft_min, 240.0 / PI, 1e-10);
    EXPECT_NEAR(state.velocity_m_s, 4.0 / PI * 0.3048, 1e-12);
    EXPECT_NEAR(state.reynolds, (4.0 / PI) / 1.0e-5, 1e-6);

    double f = 0.3164 * std::pow(state.reynolds, -0.25);
    double dp = f * 100.0 * state.velocity_ft_s * state.velocity_ft_s / (2.0 * 32.174) / 144.0;
    EXPECT_NEAR(state.pressure_drop_psi, dp, 1e-12);
    EXPECT_NEAR(state.temperature_loss, dp, 1e-12);
}

TEST(FlowTest, DegenerateInputs) {
    // zero bore gives zero velocity instead of a division by zero
    FlowState no_area = solve_flow(1.0, 1.0, 1.0e-5, 0.0, 10.0, 1.0);
    EXPECT_DOUBLE_EQ(no_area.velocity_ft_s, 0.0);
    EXPECT_DOUBLE_EQ(no_area.reynolds, 0.0);
    EXPECT_DOUBLE_EQ(no_area.pressure_drop_psi, 0.0);

    // zero viscosity gives Re = 0 and no friction
    FlowState no_mu = solve_flow(1.0, 1.0, 0.0, 1.0, 10.0, 1.0);
    EXPECT_GT(no_mu.velocity_ft_s, 0.0);
    EXPECT_DOUBLE_EQ(no_mu.reynolds, 0.0);
    EXPECT_DOUBLE_EQ(no_mu.friction_factor, 0.0);
}

TEST(FlowTest, EquivalentLengthFloor) {
    const Tube& tube = list_copper_tubes()[5];

    TubeEvaluation floor = evaluate_tube(make_input("R22", LineType::Suction, 24000.0, 0.01, 0.0), tube);
    TubeEvaluation zero = evaluate_tube(make_input("R22", LineType::Suction, 24000.0, 0.0, 0.0), tube);
    TubeEvaluation negative = evaluate_tube(make_input("R22", LineType::Suction, 24000.0, -25.0, 0.0), tube);

    EXPECT_GT(zero.pressure_drop_psi, 0.0);
    EXPECT_DOUBLE_EQ(zero.pressure_drop_psi, floor.pressure_drop_psi);
    EXPECT_DOUBLE_EQ(negative.pressure_drop_psi, floor.pressure_drop_psi);
    EXPECT_TRUE(std::isfinite(negative.temperature_loss));
}

TEST(FlowTest, CapacityMonotonicity) {
    const Tube& tube = list_copper_tubes()[8];
    double previous_velocity = 0.0;
    double previous_reynolds = 0.0;

    for (double capacity : {6000.0, 12000.0, 36000.0, 60000.0, 120000.0}) {
        TubeEvaluation ev = evaluate_tube(make_input("R410A", LineType::Suction, capacity, 40.0, 0.0), tube);
        EXPECT_GT(ev.velocity_ft_min, previous_velocity) << capacity;
        EXPECT_GT(ev.reynolds, previous_reynolds) << capacity;
        previous_velocity = ev.velocity_ft_min;
        previous_reynolds = ev.reynolds;
    }
}

TEST(FlowTest, LiquidLineScenarioTube) {
    // R134a liquid, 60000 BTU/h, 50 ft through the 1/2" tube
    const Tube& tube = list_copper_tubes()[2];
    ASSERT_EQ(tube.nominal, "1/2");

    TubeEvaluation ev = evaluate_tube(make_input("R134a", LineType::Liquid, 60000.0, 50.0, 0.0), tube);
    EXPECT_NEAR(ev.velocity_ft_min, 182.87, 0.01);
    EXPECT_NEAR(ev.reynolds, 332976.0, 1.0);
    EXPECT_NEAR(ev.pressure_drop_psi, 1.35965, 1e-4);
    EXPECT_NEAR(ev.temperature_loss, 0.5 * ev.pressure_drop_psi, 1e-12);
    EXPECT_TRUE(ev.warnings.empty());
}

TEST(FlowTest, SuctionUsesFullTemperatureFactor) {
    const Tube& tube = list_copper_tubes()[10];
    TubeEvaluation suction = evaluate_tube(make_input("R22", LineType::Suction, 36000.0, 30.0, 0.0), tube);
    TubeEvaluation discharge = evaluate_tube(make_input("R22", LineType::Discharge, 36000.0, 30.0, 0.0), tube);

    // same vapor density, so the same hydraulics
    EXPECT_DOUBLE_EQ(suction.pressure_drop_psi, discharge.pressure_drop_psi);
    EXPECT_DOUBLE_EQ(suction.temperature_loss, suction.pressure_drop_psi);
    EXPECT_DOUBLE_EQ(discharge.temperature_loss, 0.5 * discharge.pressure_drop_psi);
}

TEST(FlowTest, UnsupportedRefrigerantPropagates) {
    const Tube& tube = list_copper_tubes()[0];
    EXPECT_THROW(evaluate_tube(make_input("R999", LineType::Liquid, 1000.0, 10.0, 0.0), tube),
                 UnsupportedRefrigerant);
}

TEST(WarningsTest, RiserBands) {
    SizingInput riser = make_input("R134a", LineType::Suction, 1.0, 1.0, 3.0);

    std::vector<std::string> slow = flow_warnings(riser, state_with_velocity(7.9));
    ASSERT_EQ(slow.size(), 1);
    EXPECT_NE(slow[0].find("oil return"), std::string::npos);

    EXPECT_TRUE(flow_warnings(riser, state_with_velocity(8.0)).empty());
    EXPECT_TRUE(flow_warnings(riser, state_with_velocity(12.0)).empty());

    std::vector<std::string> fast = flow_warnings(riser, state_with_velocity(12.5));
    ASSERT_EQ(fast.size(), 1);
    EXPECT_NE(fast[0].find("noise"), std::string::npos);
}

TEST(WarningsTest, HorizontalBandSharedByDischarge) {
    for (LineType type : {LineType::Suction, LineType::Discharge}) {
        SizingInput horizontal = make_input("R22", type, 1.0, 1.0, 0.0);

        std::vector<std::string> slow = flow_warnings(horizontal, state_with_velocity(3.9));
        ASSERT_EQ(slow.size(), 1);
        EXPECT_NE(slow[0].find("insufficient oil return"), std::string::npos);

        // no upper bound on horizontal runs
        EXPECT_TRUE(flow_warnings(horizontal, state_with_velocity(4.0)).empty());
        EXPECT_TRUE(flow_warnings(horizontal, state_with_velocity(40.0)).empty());
    }
}

TEST(WarningsTest, LiquidLine) {
    SizingInput liquid = make_input("R22", LineType::Liquid, 1.0, 1.0, 5.0);

    FlowState state{};
    state.velocity_ft_min = 300.0;
    state.velocity_m_s = 300.0 / 60.0 * 0.3048;
    EXPECT_TRUE(flow_warnings(liquid, state).empty());

    state.velocity_ft_min = 300.5;
    std::vector<std::string> warnings = flow_warnings(liquid, state);
    ASSERT_EQ(warnings.size(), 1);
    EXPECT_NE(warnings[0].find("flash gas"), std::string::npos);
}

TEST(WarningsTest, CustomCriteria) {
    DesignCriteria criteria;
    criteria.horizontal_min_velocity = 6.0;
    SizingInput horizontal = make_input("R22", LineType::Suction, 1.0, 1.0, 0.0);

    std::vector<std::string> warnings = flow_warnings(horizontal, state_with_velocity(5.0), criteria);
    ASSERT_EQ(warnings.size(), 1);
    EXPECT_NE(warnings[0].find("below 6 m/s"), std::string::npos);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    Kokkos::initialize(argc, argv);
    int result = RUN_ALL_TESTS();
    Kokkos::finalize();
    return result;
}
