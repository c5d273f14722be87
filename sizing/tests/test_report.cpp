#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <Kokkos_Core.hpp>

#include "report.hpp"

using namespace linesizer;

namespace {

SizingInput liquid_input() {
    SizingInput input;
    input.refrigerant = "R134a";
    input.line_type = LineType::Liquid;
    input.capacity = 60000.0;
    input.equivalent_length = 50.0;
    return input;
}

size_t count_lines(const std::string& text) {
    size_t n = 0;
    for (char c : text) {
        if (c == '\n') ++n;
    }
    return n;
}

} // namespace

TEST(ReportTest, InputEcho) {
    std::ostringstream os;
    print_input(os, liquid_input());
    std::string text = os.str();

    EXPECT_NE(text.find("R134a"), std::string::npos);
    EXPECT_NE(text.find("liquid"), std::string::npos);
    EXPECT_NE(text.find("60000.0 BTU/h"), std::string::npos);
    EXPECT_NE(text.find("50.0 ft"), std::string::npos);
}

TEST(ReportTest, TableMarksSelectedRow) {
    SizingResult result = std::get<SizingResult>(size_line(liquid_input()));
    ASSERT_TRUE(result.selected.has_value());

    std::ostringstream os;
    print_results_table(os, result);
    std::string text = os.str();

    // two header lines, one row per tube, blank line
    EXPECT_EQ(count_lines(text), result.evaluations.size() + 3);

    std::istringstream lines(text);
    std::string line;
    size_t marked = 0;
    std::string marked_line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line[1] == '*') {
            ++marked;
            marked_line = line;
        }
    }
    EXPECT_EQ(marked, 1);
    EXPECT_NE(marked_line.find("1/2"), std::string::npos);
}

TEST(ReportTest, SelectionWithWarnings) {
    SizingResult result;
    TubeEvaluation ev;
    ev.tube = list_copper_tubes()[5];
    ev.velocity_m_s = 13.0;
    ev.warnings.push_back("High velocity in riser (above 12 m/s), possible noise.");
    result.evaluations.push_back(ev);
    result.selected = 0;

    std::ostringstream os;
    print_selection(os, result, LineType::Suction);
    std::string text = os.str();

    EXPECT_NE(text.find("Selected tube: " + ev.tube.nominal), std::string::npos);
    EXPECT_NE(text.find("Warnings:"), std::string::npos);
    EXPECT_NE(text.find("noise"), std::string::npos);
    EXPECT_NE(text.find("double riser"), std::string::npos);
    EXPECT_EQ(text.find("No basic velocity"), std::string::npos);
}

TEST(ReportTest, SelectionWithoutWarnings) {
    SizingResult result = std::get<SizingResult>(size_line(liquid_input()));
    ASSERT_TRUE(result.selected_evaluation() != nullptr);
    ASSERT_TRUE(result.selected_evaluation()->warnings.empty());

    std::ostringstream os;
    print_selection(os, result, LineType::Liquid);
    std::string text = os.str();

    EXPECT_NE(text.find("Selected tube: 1/2"), std::string::npos);
    EXPECT_NE(text.find("No basic velocity or temperature loss warnings"), std::string::npos);
    EXPECT_NE(text.find("subcooling"), std::string::npos);
}

TEST(ReportTest, DischargeHasNoLineNote) {
    SizingResult result;
    TubeEvaluation ev;
    ev.tube = list_copper_tubes()[6];
    result.evaluations.push_back(ev);
    result.selected = 0;

    std::ostringstream os;
    print_selection(os, result, LineType::Discharge);
    std::string text = os.str();

    EXPECT_EQ(text.find("subcooling"), std::string::npos);
    EXPECT_EQ(text.find("double riser"), std::string::npos);
}

TEST(ReportTest, NoFitAdvisory) {
    SizingResult result;
    result.evaluations.resize(3);

    std::ostringstream os;
    print_selection(os, result, LineType::Suction);
    EXPECT_NE(os.str().find("No standard size meets both the temperature loss and velocity criteria"),
              std::string::npos);
    EXPECT_EQ(os.str().find("Selected tube"), std::string::npos);
}

TEST(ReportTest, ErrorLine) {
    SizingError error{SizingErrorKind::UnsupportedRefrigerant, "Unsupported refrigerant: R999"};

    std::ostringstream os;
    print_error(os, error);
    EXPECT_EQ(os.str(), "Error: Unsupported refrigerant: R999 [" + to_string(error.kind) + "]\n");
}

TEST(ReportTest, CallerStreamFormatRestored) {
    SizingInput input = liquid_input();
    SizingResult result = std::get<SizingResult>(size_line(input));
    double mass_flow = 6000.0 / 3600.0 / 75.0;

    std::ostringstream expected;
    expected << "Mass flow: " << mass_flow << " lb/s";

    std::ostringstream os;
    print_input(os, input);
    print_results_table(os, result);
    print_selection(os, result, input.line_type);
    std::ios::fmtflags flags = os.flags();
    std::streamsize precision = os.precision();

    os.str("");
    os << "Mass flow: " << mass_flow << " lb/s";
    EXPECT_EQ(os.str(), expected.str());
    EXPECT_EQ(os.str(), "Mass flow: 0.0222222 lb/s");
    EXPECT_EQ(flags, expected.flags());
    EXPECT_EQ(precision, expected.precision());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    Kokkos::initialize(argc, argv);
    int result = RUN_ALL_TESTS();
    Kokkos::finalize();
    return result;
}
