#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "../include/fileio.hpp"
#include "../include/plot.hpp"
#include "../include/print_utils.hpp"
#include "../include/material_table.hpp"
#include "../include/impedance.hpp"

// Test fixture: three samples on an FT-240 core
class OutputTest : public ::testing::Test {
protected:
    void SetUp() override {
        inductor.core = {61.0, 35.55, 12.7};
        inductor.turns = 12;
        inductor.shunt_capacitance = 0.65e-12;

        material.frequency = {1e6, 10e6, 60e6};
        material.mu_prime = {1000.0, 400.0, 20.0};
        material.mu_double_prime = {50.0, 600.0, 200.0};

        curve = compute_impedance_curve(material, inductor);
    }

    static std::vector<std::string> read_lines(const std::string& path) {
        std::ifstream in(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    ToroidInductor inductor;
    MaterialTable material;
    ImpedanceCurve curve;
};

TEST_F(OutputTest, CsvHasHeaderAndOneRowPerSample) {
    std::string path = testing::TempDir() + "output_test_impedance.csv";
    write_impedance_csv(path, material, curve);

    std::vector<std::string> lines = read_lines(path);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "frequency_Hz,mu_prime,mu_double_prime,Re_ZL,Im_ZL,Re_Z,Im_Z,abs_Z,phase_deg");

    // Second row reads back to the computed values
    std::stringstream ss(lines[2]);
    std::string field;
    std::vector<double> values;
    while (std::getline(ss, field, ',')) {
        values.push_back(std::stod(field));
    }
    ASSERT_EQ(values.size(), 9u);
    EXPECT_NEAR(values[0], 10e6, 1e-3);
    EXPECT_NEAR(values[1], 400.0, 1e-6);
    EXPECT_NEAR(values[3], curve.inductor[1].real(), 1e-8 * std::abs(curve.inductor[1]));
    EXPECT_NEAR(values[6], curve.total[1].imag(), 1e-8 * std::abs(curve.total[1]));
    EXPECT_NEAR(values[7], std::abs(curve.total[1]), 1e-8 * std::abs(curve.total[1]));
    std::remove(path.c_str());
}

TEST_F(OutputTest, CsvLengthMismatchIsRejected) {
    material.frequency.pop_back();
    EXPECT_THROW(write_impedance_csv(testing::TempDir() + "never.csv", material, curve), std::runtime_error);
}

TEST_F(OutputTest, CsvToMissingDirectoryFails) {
    EXPECT_THROW(write_impedance_csv("/nonexistent_dir_for_test/out.csv", material, curve), std::runtime_error);
}

TEST_F(OutputTest, GnuplotScriptHasFourPanels) {
    PlotSpec spec;
    spec.data_file = "out/mix31_impedance.csv";
    spec.image_file = "out/mix31_impedance.png";
    spec.label = "12 tight turns on FT-240 Mix 31 Core";
    spec.inductor = inductor;

    std::ostringstream out;
    write_gnuplot_script(out, spec);
    std::string script = out.str();

    EXPECT_NE(script.find("set output \"out/mix31_impedance.png\""), std::string::npos);
    EXPECT_NE(script.find("set multiplot layout 2,2"), std::string::npos);
    EXPECT_NE(script.find("Calculated Impedance of\\n12 tight turns on FT-240 Mix 31 Core"), std::string::npos);
    EXPECT_NE(script.find("(shunt capacitance = 0.65 pF)"), std::string::npos);
    EXPECT_NE(script.find("N = 12, OD = 61 mm, ID = 35.55 mm, HT = 12.7 mm"), std::string::npos);
    EXPECT_NE(script.find("set xlabel \"MHz\""), std::string::npos);

    // |Z|, R, phase, X in layout order
    size_t mag = script.find("Impedance Magnitude (|Z|)");
    size_t res = script.find("\"Resistance\"");
    size_t phase = script.find("\"Impedance Phase\"");
    size_t react = script.find("\"Reactance\"");
    ASSERT_NE(mag, std::string::npos);
    ASSERT_NE(res, std::string::npos);
    ASSERT_NE(phase, std::string::npos);
    ASSERT_NE(react, std::string::npos);
    EXPECT_LT(mag, res);
    EXPECT_LT(res, phase);
    EXPECT_LT(phase, react);

    size_t plots = 0;
    for (size_t pos = script.find("\nplot "); pos != std::string::npos; pos = script.find("\nplot ", pos + 1)) {
        ++plots;
    }
    EXPECT_EQ(plots, 4u);
    EXPECT_NE(script.find("using ($1*1e-6):8"), std::string::npos);
    EXPECT_NE(script.find("using ($1*1e-6):9"), std::string::npos);

    // Header row is consumed as column names, never as a data point or a skipped sample
    EXPECT_NE(script.find("set datafile columnheaders"), std::string::npos);
    EXPECT_EQ(script.find("every"), std::string::npos);
    EXPECT_EQ(script.find("skip"), std::string::npos);
}

TEST_F(OutputTest, LabelQuotesAreEscaped) {
    PlotSpec spec;
    spec.data_file = "a.csv";
    spec.image_file = "a.png";
    spec.label = "12 \"tight\" turns";
    spec.inductor = inductor;

    std::ostringstream out;
    write_gnuplot_script(out, spec);
    EXPECT_NE(out.str().find("12 \\\"tight\\\" turns"), std::string::npos);
}

TEST_F(OutputTest, PicofaradFormatting) {
    EXPECT_EQ(format_picofarads(0.65e-12), "0.65");
    EXPECT_EQ(format_picofarads(0.0), "0");
    EXPECT_EQ(format_picofarads(12e-12), "12");
}

TEST_F(OutputTest, FilenameWithoutExtension) {
    EXPECT_EQ(get_filename_without_ext("data/31-Material-Fair-Rite_1MHz-60MHz.csv"), "31-Material-Fair-Rite_1MHz-60MHz");
    EXPECT_EQ(get_filename_without_ext("..\\Excel\\mix.csv"), "mix");
    EXPECT_EQ(get_filename_without_ext("table"), "table");
}

TEST_F(OutputTest, CreateDirectoryIsIdempotent) {
    std::string dir = testing::TempDir() + "output_test_dir";
    EXPECT_TRUE(create_directory(dir));
    EXPECT_TRUE(create_directory(dir));
    std::remove(dir.c_str());
}

TEST_F(OutputTest, ImpedanceTableAndSummary) {
    std::ostringstream out;
    print_impedance_table(out, "Impedance", curve, 2);
    std::string table = out.str();
    EXPECT_NE(table.find("Impedance:"), std::string::npos);
    EXPECT_NE(table.find("f [MHz]"), std::string::npos);
    // Stride of 2 prints samples 0 and 2
    EXPECT_NE(table.find("1.000"), std::string::npos);
    EXPECT_NE(table.find("60.000"), std::string::npos);
    EXPECT_EQ(table.find("10.000"), std::string::npos);

    std::ostringstream summary;
    print_impedance_summary(summary, curve);
    EXPECT_NE(summary.str().find("Inductance at 1 MHz"), std::string::npos);
    EXPECT_NE(summary.str().find("Self-resonant frequency"), std::string::npos);
}

TEST_F(OutputTest, ComplexValueFormatting) {
    std::ostringstream out;
    print_complex_value(out, std::complex<double>(1.5, -2.0));
    out << " ";
    print_complex_value(out, std::complex<double>(0.0, 3.0));
    out << " ";
    print_complex_value(out, std::complex<double>(4.0, 0.0));
    EXPECT_EQ(out.str(), "1.5-2j 3j 4");
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
