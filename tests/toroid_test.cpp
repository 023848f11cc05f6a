#include <gtest/gtest.h>
#include <cmath>
#include "../include/toroid.hpp"
#include "../include/errors.hpp"
#include "../include/constants.hpp"

class ToroidTest : public ::testing::Test {
protected:
    void SetUp() override {
        inductor.core = {DEFAULT_OD_MM, DEFAULT_ID_MM, DEFAULT_HT_MM};
        inductor.turns = DEFAULT_TURNS;
        inductor.shunt_capacitance = DEFAULT_CSHUNT_F;
    }

    ToroidInductor inductor;
};

TEST_F(ToroidTest, DefaultCoreIsValid) {
    EXPECT_NO_THROW(validate_inductor(inductor));
}

TEST_F(ToroidTest, CoreFactorOfFT240) {
    // 12.7 * log10(61 / 35.55)
    EXPECT_NEAR(core_factor(inductor.core), 2.978026, 1e-6);
}

TEST_F(ToroidTest, InductanceFactorScalesWithTurnsSquared) {
    double l12 = inductance_factor(inductor);
    EXPECT_NEAR(l12, FERRITE_K * 144.0 * core_factor(inductor.core), 1e-20);

    inductor.turns = 24;
    EXPECT_NEAR(inductance_factor(inductor), 4.0 * l12, 1e-9 * l12);
}

// Equal diameters collapse log10(OD/ID) to zero
TEST_F(ToroidTest, EqualDiametersAreRejected) {
    inductor.core.inner_diameter_mm = inductor.core.outer_diameter_mm;
    EXPECT_THROW(validate_core(inductor.core), NumericDomainError);
    EXPECT_THROW(validate_inductor(inductor), NumericDomainError);
}

TEST_F(ToroidTest, InvertedDiametersAreRejected) {
    inductor.core.outer_diameter_mm = 30.0;
    EXPECT_THROW(validate_core(inductor.core), NumericDomainError);
}

TEST_F(ToroidTest, NonPositiveDimensionsAreRejected) {
    CoreGeometry core = inductor.core;
    core.height_mm = 0.0;
    EXPECT_THROW(validate_core(core), NumericDomainError);

    core = inductor.core;
    core.inner_diameter_mm = -1.0;
    EXPECT_THROW(validate_core(core), NumericDomainError);

    core = inductor.core;
    core.outer_diameter_mm = std::nan("");
    EXPECT_THROW(validate_core(core), NumericDomainError);
}

TEST_F(ToroidTest, TurnsAndShuntAreChecked) {
    inductor.turns = 0;
    EXPECT_THROW(validate_inductor(inductor), NumericDomainError);

    inductor.turns = 1;
    inductor.shunt_capacitance = -1e-12;
    EXPECT_THROW(validate_inductor(inductor), NumericDomainError);

    inductor.shunt_capacitance = 0.0;
    EXPECT_NO_THROW(validate_inductor(inductor));
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
