#include "axis.hpp"
#include <gtest/gtest.h>

using ocdb::Axis;

TEST(AxisTest, DefaultConstructedAxisIsEmpty) {
    Axis const axis;
    EXPECT_TRUE(axis.values.empty());
    EXPECT_EQ(axis.quantity, "");
    EXPECT_EQ(axis.symbol, "");
    EXPECT_EQ(axis.unit, "");
    EXPECT_EQ(axis.get_label(), "");
}

TEST(AxisTest, LabelPrefersSymbolOverQuantity) {
    Axis axis;
    axis.quantity = "wavelength";
    axis.symbol = "\\lambda";
    EXPECT_EQ(axis.get_label(), "$\\lambda$");
}

TEST(AxisTest, LabelFallsBackToQuantity) {
    Axis axis;
    axis.quantity = "wavelength";
    EXPECT_EQ(axis.get_label(), "wavelength");

    axis.unit = "nm";
    EXPECT_EQ(axis.get_label(), "wavelength / nm");
}

TEST(AxisTest, LabelAppendsUnit) {
    Axis axis;
    axis.quantity = "wavelength";
    axis.symbol = "\\lambda";
    axis.unit = "nm";
    EXPECT_EQ(axis.get_label(), "$\\lambda$ / nm");
}

TEST(AxisTest, DimensionlessQuantityHasNoUnitInLabel) {
    Axis axis;
    axis.quantity = "dispersion coefficient";
    axis.symbol = "n";
    EXPECT_EQ(axis.get_label(), "$n$");
}
