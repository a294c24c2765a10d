#include "errors.hpp"
#include "processing/processing_step_factory.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include <variant>

using namespace ocdb;
using namespace ocdb::test_utils;

class ProcessingStepFactoryTest : public ::testing::Test {
  protected:
    ProcessingStepFactory factory_;
};

TEST_F(ProcessingStepFactoryTest, NoOptionsReturnIdentityStep) {
    auto const steps = factory_.get_processing_steps({});
    ASSERT_EQ(steps.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<IdentityStep>(steps[0]));
    EXPECT_EQ(step_name(steps[0]), "identity");
}

TEST_F(ProcessingStepFactoryTest, ValuesReturnInterpolation) {
    auto const steps = factory_.get_processing_steps(ProcessingOptions::at(13.5));
    ASSERT_EQ(steps.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<Interpolation>(steps[0]));
    EXPECT_EQ(std::get<Interpolation>(steps[0]).values(), std::vector<double>{ 13.5 });
    EXPECT_EQ(std::get<Interpolation>(steps[0]).kind(), InterpolationKind::Linear);

    auto const range_steps = factory_.get_processing_steps(ProcessingOptions::at(linspace(1.0, 2.0, 11)));
    ASSERT_EQ(range_steps.size(), 1u);
    EXPECT_EQ(std::get<Interpolation>(range_steps[0]).values().size(), 11u);
}

TEST_F(ProcessingStepFactoryTest, ValuesSetInterpolationKind) {
    auto options = ProcessingOptions::at(13.5);
    options.interpolation = InterpolationKind::None;
    auto const steps = factory_.get_processing_steps(options);
    ASSERT_EQ(steps.size(), 1u);
    EXPECT_EQ(std::get<Interpolation>(steps[0]).kind(), InterpolationKind::None);
}

TEST_F(ProcessingStepFactoryTest, InterpolationKindWithoutValuesIsIgnored) {
    ProcessingOptions options;
    options.interpolation = InterpolationKind::None;
    auto const steps = factory_.get_processing_steps(options);
    ASSERT_EQ(steps.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<IdentityStep>(steps[0]));
}

TEST_F(ProcessingStepFactoryTest, UnitReturnsUnitConversion) {
    auto const steps = factory_.get_processing_steps(ProcessingOptions().in_unit("eV"));
    ASSERT_EQ(steps.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<UnitConversion>(steps[0]));
    EXPECT_EQ(std::get<UnitConversion>(steps[0]).unit(), "eV");
    EXPECT_EQ(step_name(steps[0]), "unit conversion");
}

TEST_F(ProcessingStepFactoryTest, UnitConversionComesBeforeInterpolation) {
    auto const steps = factory_.get_processing_steps(ProcessingOptions::at(100.0).in_unit("eV"));
    ASSERT_EQ(steps.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<UnitConversion>(steps[0]));
    EXPECT_TRUE(std::holds_alternative<Interpolation>(steps[1]));
    EXPECT_EQ(step_name(steps[1]), "interpolation");
}

TEST_F(ProcessingStepFactoryTest, EmptyValuesThrowMissingInput) {
    EXPECT_THROW(factory_.get_processing_steps(ProcessingOptions::at(std::vector<double>{})), MissingInput);
}

TEST_F(ProcessingStepFactoryTest, NonFiniteValuesThrow) {
    EXPECT_THROW(factory_.get_processing_steps(ProcessingOptions::at(std::numeric_limits<double>::quiet_NaN())),
                 std::invalid_argument);
    EXPECT_THROW(factory_.get_processing_steps(ProcessingOptions::at(std::numeric_limits<double>::infinity())),
                 std::invalid_argument);
}

TEST(ProcessingOptionsTest, ScalarRequest) {
    EXPECT_FALSE(ProcessingOptions().scalar());
    EXPECT_TRUE(ProcessingOptions::at(13.5).scalar());
    EXPECT_FALSE(ProcessingOptions::at({ 13.5, 14.0 }).scalar());
}

TEST(ProcessingOptionsTest, InUnitKeepsValues) {
    auto const options = ProcessingOptions::at(13.5).in_unit("eV");
    ASSERT_TRUE(options.values.has_value());
    EXPECT_EQ(options.values->front(), 13.5);
    EXPECT_EQ(options.unit, "eV");
}

// ----- APPLYING STEPS ----- //

TEST(ProcessingStepTest, IdentityReturnsInputUnchanged) {
    Data const data = make_data_with_uncertainties();
    Data const result = process(ProcessingStep(IdentityStep{}), data);
    EXPECT_EQ(result.data, data.data);
    EXPECT_EQ(result.axes[0].values, data.axes[0].values);
    EXPECT_EQ(result.lower_bounds, data.lower_bounds);
}

TEST(ProcessingStepTest, StepsAreAppliedInOrder) {
    // Converting first lets the requested values refer to eV
    const std::vector<ProcessingStep> steps = { UnitConversion("eV"), Interpolation({ 100.0 }) };
    Data const result = process(steps, make_data_with_uncertainties());
    ASSERT_EQ(result.axes[0].values.size(), 1u);
    EXPECT_DOUBLE_EQ(result.axes[0].values[0], 100.0);
    EXPECT_EQ(result.axes[0].unit, "eV");
}

TEST(ProcessingStepTest, FailingStepAbortsPipeline) {
    const std::vector<ProcessingStep> steps = { Interpolation({ 100.0 }), UnitConversion("eV") };
    EXPECT_THROW(process(steps, make_data_with_uncertainties()), OutOfRange);
}
