#include <gtest/gtest.h>
#include <main/core/threshold_evaluator.hpp>

TEST(ThresholdEvaluatorTest, LowIsDryBelowThresholdIsDry) {
    EXPECT_EQ(SoilState::DRY, ThresholdEvaluator::evaluate(0, 450, SensorPolarity::LOW_IS_DRY));
    EXPECT_EQ(SoilState::DRY, ThresholdEvaluator::evaluate(300, 450, SensorPolarity::LOW_IS_DRY));
    EXPECT_EQ(SoilState::DRY, ThresholdEvaluator::evaluate(449, 450, SensorPolarity::LOW_IS_DRY));
}

TEST(ThresholdEvaluatorTest, LowIsDryAtOrAboveThresholdIsWet) {
    EXPECT_EQ(SoilState::WET, ThresholdEvaluator::evaluate(450, 450, SensorPolarity::LOW_IS_DRY));
    EXPECT_EQ(SoilState::WET, ThresholdEvaluator::evaluate(451, 450, SensorPolarity::LOW_IS_DRY));
    EXPECT_EQ(SoilState::WET, ThresholdEvaluator::evaluate(1023, 450, SensorPolarity::LOW_IS_DRY));
}

TEST(ThresholdEvaluatorTest, HighIsDryAboveThresholdIsDry) {
    EXPECT_EQ(SoilState::DRY, ThresholdEvaluator::evaluate(851, 850, SensorPolarity::HIGH_IS_DRY));
    EXPECT_EQ(SoilState::DRY, ThresholdEvaluator::evaluate(1023, 850, SensorPolarity::HIGH_IS_DRY));
}

TEST(ThresholdEvaluatorTest, HighIsDryAtOrBelowThresholdIsWet) {
    EXPECT_EQ(SoilState::WET, ThresholdEvaluator::evaluate(850, 850, SensorPolarity::HIGH_IS_DRY));
    EXPECT_EQ(SoilState::WET, ThresholdEvaluator::evaluate(497, 850, SensorPolarity::HIGH_IS_DRY));
    EXPECT_EQ(SoilState::WET, ThresholdEvaluator::evaluate(0, 850, SensorPolarity::HIGH_IS_DRY));
}

TEST(ThresholdEvaluatorTest, SameInputAlwaysGivesSameState) {
    for (uint16_t raw = 0; raw <= 1023; raw += 31) {
        SoilState first = ThresholdEvaluator::evaluate(raw, 450, SensorPolarity::LOW_IS_DRY);
        for (int i = 0; i < 3; ++i) {
            EXPECT_EQ(first, ThresholdEvaluator::evaluate(raw, 450, SensorPolarity::LOW_IS_DRY));
        }
    }
}

TEST(ThresholdEvaluatorTest, DryingDirectionFollowsPolarity) {
    EXPECT_TRUE(ThresholdEvaluator::isDrying(600, 500, SensorPolarity::LOW_IS_DRY));
    EXPECT_FALSE(ThresholdEvaluator::isDrying(500, 600, SensorPolarity::LOW_IS_DRY));
    EXPECT_TRUE(ThresholdEvaluator::isDrying(500, 600, SensorPolarity::HIGH_IS_DRY));
    EXPECT_FALSE(ThresholdEvaluator::isDrying(600, 500, SensorPolarity::HIGH_IS_DRY));
}
