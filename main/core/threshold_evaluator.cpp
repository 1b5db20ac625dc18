#include <main/core/threshold_evaluator.hpp>

namespace ThresholdEvaluator {
    SoilState evaluate(uint16_t raw, uint16_t threshold, SensorPolarity polarity) {
        if (polarity == SensorPolarity::HIGH_IS_DRY) {
            return (raw > threshold) ? SoilState::DRY : SoilState::WET;
        }
        return (raw < threshold) ? SoilState::DRY : SoilState::WET;
    }

    bool isDrying(uint16_t previous, uint16_t current, SensorPolarity polarity) {
        if (polarity == SensorPolarity::HIGH_IS_DRY) {
            return current > previous;
        }
        return current < previous;
    }
}
