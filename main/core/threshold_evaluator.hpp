#ifndef THRESHOLD_EVALUATOR_HPP
#define THRESHOLD_EVALUATOR_HPP

#include <cstdint>
#include <main/models/soil_state.hpp>

namespace ThresholdEvaluator {
    // Classify a raw reading against the dry threshold. Pure function.
    // LOW_IS_DRY:  raw <  threshold -> DRY, otherwise WET
    // HIGH_IS_DRY: raw >  threshold -> DRY, otherwise WET
    SoilState evaluate(uint16_t raw, uint16_t threshold, SensorPolarity polarity);

    // True if moving from 'previous' to 'current' heads toward dry
    bool isDrying(uint16_t previous, uint16_t current, SensorPolarity polarity);
}

#endif // THRESHOLD_EVALUATOR_HPP
