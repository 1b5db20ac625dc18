#ifndef SOIL_STATE_HPP
#define SOIL_STATE_HPP

#include <cstdint>

// Binary soil condition derived from the latest reading
enum class SoilState : uint8_t {
    WET = 0,
    DRY = 1
};

// Which side of the threshold counts as dry. A reading equal to the
// threshold is WET under both polarities.
enum class SensorPolarity : uint8_t {
    LOW_IS_DRY  = 0,   // raw <  threshold -> DRY
    HIGH_IS_DRY = 1    // raw >  threshold -> DRY
};

// Repeat suppression for DRY notifications
enum class NotifyPolicy : uint8_t {
    ON_TRANSITION     = 0,  // mail once when entering DRY
    EVERY_DRY_READING = 1   // mail on every DRY evaluation
};

inline const char* soilStateName(SoilState state) {
    return state == SoilState::DRY ? "DRY" : "WET";
}

inline const char* polarityName(SensorPolarity polarity) {
    return polarity == SensorPolarity::HIGH_IS_DRY ? "high-is-dry" : "low-is-dry";
}

inline const char* notifyPolicyName(NotifyPolicy policy) {
    return policy == NotifyPolicy::EVERY_DRY_READING ? "every-dry-reading" : "on-transition";
}

#endif // SOIL_STATE_HPP
