#ifndef MOISTURE_DATA_HPP
#define MOISTURE_DATA_HPP

#include <cstdint>

// Fixed-size soil moisture sample
struct MoistureData {
    uint16_t  moisture_raw;     // raw ADC reading (0..1023 on a 10-bit converter)
    uint8_t   channel;          // ADC channel the probe is wired to
    uint32_t  ts_ms;            // sample timestamp in milliseconds
};

#endif // MOISTURE_DATA_HPP
