#ifndef MOISTURE_SOURCE_HPP
#define MOISTURE_SOURCE_HPP

#include <main/models/moisture_data.hpp>

// Raw moisture reader. Implementations open their hardware once and reuse it.
class MoistureSource {
public:
    virtual ~MoistureSource() = default;

    // Single synchronous conversion. Fills moisture_raw and channel;
    // returns false if the device cannot be reached.
    virtual bool read(MoistureData& out_data) = 0;
};

#endif // MOISTURE_SOURCE_HPP
