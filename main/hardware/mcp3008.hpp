#ifndef MCP3008_HPP
#define MCP3008_HPP

#include <cstdint>
#include <driver/gpio.h>
#include <driver/spi_master.h>
#include <main/hardware/moisture_source.hpp>

// Microchip MCP3008 8-channel 10-bit ADC over SPI (mode 0).
// The bus and device are opened once in init() and reused for every read.
class Mcp3008 : public MoistureSource {
public:
    struct Config {
        spi_host_device_t host;     // SPI2_HOST / SPI3_HOST
        gpio_num_t        mosi;
        gpio_num_t        miso;
        gpio_num_t        sclk;
        gpio_num_t        cs;
        int               clock_hz;
        uint8_t           channel;  // single-ended input the probe is wired to (0..7)
    };

    explicit Mcp3008(const Config& cfg);
    ~Mcp3008() override;

    Mcp3008(const Mcp3008&) = delete;
    Mcp3008& operator=(const Mcp3008&) = delete;

    // Initialize SPI bus (shared if already up) and attach the device.
    bool init();

    // Blocking single-ended conversion of the configured channel.
    bool read(MoistureData& out_data) override;

    // Blocking single-ended conversion of any channel.
    bool readChannel(uint8_t channel, uint16_t& out_raw);

private:
    Config cfg;
    spi_device_handle_t device;
    bool owns_bus;
};

#endif // MCP3008_HPP
