#include <main/hardware/mcp3008.hpp>
#include <main/utils/logger.hpp>
#include <esp_err.h>
#include <cstring>

static const char* TAG = "MCP3008";

Mcp3008::Mcp3008(const Config& cfg_in)
    : cfg(cfg_in), device(nullptr), owns_bus(false) {}

Mcp3008::~Mcp3008() {
    if (device != nullptr) {
        (void)spi_bus_remove_device(device);
        device = nullptr;
    }
    if (owns_bus) {
        (void)spi_bus_free(cfg.host);
        owns_bus = false;
    }
}

bool Mcp3008::init() {
    if (device != nullptr) {
        return true;
    }
    if (cfg.channel > 7) {
        LOG_ERROR(TAG, "Invalid channel %u", static_cast<unsigned>(cfg.channel));
        return false;
    }

    spi_bus_config_t bus_cfg = {};
    bus_cfg.mosi_io_num = cfg.mosi;
    bus_cfg.miso_io_num = cfg.miso;
    bus_cfg.sclk_io_num = cfg.sclk;
    bus_cfg.quadwp_io_num = -1;
    bus_cfg.quadhd_io_num = -1;
    bus_cfg.max_transfer_sz = 0;

    esp_err_t err = spi_bus_initialize(cfg.host, &bus_cfg, SPI_DMA_DISABLED);
    if (err == ESP_OK) {
        owns_bus = true;
    } else if (err != ESP_ERR_INVALID_STATE) {
        // INVALID_STATE: bus already initialized by someone else, share it
        LOG_ERROR(TAG, "spi_bus_initialize failed: %d", static_cast<int>(err));
        return false;
    }

    spi_device_interface_config_t dev_cfg = {};
    dev_cfg.mode = 0;
    dev_cfg.clock_speed_hz = cfg.clock_hz;
    dev_cfg.spics_io_num = cfg.cs;
    dev_cfg.queue_size = 1;

    err = spi_bus_add_device(cfg.host, &dev_cfg, &device);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "spi_bus_add_device failed: %d", static_cast<int>(err));
        device = nullptr;
        if (owns_bus) {
            (void)spi_bus_free(cfg.host);
            owns_bus = false;
        }
        return false;
    }

    LOG_INFO(TAG, "Ready on SPI host %d, channel %u, %d Hz",
             static_cast<int>(cfg.host), static_cast<unsigned>(cfg.channel), cfg.clock_hz);
    return true;
}

bool Mcp3008::readChannel(uint8_t channel, uint16_t& out_raw) {
    if (device == nullptr || channel > 7) {
        return false;
    }
    // Start bit, then SGL=1 + channel in the high nibble, then 8 clocks for data
    spi_transaction_t t = {};
    t.flags = SPI_TRANS_USE_TXDATA | SPI_TRANS_USE_RXDATA;
    t.length = 24;
    t.tx_data[0] = 0x01;
    t.tx_data[1] = static_cast<uint8_t>(0x80 | (channel << 4));
    t.tx_data[2] = 0x00;

    esp_err_t err = spi_device_polling_transmit(device, &t);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "SPI transaction failed: %d", static_cast<int>(err));
        return false;
    }
    out_raw = static_cast<uint16_t>(((t.rx_data[1] & 0x03) << 8) | t.rx_data[2]);
    return true;
}

bool Mcp3008::read(MoistureData& out_data) {
    uint16_t raw = 0;
    if (!readChannel(cfg.channel, raw)) {
        return false;
    }
    out_data.moisture_raw = raw;
    out_data.channel = cfg.channel;
    out_data.ts_ms = 0;     // stamped by MoistureMonitor::pollOnce
    return true;
}
