#pragma once

#include <cstddef>
#include <cstdint>
#include "byte_sink.hpp"
#include "driver_config.hpp"
#include "spi_bus.hpp"

namespace unicorn {

// Unicorn HAT HD on a Pico SPI peripheral. The whole frame goes out under a
// single chip-select assertion, by DMA when a channel is available.
class SpiSink : public ByteSink {
public:
    explicit SpiSink(const SpiConfig& config);
    ~SpiSink() override;

    SpiSink(const SpiSink&) = delete;
    SpiSink& operator=(const SpiSink&) = delete;

    Status open() override;
    Status write(const uint8_t* data, size_t len) override;

private:
    void cs_select();
    void cs_deselect();
    size_t write_dma(const uint8_t* data, size_t len);
    void drain_rx();

    SpiBus bus_;
    uint8_t sck_;
    uint8_t mosi_;
    uint8_t miso_;
    uint8_t cs_;
    bool use_dma_;
    int dma_tx_chan_ = -1;
    bool open_ = false;
};

} // namespace unicorn
