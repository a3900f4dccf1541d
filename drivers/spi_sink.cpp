#include "spi_sink.hpp"

#include "pico/stdlib.h"
#include "hardware/spi.h"
#include "hardware/gpio.h"
#include "hardware/dma.h"

namespace unicorn {

SpiSink::SpiSink(const SpiConfig& config)
    : bus_(config.bus == 0 ? spi0 : spi1, config.baud_hz),
      sck_(config.pin_sck), mosi_(config.pin_mosi), miso_(config.pin_miso), cs_(config.pin_cs),
      use_dma_(config.use_dma) {}

SpiSink::~SpiSink() {
    if (dma_tx_chan_ >= 0) {
        dma_channel_abort(dma_tx_chan_);
        dma_channel_unclaim(dma_tx_chan_);
    }
    if (open_) bus_.deinit();
}

Status SpiSink::open() {
    if (open_) return Status::ok();

    // SPI pin mux
    gpio_set_function(sck_,  GPIO_FUNC_SPI);
    gpio_set_function(mosi_, GPIO_FUNC_SPI);
    if (miso_ != 0xFF) gpio_set_function(miso_, GPIO_FUNC_SPI);

    // Chip select is driven by hand so the frame stays in one transaction
    gpio_init(cs_);
    gpio_set_dir(cs_, GPIO_OUT);
    gpio_put(cs_, 1);

    if (bus_.init() == 0) return Status::transport(TransportFault::DeviceNotPresent);

    // Allocate TX DMA channel (optional)
    if (use_dma_ && dma_tx_chan_ < 0) {
        int ch = dma_claim_unused_channel(false);
        if (ch >= 0) {
            dma_tx_chan_ = ch;
            // 8-bit transfers paced by SPI TX DREQ
            dma_channel_config c = dma_channel_get_default_config(ch);
            channel_config_set_transfer_data_size(&c, DMA_SIZE_8);
            channel_config_set_dreq(&c, spi_get_dreq(bus_.inst(), true));
            dma_channel_configure(ch, &c,
                &spi_get_hw(bus_.inst())->dr, // dst: SPI data register
                nullptr,                      // src set per transfer
                0,                            // count set per transfer
                false);
        } else {
            use_dma_ = false; // fallback
        }
    }

    open_ = true;
    return Status::ok();
}

Status SpiSink::write(const uint8_t* data, size_t len) {
    if (!open_) return Status::transport(TransportFault::NotOpen);
    if (!data || !len) return Status::transport(TransportFault::ShortWrite);

    cs_select();
    size_t written;
    if (use_dma_ && dma_tx_chan_ >= 0) {
        written = write_dma(data, len);
    } else {
        int n = bus_.write(data, len);
        written = n > 0 ? static_cast<size_t>(n) : 0;
    }
    cs_deselect();

    if (written != len) return Status::transport(TransportFault::ShortWrite);
    return Status::ok();
}

size_t SpiSink::write_dma(const uint8_t* data, size_t len) {
    dma_channel_set_read_addr(dma_tx_chan_, data, false);
    dma_channel_set_trans_count(dma_tx_chan_, len, true);
    dma_channel_wait_for_finish_blocking(dma_tx_chan_);
    uint32_t remaining = dma_channel_hw_addr(dma_tx_chan_)->transfer_count;

    // Last bytes are still shifting out after the DMA finishes
    while (spi_is_busy(bus_.inst())) tight_loop_contents();
    drain_rx();
    return len - remaining;
}

void SpiSink::drain_rx() {
    // TX-only transfer leaves the RX FIFO full and the overrun flag set
    while (spi_is_readable(bus_.inst())) (void)spi_get_hw(bus_.inst())->dr;
    spi_get_hw(bus_.inst())->icr = SPI_SSPICR_RORIC_BITS;
}

void SpiSink::cs_select() { gpio_put(cs_, 0); }
void SpiSink::cs_deselect() { gpio_put(cs_, 1); }

} // namespace unicorn
