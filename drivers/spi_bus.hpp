#pragma once

#include <cstddef>
#include <cstdint>
#include "hardware/spi.h"

namespace unicorn {

class SpiBus {
public:
    explicit SpiBus(spi_inst_t* inst, uint32_t hz) : inst_(inst), hz_(hz) {}
    // Mode 0, 8-bit words, MSB first; returns the baud rate actually set
    uint32_t init() {
        hz_ = spi_init(inst_, hz_);
        spi_set_format(inst_, 8, SPI_CPOL_0, SPI_CPHA_0, SPI_MSB_FIRST);
        return hz_;
    }
    void deinit() { spi_deinit(inst_); }
    spi_inst_t* inst() const { return inst_; }
    uint32_t frequency() const { return hz_; }
    // Blocking write; returns bytes accepted
    int write(const uint8_t* data, size_t len) { return spi_write_blocking(inst_, data, len); }
private:
    spi_inst_t* inst_;
    uint32_t hz_;
};

} // namespace unicorn
