#pragma once

#include <cstdint>
#include "boards/unicorn_hat_hd_pins.hpp"

namespace unicorn {

enum class TransportMode : uint8_t {
    Real,       // talk to the HAT over the SPI peripheral
    Emulated,   // no-op sink, no I/O at all
};

#ifdef UNICORN_HAT_HD_HARDWARE
constexpr bool kHardwareSupport = true;
constexpr TransportMode kDefaultTransportMode = TransportMode::Real;
#else
constexpr bool kHardwareSupport = false;
constexpr TransportMode kDefaultTransportMode = TransportMode::Emulated;
#endif

// Bus settings for the real sink. Ignored in emulated mode.
struct SpiConfig {
    uint8_t bus = 0;                    // spi0 / spi1
    uint32_t baud_hz = 9'000'000;       // HAT is specified up to 9 MHz
    uint8_t pin_sck = pins::spi0_sck;
    uint8_t pin_mosi = pins::spi0_mosi;
    uint8_t pin_miso = pins::spi0_miso;
    uint8_t pin_cs = pins::spi0_cs;
    bool use_dma = true;                // falls back to polled writes if no channel is free
};

struct DriverConfig {
    TransportMode mode = kDefaultTransportMode;
    SpiConfig spi{};
};

} // namespace unicorn
