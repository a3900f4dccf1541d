#pragma once

#include <cstdint>

namespace unicorn::pins {

// SPI0 wired to the HAT header
constexpr uint8_t spi0_sck  = 18;
constexpr uint8_t spi0_mosi = 19;
constexpr uint8_t spi0_miso = 16;   // set to 0xFF to skip (HAT never answers)
constexpr uint8_t spi0_cs   = 17;   // CE0 on the Pi header

} // namespace unicorn::pins
