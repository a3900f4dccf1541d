#include "app.hpp"

#include <cstdio>
#include "ansi_preview.hpp"

#ifdef UNICORN_HAT_HD_HARDWARE
#include "pico/stdlib.h"
#endif

namespace unicorn {

bool App::init() {
    Status st = hat_.init();
    if (!st) {
        report("init", st);
        return false;
    }
    std::printf("unicorn: transport %s ready\n",
                config_.mode == TransportMode::Real ? "spi" : "emulated");
    return true;
}

bool App::loop() {
    if (frame_ > 0 && frame_ % kFramesPerTurn == 0) {
        rotation_deg_ = (rotation_deg_ + 90) % 360;
        Status st = hat_.set_rotation(rotation_deg_);
        if (!st) {
            report("set_rotation", st);
            return false;
        }
    }
    draw();

    Status st = hat_.display();
    if (!st) {
        report("display", st);
        return false;
    }

    // The emulated panel shows up on the console once per orientation
    if (config_.mode == TransportMode::Emulated && frame_ % kFramesPerTurn == 0) {
        std::printf("rotation %d\n%s", rotation_deg_, ansi_preview(hat_.buffer()).c_str());
    }

    ++frame_;
#ifdef UNICORN_HAT_HD_HARDWARE
    sleep_ms(kFrameIntervalMs);
#endif
    return true;
}

void App::draw() {
    const uint8_t phase = static_cast<uint8_t>(frame_ * 8);
    for (int y = 0; y < FrameBuffer::kHeight; ++y) {
        for (int x = 0; x < FrameBuffer::kWidth; ++x) {
            Pixel px{static_cast<uint8_t>(x * 16), static_cast<uint8_t>(y * 16), phase};
            // Loop bounds keep every coordinate valid
            if (!hat_.set_pixel(x, y, px)) return;
        }
    }
    // Top-left marker so the rotation is visible
    if (!hat_.set_pixel(0, 0, Pixel{255, 255, 255})) return;
}

void App::report(const char* what, const Status& status) const {
    std::printf("unicorn: %s failed: %s\n", what, to_string(status).c_str());
}

} // namespace unicorn
