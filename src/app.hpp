#pragma once

#include <cstdint>
#include "unicorn_hat_hd.hpp"

namespace unicorn {

// Demo: colour gradient with an orientation marker, turned a quarter every
// kFramesPerTurn frames.
class App {
public:
    explicit App(const DriverConfig& config = DriverConfig{}) : config_(config), hat_(config) {}

    bool init();
    // Draws and sends one frame; false once the transport has failed
    bool loop();

    static constexpr uint32_t kFramesPerTurn = 32;
    static constexpr uint32_t kFrameIntervalMs = 33;

private:
    void draw();
    void report(const char* what, const Status& status) const;

    DriverConfig config_;
    UnicornHatHd hat_;
    uint32_t frame_ = 0;
    int rotation_deg_ = 0;
};

} // namespace unicorn
