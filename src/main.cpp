#include "app.hpp"

#ifdef UNICORN_HAT_HD_HARDWARE
#include "pico/stdlib.h"
#endif

int main() {
#ifdef UNICORN_HAT_HD_HARDWARE
    stdio_init_all();
#endif
    unicorn::App app;
    if (!app.init()) return 1;

#ifdef UNICORN_HAT_HD_HARDWARE
    while (app.loop()) {}
    return 1;
#else
    // One full turn on the console
    for (uint32_t i = 0; i < 4 * unicorn::App::kFramesPerTurn; ++i) {
        if (!app.loop()) return 1;
    }
    return 0;
#endif
}
