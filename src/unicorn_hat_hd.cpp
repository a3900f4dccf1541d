#include "unicorn_hat_hd.hpp"

#include <utility>

#include "drivers/emulated_sink.hpp"
#ifdef UNICORN_HAT_HD_HARDWARE
#include "drivers/spi_sink.hpp"
#endif

namespace unicorn {

namespace {
    std::unique_ptr<ByteSink> make_sink(const DriverConfig& config) {
        switch (config.mode) {
            case TransportMode::Emulated:
                return std::make_unique<EmulatedSink>();
            case TransportMode::Real:
#ifdef UNICORN_HAT_HD_HARDWARE
                return std::make_unique<SpiSink>(config.spi);
#else
                return nullptr;
#endif
        }
        return nullptr;
    }
}

UnicornHatHd::UnicornHatHd(const DriverConfig& config)
    : channel_(make_sink(config)) {}

UnicornHatHd::UnicornHatHd(std::unique_ptr<ByteSink> sink)
    : channel_(std::move(sink)) {}

} // namespace unicorn
