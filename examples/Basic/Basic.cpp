/// @file    Basic.cpp
/// @brief   One GPIO device, registered statically, booted and shut down
/// @example Basic.cpp

#include "dedrv.h"

#include "dedrv/dbg.h"
#include "dedrv/io.h"

enum class PinMode : dedrv::u8 { IN, OUT };

// Device class: anything that can configure pins.
template <typename Self> class Gpio : public dedrv::DeviceClass<Self> {
  public:
    dedrv::Status configure(dedrv::u8 pin, PinMode mode) {
        return Self::driver_type::configure(this->self().context(), pin, mode);
    }
};

struct GpioDriver : dedrv::Driver {
    // Bit n set: pin n is an output.
    struct StateType {
        dedrv::u32 outputs;
    };
    struct ConfigType {
        dedrv::u8 pins;
    };

    static dedrv::Status init(dedrv::Context<GpioDriver> ctx) {
        dedrv::with_critical_section([&](const dedrv::CriticalSection &cs) {
            ctx.state.borrow(cs).outputs = 0;
        });
        dedrv::println("init gpio driver");
        return dedrv::success();
    }

    static dedrv::Status cleanup(dedrv::Context<GpioDriver>) {
        dedrv::println("cleanup gpio driver");
        return dedrv::success();
    }

    static dedrv::Status configure(dedrv::Context<GpioDriver> ctx, dedrv::u8 pin,
                                   PinMode mode) {
        if (pin >= ctx.config.pins) {
            return dedrv::failure(dedrv::DriverError::INVALID_ARGUMENT, "no such pin");
        }
        dedrv::CriticalSection cs;
        dedrv::u32 &outputs = ctx.state.borrow(cs).outputs;
        if (mode == PinMode::OUT) {
            outputs |= (1u << pin);
        } else {
            outputs &= ~(1u << pin);
        }
        return dedrv::success();
    }
};

DEDRV_IMPLEMENTS(GpioDriver, Gpio);

static dedrv::Device<GpioDriver> gpio0(GpioDriver::ConfigType{16});
DEDRV_DEVICE(gpio0, "/gpio0", 10);

int main() {
    dedrv::println("Hello, World from dedrv!");

    dedrv::Report boot = dedrv::init();
    if (!boot.ok()) {
        boot.describe();
        return 1;
    }

    dedrv::Optional<dedrv::DeviceRef> ref = dedrv::find("/gpio0");
    if (!ref || !ref->isReady()) {
        DEDRV_ERROR("/gpio0 is not ready");
        return 1;
    }

    dedrv::Device<GpioDriver> *device = ref->as<dedrv::Device<GpioDriver> >();
    dedrv::Status status = device->accessor<Gpio>().configure(0, PinMode::OUT);
    if (!status.ok()) {
        DEDRV_ERROR("configure failed: " << status.error());
        return 1;
    }
    dedrv::println("init ok");

    dedrv::Report shutdown = dedrv::cleanup();
    if (!shutdown.ok()) {
        shutdown.describe();
        return 1;
    }
    return 0;
}
