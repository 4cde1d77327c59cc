#pragma once

#include "dedrv/mutex.h"
#include "dedrv/status.h"
#include "dedrv/type_traits.h"

namespace dedrv {

/// Base of every driver.
///
/// A driver holds no data: it is a set of static operations working on what
/// a Device hands to them through a Context. The same driver backs every
/// device of its peripheral kind. Derived drivers override the nested types
/// they need and provide:
///
/// @code
/// struct UartDriver : dedrv::Driver {
///     struct StateType { u32 baud; };
///     struct ConfigType { u32 baud; };
///     struct ResourceType { volatile u32 *regs; };
///
///     static dedrv::Status init(dedrv::Context<UartDriver> ctx);
///     static dedrv::Status cleanup(dedrv::Context<UartDriver> ctx);
/// };
/// @endcode
struct Driver {
    /// Mutable per-device state, only reachable inside a critical section
    struct StateType {};
    /// Immutable per-device configuration
    struct ConfigType {};
    /// Hardware handle (register block, bus number, chip select ...)
    struct ResourceType {};
};

/// What a driver operation gets to work on: the calling device's state,
/// configuration and hardware handle. Valid for the duration of one call.
template <typename D> struct Context {
    Mutex<typename D::StateType> &state;
    const typename D::ConfigType &config;
    typename D::ResourceType &resource;
};

/// Base of device class (capability) mixins. `Self` is the Accessor the
/// mixin ends up in; `self().context()` yields the device Context.
///
/// @code
/// template <typename Self> class Gpio : public dedrv::DeviceClass<Self> {
///   public:
///     void configure(u8 pin, PinMode mode) {
///         Self::driver_type::configure(this->self().context(), pin, mode);
///     }
/// };
/// @endcode
template <typename Self> class DeviceClass {
  protected:
    Self &self() { return static_cast<Self &>(*this); }
    const Self &self() const { return static_cast<const Self &>(*this); }
};

/// Whether driver D implements the device class `Class`. Drivers opt in
/// through DEDRV_IMPLEMENTS.
template <typename D, template <typename> class Class>
struct implements : false_type {};

} // namespace dedrv

/// Declares that DRIVER implements device class CLASS. Use at global scope.
#define DEDRV_IMPLEMENTS(DRIVER, CLASS)                                        \
    template <> struct dedrv::implements<DRIVER, CLASS> : dedrv::true_type {}
