#pragma once

#include "dedrv/critical_section.h"
#include "dedrv/driver.h"
#include "dedrv/mutex.h"
#include "dedrv/status.h"
#include "dedrv/strstream.h"
#include "dedrv/type_traits.h"

namespace dedrv {

template <typename D> class Device;

/// Common part of every Accessor: a handle to one device.
template <typename D> class AccessorBase {
  public:
    typedef D driver_type;

    explicit AccessorBase(Device<D> &device) : mDevice(&device) {}

    Device<D> &inner() const { return *mDevice; }
    Context<D> context() const { return mDevice->context(); }

    template <typename Fn>
    auto with(Fn fn) const -> decltype(fn(declval<typename D::StateType &>())) {
        return mDevice->with(fn);
    }

  private:
    Device<D> *mDevice;
};

/// View of a device through one of its device classes. Only exists when the
/// driver declared the class with DEDRV_IMPLEMENTS; the class' operations
/// are inherited from the `Class` mixin.
template <typename D, template <typename> class Class>
class Accessor : public AccessorBase<D>, public Class<Accessor<D, Class> > {
    static_assert(implements<D, Class>::value,
                  "driver does not implement this device class, see DEDRV_IMPLEMENTS");

  public:
    explicit Accessor(Device<D> &device) : AccessorBase<D>(device) {}
};

/// One peripheral instance: a stateless driver D bound to its own state,
/// configuration and hardware resource.
///
/// Devices are meant to be namespace-scope statics with constant
/// initialization, registered with DEDRV_DEVICE:
///
/// @code
/// static dedrv::Device<UartDriver> uart0(UartDriver::ConfigType{115200},
///                                        UartDriver::ResourceType{UART0_BASE});
/// DEDRV_DEVICE(uart0, "/uart0", 10);
/// @endcode
template <typename D> class Device {
    static_assert(is_empty<D>::value,
                  "drivers must not hold per-instance data, use StateType");

  public:
    typedef D driver_type;
    typedef typename D::StateType state_type;
    typedef typename D::ConfigType config_type;
    typedef typename D::ResourceType resource_type;

    constexpr Device() : mState(), mConfig(), mResource() {}
    constexpr explicit Device(const config_type &config)
        : mState(), mConfig(config), mResource() {}
    constexpr Device(const config_type &config, const resource_type &resource)
        : mState(), mConfig(config), mResource(resource) {}

    Device(const Device &) = delete;
    Device &operator=(const Device &) = delete;

    /// Lifecycle hooks, called by the lifecycle manager through the
    /// device's Descriptor.
    Status init() { return D::init(context()); }
    Status cleanup() { return D::cleanup(context()); }

    Context<D> context() { return Context<D>{mState, mConfig, mResource}; }

    const config_type &config() const { return mConfig; }
    resource_type &resource() { return mResource; }
    Mutex<state_type> &state() { return mState; }
    const Mutex<state_type> &state() const { return mState; }

    /// Runs fn(state) inside a critical section and returns its result.
    template <typename Fn>
    auto with(Fn fn) -> decltype(fn(declval<state_type &>())) {
        CriticalSection cs;
        return fn(mState.borrow(cs));
    }

    template <template <typename> class Class> Accessor<D, Class> accessor() {
        return Accessor<D, Class>(*this);
    }

  private:
    Mutex<state_type> mState;
    config_type mConfig;
    resource_type mResource;
};

template <typename T> struct is_device : false_type {};
template <typename D> struct is_device<Device<D> > : true_type {};

/// Prints the device state. Only available when the driver's StateType can
/// be streamed.
template <typename D>
auto operator<<(StrStream &out, const Device<D> &device)
    -> decltype(out << declval<const typename D::StateType &>()) {
    CriticalSection cs;
    return out << device.state().borrow(cs);
}

} // namespace dedrv
