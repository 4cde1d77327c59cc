#include "test.h"

#include <cstring>

#include "dedrv/descriptor.h"
#include "dedrv/lifecycle.h"
#include "dedrv/lookup.h"
#include "dedrv/registry.h"

#include "recording_driver.h"

using dedrv::DeviceRef;
using dedrv::Optional;
using dedrv::State;

namespace {

struct OtherDriver : dedrv::Driver {
    static dedrv::Status init(dedrv::Context<OtherDriver>) { return dedrv::success(); }
    static dedrv::Status cleanup(dedrv::Context<OtherDriver>) { return dedrv::success(); }
};

} // namespace

TEST_CASE("find") {
    dedrv_test::CapturedOutput output;
    dedrv_test::Journal journal;
    dedrv_test::RecordingDevice one({"1", false, false}, {&journal});
    dedrv_test::RecordingDevice two({"2", true, false}, {&journal});
    dedrv::LifecycleSlot s1{}, s2{};
    const dedrv::Descriptor table[] = {
        dedrv::make_descriptor("1", 0, one, s1),
        dedrv::make_descriptor("2", 1, two, s2),
    };
    dedrv::Registry registry(table);

    SUBCASE("registered id") {
        Optional<DeviceRef> ref = dedrv::find(registry, "1");
        REQUIRE(ref.has_value());
        CHECK(std::strcmp(ref->path(), "1") == 0);
        CHECK(ref->priority() == 0);
        CHECK(ref->descriptor() == &table[0]);
        CHECK(ref->state() == State::UNINITIALIZED);
        CHECK_FALSE(ref->isReady());
    }

    SUBCASE("unknown id is empty and not an error") {
        Optional<DeviceRef> ref = dedrv::find(registry, "3");
        CHECK(ref.empty());
        CHECK(output.all().empty());
    }

    SUBCASE("lookup reflects the lifecycle") {
        dedrv::LifecycleManager manager(registry, dedrv::FailurePolicy::CONTINUE);
        Optional<DeviceRef> ref = manager.find("1");
        REQUIRE(ref.has_value());
        CHECK(ref->state() == State::UNINITIALIZED);

        dedrv::Report boot = manager.init();
        CHECK(boot.error() == dedrv::ErrorKind::INIT_FAILED);
        CHECK(ref->state() == State::READY);
        CHECK(ref->isReady());
        CHECK(ref->lastError() == dedrv::DriverError::NONE);

        Optional<DeviceRef> failed = manager.find("2");
        REQUIRE(failed.has_value());
        CHECK(failed->state() == State::FAILED);
        CHECK(failed->lastError() == dedrv::DriverError::TIMEOUT);
        CHECK(std::strcmp(failed->lastMessage(), "no answer") == 0);

        CHECK(manager.cleanup().ok());
        CHECK(ref->state() == State::CLEANED);
    }

    SUBCASE("typed access") {
        Optional<DeviceRef> ref = dedrv::find(registry, "2");
        REQUIRE(ref.has_value());
        CHECK(ref->as<dedrv_test::RecordingDevice>() == &two);
        CHECK(ref->as<dedrv::Device<OtherDriver>>() == nullptr);

        dedrv_test::RecordingDevice *device = ref->as<dedrv_test::RecordingDevice>();
        REQUIRE(device != nullptr);
        CHECK(std::strcmp(device->config().label, "2") == 0);
    }

    SUBCASE("same device, same handle") {
        CHECK(*dedrv::find(registry, "2") == *dedrv::find(registry, "2"));
        CHECK(*dedrv::find(registry, "1") != *dedrv::find(registry, "2"));
    }
}

TEST_CASE("find on an invalid registry") {
    dedrv_test::CapturedOutput output;
    alignas(dedrv::Descriptor) unsigned char region[sizeof(dedrv::Descriptor) * 2] = {};
    dedrv::Registry registry(region + sizeof(dedrv::Descriptor), region);

    Optional<DeviceRef> ref = dedrv::find(registry, "/gpio0");
    CHECK(ref.empty());
    CHECK(output.contains("ERROR: lookup of /gpio0 on invalid registry: end before start"));
}

TEST_CASE("find scans a bus of devices once per lookup") {
    static const char *const kPaths[] = {"/bus/0", "/bus/1", "/bus/2", "/bus/3",
                                         "/bus/4", "/bus/5", "/bus/6", "/bus/7"};
    static dedrv_test::RecordingDevice devices[8];
    dedrv::LifecycleSlot slots[8] = {};
    dedrv::Descriptor table[8];
    for (int i = 0; i < 8; ++i) {
        table[i] = dedrv::make_descriptor(kPaths[i], i, devices[i], slots[i]);
    }
    dedrv::Registry registry(table);

    for (int i = 0; i < 8; ++i) {
        Optional<DeviceRef> ref = dedrv::find(registry, kPaths[i]);
        REQUIRE(ref.has_value());
        CHECK(ref->descriptor() == &table[i]);
        CHECK(ref->as<dedrv_test::RecordingDevice>() == &devices[i]);
    }
    CHECK(dedrv::find(registry, "/bus/8").empty());
}

TEST_CASE("Default DeviceRef") {
    DeviceRef ref;
    CHECK(ref.path() == nullptr);
    CHECK(ref.state() == State::UNINITIALIZED);
    CHECK(ref.lastError() == dedrv::DriverError::NONE);
    CHECK(ref.as<dedrv_test::RecordingDevice>() == nullptr);
}
