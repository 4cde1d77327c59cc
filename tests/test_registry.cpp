#include "test.h"

#include <cstring>

#include "dedrv/descriptor.h"
#include "dedrv/registry.h"

#include "recording_driver.h"

using dedrv::Descriptor;
using dedrv::LayoutFault;
using dedrv::Registry;

namespace {

// Raw storage to build regions with arbitrary bounds.
struct alignas(Descriptor) Region {
    unsigned char bytes[4 * sizeof(Descriptor) + 16];
    const unsigned char *at(dedrv::size offset) const { return bytes + offset; }
};

LayoutFault faultOf(const Registry &registry) {
    dedrv::Result<void, dedrv::LayoutError> result = registry.validate();
    return result.ok() ? LayoutFault::NONE : result.error().fault;
}

} // namespace

TEST_CASE("Registry over a descriptor table") {
    dedrv_test::Journal journal;
    dedrv_test::RecordingDevice a({"A", false, false}, {&journal});
    dedrv_test::RecordingDevice b({"B", false, false}, {&journal});
    dedrv_test::RecordingDevice c({"C", false, false}, {&journal});
    dedrv::LifecycleSlot sa{}, sb{}, sc{};
    const Descriptor table[] = {
        dedrv::make_descriptor("/a", 10, a, sa),
        dedrv::make_descriptor("/b", 5, b, sb),
        dedrv::make_descriptor("/c", 20, c, sc),
    };
    Registry registry(table);

    REQUIRE(registry.validate().ok());
    CHECK(registry.valid());
    CHECK(registry.size() == 3);
    CHECK_FALSE(registry.empty());

    SUBCASE("entries keep placement order") {
        const char *expected[] = {"/a", "/b", "/c"};
        int i = 0;
        for (const Descriptor &desc : registry.entries()) {
            CHECK(std::strcmp(desc.path, expected[i]) == 0);
            ++i;
        }
        CHECK(i == 3);
    }

    SUBCASE("entries can be walked again") {
        int first = 0;
        for (Registry::iterator it = registry.begin(); it != registry.end(); ++it) {
            ++first;
        }
        int second = 0;
        for (const Descriptor &desc : registry.entries()) {
            (void)desc;
            ++second;
        }
        CHECK(first == 3);
        CHECK(second == 3);
    }

    SUBCASE("at") {
        REQUIRE(registry.at(1) != nullptr);
        CHECK(registry.at(1)->priority == 5);
        CHECK(registry.at(3) == nullptr);
    }

    SUBCASE("explicit bounds") {
        Registry bounded(table, table + 3, table + 3);
        CHECK(bounded.valid());
        CHECK(bounded.size() == 3);
        CHECK(bounded.begin() == table);
    }
}

TEST_CASE("Registry layout validation") {
    Region region;

    SUBCASE("no markers is an empty registry") {
        Registry registry(nullptr, nullptr);
        CHECK(faultOf(registry) == LayoutFault::NONE);
        CHECK(registry.size() == 0);
        CHECK(registry.begin() == registry.end());
    }

    SUBCASE("default constructed registry is empty") {
        Registry registry;
        CHECK(registry.valid());
        CHECK(registry.empty());
    }

    SUBCASE("empty region between equal markers") {
        Registry registry(region.at(0), region.at(0));
        CHECK(faultOf(registry) == LayoutFault::NONE);
        CHECK(registry.size() == 0);
    }

    SUBCASE("exact multiple of the descriptor size") {
        Registry registry(region.at(0), region.at(2 * sizeof(Descriptor)));
        CHECK(faultOf(registry) == LayoutFault::NONE);
        CHECK(registry.size() == 2);
    }

    SUBCASE("partial descriptor") {
        Registry registry(region.at(0), region.at(sizeof(Descriptor) + 4));
        CHECK(faultOf(registry) == LayoutFault::SIZE_NOT_MULTIPLE);
        CHECK(registry.size() == 0);
        CHECK(registry.at(0) == nullptr);
    }

    SUBCASE("end before start") {
        Registry registry(region.at(sizeof(Descriptor)), region.at(0));
        CHECK(faultOf(registry) == LayoutFault::END_BEFORE_START);
        CHECK(registry.empty());
    }

    SUBCASE("one marker missing") {
        CHECK(faultOf(Registry(region.at(0), nullptr)) == LayoutFault::MISSING_MARKER);
        CHECK(faultOf(Registry(nullptr, region.at(0))) == LayoutFault::MISSING_MARKER);
    }

    SUBCASE("misaligned start") {
        Registry registry(region.at(1), region.at(1 + sizeof(Descriptor)));
        CHECK(faultOf(registry) == LayoutFault::MISALIGNED);
    }

    SUBCASE("terminal marker must sit at the end") {
        const void *end = region.at(sizeof(Descriptor));
        CHECK(faultOf(Registry(region.at(0), end, end)) == LayoutFault::NONE);
        CHECK(faultOf(Registry(region.at(0), end, region.at(sizeof(Descriptor) + 8))) ==
              LayoutFault::TERMINAL_MISMATCH);
        CHECK(faultOf(Registry(nullptr, nullptr, end)) == LayoutFault::TERMINAL_MISMATCH);
    }

    SUBCASE("error carries the offending addresses") {
        Registry registry(region.at(0), region.at(3));
        dedrv::Result<void, dedrv::LayoutError> result = registry.validate();
        REQUIRE_FALSE(result.ok());
        CHECK(result.error().start == reinterpret_cast<dedrv::uptr>(region.at(0)));
        CHECK(result.error().end == reinterpret_cast<dedrv::uptr>(region.at(3)));
        CHECK(std::strlen(result.message()) > 0);

        dedrv::StrStream out;
        out << result.error();
        CHECK(std::strncmp(out.c_str(), "size not a multiple", 19) == 0);
    }
}

TEST_CASE("Linked registry without the linker fragment is empty") {
    // This executable is linked without dedrv_host.ld: the weak markers
    // resolve to null.
    Registry registry = Registry::linked();
    CHECK(registry.valid());
    CHECK(registry.size() == 0);
}
