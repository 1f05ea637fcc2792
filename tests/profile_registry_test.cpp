#include "core/profile/ProfileRegistry.hpp"
#include "core/types/Error.hpp"

#include <gtest/gtest.h>

using namespace core::profile;

namespace {
    SlicerProfile slicer(const std::string &name, SlicerBackend backend = SlicerBackend::MIRACLE_GRUE) {
        SlicerProfile profile;
        profile.name = name;
        profile.backend = backend;
        return profile;
    }

    DriverProfile driver(const std::string &name, DriverBackend backend = DriverBackend::MAKERBOT) {
        DriverProfile profile;
        profile.name = name;
        profile.backend = backend;
        return profile;
    }
}

TEST(ProfileRegistryTest, ResolvesByName) {
    ProfileRegistry registry({slicer("MiracleGrue"), slicer("Skeinforge", SlicerBackend::SKEINFORGE)},
                             {driver("MakerBotDriver"), driver("File", DriverBackend::PRINT_TO_FILE)});

    EXPECT_EQ(registry.resolveSlicer("Skeinforge")->backend, SlicerBackend::SKEINFORGE);
    EXPECT_EQ(registry.resolveDriver("File")->backend, DriverBackend::PRINT_TO_FILE);
    EXPECT_TRUE(registry.contains(ProfileKind::SLICER, "MiracleGrue"));
    EXPECT_FALSE(registry.contains(ProfileKind::DRIVER, "MiracleGrue"));
    EXPECT_EQ(registry.slicerProfiles().size(), 2u);
    EXPECT_EQ(registry.driverProfiles().size(), 2u);
}

TEST(ProfileRegistryTest, UnknownNameReportsKind) {
    ProfileRegistry registry({slicer("MiracleGrue")}, {driver("MakerBotDriver")});

    try {
        registry.resolveDriver("Replicator2");
        FAIL() << "expected ProfileNotFoundException";
    } catch (const core::types::ProfileNotFoundException &e) {
        EXPECT_EQ(e.kind(), "Driver");
        EXPECT_EQ(e.name(), "Replicator2");
    }
    EXPECT_THROW(registry.resolveSlicer("miraclegrue"), core::types::ProfileNotFoundException);
}

TEST(ProfileRegistryTest, RejectsDuplicateOrEmptyNames) {
    EXPECT_THROW(ProfileRegistry({slicer("A"), slicer("A")}, {}), core::types::ConfigurationException);
    EXPECT_THROW(ProfileRegistry({}, {driver("")}), core::types::ConfigurationException);
}

TEST(ProfileRegistryTest, BackendNamesRoundTrip) {
    EXPECT_EQ(slicerBackendFromString("MiracleGrue"), SlicerBackend::MIRACLE_GRUE);
    EXPECT_EQ(driverBackendFromString(driverBackendToString(DriverBackend::PRINT_TO_FILE)),
              DriverBackend::PRINT_TO_FILE);
    EXPECT_FALSE(slicerBackendFromString("Cura").has_value());
}
