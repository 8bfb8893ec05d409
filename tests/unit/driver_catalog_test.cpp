/**
 * driver_catalog_test.cpp - DriverCatalog unit tests
 *
 * Tests:
 * - Loading driversList files from a directory
 * - Malformed files are skipped without hiding other files
 * - Device-level defaults and skips (version, skeleton, missing label)
 * - Custom overlay override and restore
 * - Family grouping and ordering
 * - Concurrent readers while the overlay is swapped
 */

#include "driver/driver_catalog.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "test_helpers.hpp"

using namespace indiweb::driver;
using indiweb::tests::make_descriptor;
using indiweb::tests::TempDir;
using indiweb::tests::write_file;

namespace {
const char *kTelescopes = R"(<driversList>
  <devGroup group="Telescopes">
    <device label="Telescope Simulator">
      <driver name="Telescope Simulator">indi_simulator_telescope</driver>
      <version>1.0</version>
    </device>
    <device label="LX200 Basic">
      <driver name="LX200 Basic">indi_lx200basic</driver>
      <version>2.1</version>
    </device>
  </devGroup>
</driversList>
)";

const char *kCameras = R"(<driversList>
  <devGroup group="CCDs">
    <device label="CCD Simulator">
      <driver name="CCD Simulator">indi_simulator_ccd</driver>
      <version>1.0</version>
    </device>
  </devGroup>
  <devGroup group="Focusers">
    <device label="Focuser Simulator">
      <driver name="Focuser Simulator">indi_simulator_focus</driver>
    </device>
  </devGroup>
</driversList>
)";
}  // namespace

class DriverCatalogTest : public ::testing::Test {
protected:
    TempDir dir{"indiweb_catalog_test"};
    DriverCatalog catalog;

    void write_definitions() {
        write_file(dir.file("telescopes.xml"), kTelescopes);
        write_file(dir.file("cameras.xml"), kCameras);
    }
};

/******************************************************************************
 * Loading
 ******************************************************************************/

TEST_F(DriverCatalogTest, LoadFindsEveryLabel) {
    write_definitions();

    auto loaded = catalog.load(dir.path().string());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 4u);
    EXPECT_EQ(catalog.size(), 4u);

    for (const char *label : {"Telescope Simulator", "LX200 Basic", "CCD Simulator", "Focuser Simulator"}) {
        EXPECT_TRUE(catalog.by_label(label).has_value()) << label;
    }

    auto ccd = catalog.by_label("CCD Simulator");
    ASSERT_TRUE(ccd.has_value());
    EXPECT_EQ(ccd->name, "CCD Simulator");
    EXPECT_EQ(ccd->binary, "indi_simulator_ccd");
    EXPECT_EQ(ccd->family, "CCDs");
    EXPECT_EQ(ccd->version, "1.0");
    EXPECT_FALSE(ccd->skeleton.has_value());
}

TEST_F(DriverCatalogTest, MissingVersionDefaults) {
    write_definitions();
    ASSERT_TRUE(catalog.load(dir.path().string()).has_value());

    auto focuser = catalog.by_label("Focuser Simulator");
    ASSERT_TRUE(focuser.has_value());
    EXPECT_EQ(focuser->version, "0.0");
}

TEST_F(DriverCatalogTest, MalformedFileDoesNotHideOthers) {
    write_definitions();
    write_file(dir.file("broken.xml"), "<driversList><devGroup group=\"X\"><device label=");
    write_file(dir.file("wrong_root.xml"), "<notDrivers><devGroup group=\"X\"/></notDrivers>");

    auto loaded = catalog.load(dir.path().string());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 4u);
    EXPECT_TRUE(catalog.by_label("Telescope Simulator").has_value());
    EXPECT_TRUE(catalog.by_label("CCD Simulator").has_value());
}

TEST_F(DriverCatalogTest, ParseDefinitionFileReportsErrors) {
    write_file(dir.file("broken.xml"), "<driversList><device");
    std::string error;
    EXPECT_FALSE(DriverCatalog::parse_definition_file(dir.file("broken.xml"), error).has_value());
    EXPECT_FALSE(error.empty());

    write_file(dir.file("ok.xml"), kCameras);
    error.clear();
    auto parsed = DriverCatalog::parse_definition_file(dir.file("ok.xml"), error);
    ASSERT_TRUE(parsed.has_value()) << error;
    ASSERT_EQ(parsed->size(), 2u);
    EXPECT_EQ((*parsed)[0].label, "CCD Simulator");
    EXPECT_EQ((*parsed)[1].family, "Focusers");
}

TEST_F(DriverCatalogTest, IgnoresNonXmlAndSkeletonFiles) {
    write_definitions();
    write_file(dir.file("notes.txt"), kCameras);
    write_file(dir.file("indi_ccd_sk.xml"), "<INDIDriver><defSwitchVector/></INDIDriver>");

    auto loaded = catalog.load(dir.path().string());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 4u);
}

TEST_F(DriverCatalogTest, DeviceWithoutLabelOrDriverIsSkipped) {
    write_file(dir.file("partial.xml"), R"(<driversList>
  <devGroup group="Domes">
    <device>
      <driver name="Nameless">indi_nameless</driver>
    </device>
    <device label="No Driver">
      <version>1.0</version>
    </device>
    <device label="Dome Simulator">
      <driver name="Dome Simulator">indi_simulator_dome</driver>
    </device>
  </devGroup>
</driversList>
)");

    auto loaded = catalog.load(dir.path().string());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 1u);
    EXPECT_TRUE(catalog.by_label("Dome Simulator").has_value());
    EXPECT_FALSE(catalog.by_label("No Driver").has_value());
}

TEST_F(DriverCatalogTest, SkeletonKeptOnlyWhenFileExists) {
    write_file(dir.file("gps.xml"), R"(<driversList>
  <devGroup group="Auxiliary">
    <device label="GPS Simulator" skel="gps_sk.xml">
      <driver name="GPS Simulator">indi_simulator_gps</driver>
    </device>
    <device label="Weather Simulator" skel="missing_sk.xml">
      <driver name="Weather Simulator">indi_simulator_weather</driver>
    </device>
  </devGroup>
</driversList>
)");
    write_file(dir.file("gps_sk.xml"), "<INDIDriver/>");

    ASSERT_TRUE(catalog.load(dir.path().string()).has_value());

    auto gps = catalog.by_label("GPS Simulator");
    ASSERT_TRUE(gps.has_value());
    ASSERT_TRUE(gps->skeleton.has_value());
    EXPECT_EQ(*gps->skeleton, dir.file("gps_sk.xml"));

    auto weather = catalog.by_label("Weather Simulator");
    ASSERT_TRUE(weather.has_value());
    EXPECT_FALSE(weather->skeleton.has_value());
}

TEST_F(DriverCatalogTest, MissingDirectoryKeepsPreviousSet) {
    write_definitions();
    ASSERT_TRUE(catalog.load(dir.path().string()).has_value());

    EXPECT_FALSE(catalog.load(dir.file("does_not_exist")).has_value());
    EXPECT_EQ(catalog.size(), 4u);
}

TEST_F(DriverCatalogTest, ReloadReplacesBuiltinSet) {
    write_definitions();
    ASSERT_TRUE(catalog.load(dir.path().string()).has_value());

    TempDir other("indiweb_catalog_other");
    write_file(other.file("cameras.xml"), kCameras);
    ASSERT_TRUE(catalog.load(other.path().string()).has_value());

    EXPECT_EQ(catalog.size(), 2u);
    EXPECT_FALSE(catalog.by_label("Telescope Simulator").has_value());
}

/******************************************************************************
 * Custom overlay
 ******************************************************************************/

TEST_F(DriverCatalogTest, CustomOverridesBuiltinAndClearRestores) {
    write_definitions();
    ASSERT_TRUE(catalog.load(dir.path().string()).has_value());

    auto custom = make_descriptor("CCD Simulator", "my_ccd_driver", "Custom");
    catalog.load_custom({custom});

    auto found = catalog.by_label("CCD Simulator");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->binary, "my_ccd_driver");
    EXPECT_EQ(catalog.size(), 4u);

    catalog.clear_custom();
    found = catalog.by_label("CCD Simulator");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->binary, "indi_simulator_ccd");
}

TEST_F(DriverCatalogTest, CustomOnlyLabelIsNotFoundAfterClear) {
    catalog.load_custom({make_descriptor("My Focuser", "indi_my_focuser", "Focusers")});
    EXPECT_TRUE(catalog.by_label("My Focuser").has_value());
    EXPECT_EQ(catalog.custom_count(), 1u);

    catalog.clear_custom();
    EXPECT_FALSE(catalog.by_label("My Focuser").has_value());
    EXPECT_EQ(catalog.custom_count(), 0u);
}

TEST_F(DriverCatalogTest, LaterCustomEntryWins) {
    catalog.load_custom({make_descriptor("Dup", "first"), make_descriptor("Dup", "second")});

    auto found = catalog.by_label("Dup");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->binary, "second");
    EXPECT_EQ(catalog.custom_count(), 1u);
}

/******************************************************************************
 * Presentation helpers
 ******************************************************************************/

TEST_F(DriverCatalogTest, GroupsByFamilyOrdered) {
    write_definitions();
    ASSERT_TRUE(catalog.load(dir.path().string()).has_value());
    catalog.load_custom({make_descriptor("Extra Scope", "indi_extra", "Telescopes")});

    auto groups = catalog.groups_by_family();
    std::vector<std::string> names;
    for (const auto &[family, drivers] : groups) {
        names.push_back(family);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"CCDs", "Focusers", "Telescopes"}));

    const auto &telescopes = groups["Telescopes"];
    ASSERT_EQ(telescopes.size(), 3u);
    EXPECT_EQ(telescopes[0].label, "Telescope Simulator");
    EXPECT_EQ(telescopes[1].label, "LX200 Basic");
    EXPECT_EQ(telescopes[2].label, "Extra Scope");

    EXPECT_EQ(catalog.families(), names);
}

TEST_F(DriverCatalogTest, AllDriversSkipsOverriddenBuiltins) {
    write_definitions();
    ASSERT_TRUE(catalog.load(dir.path().string()).has_value());
    catalog.load_custom({make_descriptor("CCD Simulator", "my_ccd_driver")});

    auto all = catalog.all_drivers();
    ASSERT_EQ(all.size(), 4u);
    int ccd_count = 0;
    for (const auto &descriptor : all) {
        if (descriptor.label == "CCD Simulator") {
            ++ccd_count;
            EXPECT_EQ(descriptor.binary, "my_ccd_driver");
        }
    }
    EXPECT_EQ(ccd_count, 1);
    EXPECT_EQ(all.back().label, "CCD Simulator");
}

/******************************************************************************
 * Concurrency
 ******************************************************************************/

TEST_F(DriverCatalogTest, ReadersSeeWholeOverlayDuringSwaps) {
    write_definitions();
    ASSERT_TRUE(catalog.load(dir.path().string()).has_value());

    std::vector<DriverDescriptor> overlay_a = {make_descriptor("A1", "bin_a"), make_descriptor("A2", "bin_a")};
    std::vector<DriverDescriptor> overlay_b = {make_descriptor("B1", "bin_b"), make_descriptor("B2", "bin_b")};

    std::atomic<bool> done{false};
    std::atomic<int> torn{0};

    std::thread writer([&] {
        for (int i = 0; i < 500; ++i) {
            catalog.load_custom(i % 2 == 0 ? overlay_a : overlay_b);
        }
        done = true;
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            while (!done) {
                auto all = catalog.all_drivers();
                // Built-in set is never touched; overlay is all-A or all-B
                size_t a = 0;
                size_t b = 0;
                for (const auto &descriptor : all) {
                    a += descriptor.binary == "bin_a";
                    b += descriptor.binary == "bin_b";
                }
                if (!((a == 2 && b == 0) || (a == 0 && b == 2) || (a == 0 && b == 0))) {
                    ++torn;
                }
                if (!catalog.by_label("Telescope Simulator")) {
                    ++torn;
                }
            }
        });
    }

    writer.join();
    for (auto &reader : readers) {
        reader.join();
    }
    EXPECT_EQ(torn.load(), 0);
}
