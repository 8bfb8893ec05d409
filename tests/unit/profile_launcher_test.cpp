/**
 * profile_launcher_test.cpp - ProfileLauncher unit tests
 *
 * Profiles come from a mock store, drivers from a real catalog, and the
 * supervisor drives the fake indiserver script.
 *
 * Tests:
 * - Remote endpoint list splitting
 * - Profile resolution (catalog labels, remote endpoints, unknown names)
 * - start_profile / stop session bookkeeping
 * - Autoconnect scheduling and autostart selection
 * - Custom driver overlay reload
 */

#include "runtime/profile_launcher.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "mocks/mock_driver_connector.hpp"
#include "mocks/mock_profile_store.hpp"
#include "test_helpers.hpp"

using namespace indiweb;
using namespace indiweb::tests;
using runtime::ProfileLauncher;
using runtime::ResolvedProfile;
using server::SupervisorErrorCode;
using server::SupervisorResult;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

namespace {
profile::Profile make_profile(const std::string &name, int port = 7624, bool autostart = false,
                              bool autoconnect = false) {
    profile::Profile profile;
    profile.name = name;
    profile.port = port;
    profile.autostart = autostart;
    profile.autoconnect = autoconnect;
    return profile;
}
}  // namespace

class ProfileLauncherTest : public ::testing::Test {
protected:
    TempDir dir{"indiweb_launcher_test"};
    driver::DriverCatalog catalog;
    NiceMock<MockProfileStore> store;
    std::shared_ptr<NiceMock<MockDriverConnector>> connector = std::make_shared<NiceMock<MockDriverConnector>>();
    std::unique_ptr<server::ServerSupervisor> supervisor;
    std::unique_ptr<ProfileLauncher> launcher;

    void SetUp() override {
        std::filesystem::create_directories(dir.path() / "xml");
        write_simulator_catalog((dir.path() / "xml" / "drivers.xml").string());
        ASSERT_EQ(catalog.load((dir.path() / "xml").string()), std::optional<size_t>(3));

        write_fake_indiserver(dir.file("fake_indiserver"));
        server::ServerConfig config;
        config.executable = dir.file("fake_indiserver");
        config.fifo_path = dir.file("indiFIFO");
        config.startup_timeout_ms = 3000;
        config.fifo_retry_ms = 20;
        config.shutdown_timeout_ms = 500;
        supervisor = std::make_unique<server::ServerSupervisor>(config, connector);

        launcher = std::make_unique<ProfileLauncher>(catalog, store, *supervisor, dir.path().string(),
                                                     std::chrono::milliseconds(20));
    }

    void TearDown() override {
        launcher.reset();
        supervisor.reset();
    }

    void expect_profile(const profile::Profile &profile, const std::vector<std::string> &labels,
                        const std::optional<std::string> &remote = std::nullopt) {
        ON_CALL(store, get_profile(profile.name)).WillByDefault(Return(std::optional<profile::Profile>(profile)));
        ON_CALL(store, get_profile_driver_labels(profile.name)).WillByDefault(Return(labels));
        ON_CALL(store, get_profile_remote_drivers(profile.name)).WillByDefault(Return(remote));
    }
};

/******************************************************************************
 * Remote lists
 ******************************************************************************/

TEST(ProfileLauncherRemoteListTest, SplitsTrimsAndDropsEmpties) {
    EXPECT_EQ(ProfileLauncher::split_remote_list(" CCD@host:7624 , ,Telescope Simulator@10.0.0.2,"),
              (std::vector<std::string>{"CCD@host:7624", "Telescope Simulator@10.0.0.2"}));
    EXPECT_TRUE(ProfileLauncher::split_remote_list("").empty());
    EXPECT_TRUE(ProfileLauncher::split_remote_list(" , ").empty());
}

/******************************************************************************
 * Resolution
 ******************************************************************************/

TEST_F(ProfileLauncherTest, ResolveLocalDriversThenRemote) {
    expect_profile(make_profile("Mixed", 7700), {"CCD Simulator", "Telescope Simulator"},
                   std::string("Focuser@10.0.0.9:7624"));

    ResolvedProfile resolved;
    auto result = launcher->resolve("Mixed", resolved);
    ASSERT_TRUE(result.success) << result.error_message;

    EXPECT_EQ(resolved.profile.port, 7700);
    ASSERT_EQ(resolved.drivers.size(), 3u);
    EXPECT_EQ(resolved.drivers[0].binary, "indi_simulator_ccd");
    EXPECT_EQ(resolved.drivers[1].binary, "indi_simulator_telescope");
    EXPECT_TRUE(resolved.drivers[2].is_remote());
    EXPECT_EQ(resolved.drivers[2].binary, "Focuser@10.0.0.9:7624");
}

TEST_F(ProfileLauncherTest, ResolveUnknownProfile) {
    ResolvedProfile resolved;
    auto result = launcher->resolve("Nope", resolved);
    EXPECT_EQ(result.code, SupervisorErrorCode::NOT_FOUND);
}

TEST_F(ProfileLauncherTest, ResolveUnknownLabel) {
    expect_profile(make_profile("Broken"), {"CCD Simulator", "Missing Driver"});

    ResolvedProfile resolved;
    auto result = launcher->resolve("Broken", resolved);
    EXPECT_EQ(result.code, SupervisorErrorCode::NOT_FOUND);
    EXPECT_NE(result.error_message.find("Missing Driver"), std::string::npos);
}

/******************************************************************************
 * Start / Stop
 ******************************************************************************/

TEST_F(ProfileLauncherTest, StartProfileRecordsSession) {
    expect_profile(make_profile("Simulators"), {"Telescope Simulator", "CCD Simulator"});

    auto result = launcher->start_profile("Simulators");
    ASSERT_TRUE(result.success) << result.error_message;

    EXPECT_EQ(launcher->session().active_profile, std::optional<std::string>("Simulators"));
    EXPECT_EQ(supervisor->running_drivers().size(), 2u);
    EXPECT_EQ(supervisor->port(), 7624);
    EXPECT_FALSE(supervisor->auto_connect_pending());
}

TEST_F(ProfileLauncherTest, StartEmptyProfileIsRejected) {
    expect_profile(make_profile("Empty"), {});

    auto result = launcher->start_profile("Empty");
    EXPECT_EQ(result.code, SupervisorErrorCode::INVALID_ARGUMENT);
    EXPECT_FALSE(supervisor->is_running());
    EXPECT_FALSE(launcher->session().active_profile.has_value());
}

TEST_F(ProfileLauncherTest, SecondStartKeepsFirstSession) {
    expect_profile(make_profile("Simulators"), {"CCD Simulator"});
    expect_profile(make_profile("Other", 7625), {"Focuser Simulator"});

    ASSERT_TRUE(launcher->start_profile("Simulators").success);
    auto result = launcher->start_profile("Other");

    EXPECT_EQ(result.code, SupervisorErrorCode::ALREADY_RUNNING);
    EXPECT_EQ(launcher->session().active_profile, std::optional<std::string>("Simulators"));
}

TEST_F(ProfileLauncherTest, StopClearsSession) {
    expect_profile(make_profile("Simulators"), {"CCD Simulator"});
    ASSERT_TRUE(launcher->start_profile("Simulators").success);

    launcher->stop();

    EXPECT_FALSE(launcher->session().active_profile.has_value());
    EXPECT_FALSE(supervisor->is_running());
}

TEST_F(ProfileLauncherTest, AutoconnectProfileSchedulesSweep) {
    std::atomic<int> calls{0};
    EXPECT_CALL(*connector, connect(_, 7624, _)).WillRepeatedly(Invoke([&](const driver::DriverDescriptor &, int,
                                                                           std::string &) {
        ++calls;
        return true;
    }));
    expect_profile(make_profile("Simulators", 7624, false, true), {"Telescope Simulator", "CCD Simulator"});

    ASSERT_TRUE(launcher->start_profile("Simulators").success);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (calls.load() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(calls.load(), 2);
}

/******************************************************************************
 * Autostart
 ******************************************************************************/

TEST_F(ProfileLauncherTest, AutostartStartsFlaggedProfile) {
    ON_CALL(store, list_profiles())
        .WillByDefault(Return(std::vector<profile::Profile>{make_profile("Idle"), make_profile("Boot", 7624, true)}));
    expect_profile(make_profile("Boot", 7624, true), {"Focuser Simulator"});

    SupervisorResult result;
    ASSERT_TRUE(launcher->autostart(result));
    EXPECT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(launcher->session().active_profile, std::optional<std::string>("Boot"));
}

TEST_F(ProfileLauncherTest, AutostartWithoutFlaggedProfile) {
    ON_CALL(store, list_profiles()).WillByDefault(Return(std::vector<profile::Profile>{make_profile("Idle")}));

    SupervisorResult result;
    EXPECT_FALSE(launcher->autostart(result));
    EXPECT_FALSE(supervisor->is_running());
}

/******************************************************************************
 * Custom drivers
 ******************************************************************************/

TEST_F(ProfileLauncherTest, ReloadCustomDriversReplacesOverlay) {
    auto custom = make_descriptor("My Focuser", "indi_my_focuser", "Focusers");
    EXPECT_CALL(store, get_custom_drivers())
        .WillOnce(Return(std::vector<driver::DriverDescriptor>{custom}))
        .WillOnce(Return(std::vector<driver::DriverDescriptor>{}));

    launcher->reload_custom_drivers();
    ASSERT_TRUE(catalog.by_label("My Focuser").has_value());
    EXPECT_EQ(catalog.custom_count(), 1u);

    launcher->reload_custom_drivers();
    EXPECT_FALSE(catalog.by_label("My Focuser").has_value());
    EXPECT_EQ(catalog.custom_count(), 0u);
}
