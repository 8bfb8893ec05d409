/**
 * control_channel_test.cpp - ControlChannel unit tests
 *
 * Tests:
 * - Directive grammar for local, skeleton and remote drivers
 * - Rejection of fields the grammar cannot carry
 * - open() against missing paths and FIFOs without a reader
 * - Writes reaching a FIFO reader, broken pipe after the reader leaves
 */

#include "server/control_channel.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "test_helpers.hpp"

using namespace indiweb::server;
using indiweb::driver::DriverDescriptor;
using indiweb::driver::make_remote_descriptor;
using indiweb::tests::make_descriptor;
using indiweb::tests::TempDir;

/******************************************************************************
 * Grammar
 ******************************************************************************/

TEST(ControlChannelFormatTest, StartLocalDriver) {
    std::string error;
    auto line = ControlChannel::format_start(make_descriptor("CCD Simulator", "indi_simulator_ccd"), error);
    ASSERT_TRUE(line.has_value()) << error;
    EXPECT_EQ(*line, "start indi_simulator_ccd -n \"CCD Simulator\"\n");
}

TEST(ControlChannelFormatTest, StartWithSkeleton) {
    auto descriptor = make_descriptor("GPS Simulator", "indi_simulator_gps");
    descriptor.skeleton = "/usr/share/indi/gps_sk.xml";

    std::string error;
    auto line = ControlChannel::format_start(descriptor, error);
    ASSERT_TRUE(line.has_value()) << error;
    EXPECT_EQ(*line, "start indi_simulator_gps -n \"GPS Simulator\" -s \"/usr/share/indi/gps_sk.xml\"\n");
}

TEST(ControlChannelFormatTest, StopLocalDriverOmitsSkeleton) {
    auto descriptor = make_descriptor("GPS Simulator", "indi_simulator_gps");
    descriptor.skeleton = "/usr/share/indi/gps_sk.xml";

    std::string error;
    auto line = ControlChannel::format_stop(descriptor, error);
    ASSERT_TRUE(line.has_value()) << error;
    EXPECT_EQ(*line, "stop indi_simulator_gps -n \"GPS Simulator\"\n");
}

TEST(ControlChannelFormatTest, RemoteDriverHasNoOptions) {
    auto remote = make_remote_descriptor("Telescope Simulator@192.168.1.10:7624");
    std::string error;

    auto start = ControlChannel::format_start(remote, error);
    ASSERT_TRUE(start.has_value()) << error;
    EXPECT_EQ(*start, "start Telescope Simulator@192.168.1.10:7624\n");

    auto stop = ControlChannel::format_stop(remote, error);
    ASSERT_TRUE(stop.has_value()) << error;
    EXPECT_EQ(*stop, "stop Telescope Simulator@192.168.1.10:7624\n");
}

TEST(ControlChannelFormatTest, RejectsUnencodableFields) {
    std::string error;
    EXPECT_FALSE(ControlChannel::format_start(make_descriptor("Bad \"Label\"", "indi_x"), error).has_value());
    EXPECT_FALSE(error.empty());

    EXPECT_FALSE(ControlChannel::format_start(make_descriptor("Line\nBreak", "indi_x"), error).has_value());
    EXPECT_FALSE(ControlChannel::format_start(make_descriptor("Empty", ""), error).has_value());
    EXPECT_FALSE(ControlChannel::format_start(make_descriptor("Spaced", "indi x"), error).has_value());

    auto descriptor = make_descriptor("Skel", "indi_x");
    descriptor.skeleton = "/tmp/a\"b.xml";
    EXPECT_FALSE(ControlChannel::format_start(descriptor, error).has_value());
}

TEST(ControlChannelFormatTest, LocalDriverRejectsAtSignAndEmptyLabel) {
    // A '@' anywhere on the line turns it into a remote driver for indiserver
    std::string error;
    EXPECT_FALSE(ControlChannel::format_start(make_descriptor("Guider@Pier", "indi_simulator_ccd"), error).has_value());
    EXPECT_NE(error.find("Guider@Pier"), std::string::npos);
    EXPECT_FALSE(ControlChannel::format_stop(make_descriptor("Guider@Pier", "indi_simulator_ccd"), error).has_value());

    auto descriptor = make_descriptor("Guider", "indi_simulator_ccd");
    descriptor.skeleton = "/home/astro@pier/sk.xml";
    EXPECT_FALSE(ControlChannel::format_start(descriptor, error).has_value());

    error.clear();
    EXPECT_FALSE(ControlChannel::format_start(make_descriptor("", "indi_simulator_ccd"), error).has_value());
    EXPECT_FALSE(error.empty());

    // The endpoint of a remote driver is the one place '@' belongs
    auto remote = make_remote_descriptor("Guider@pier.local:7624");
    EXPECT_TRUE(ControlChannel::format_start(remote, error).has_value()) << error;
}

/******************************************************************************
 * FIFO I/O
 ******************************************************************************/

class ControlChannelFifoTest : public ::testing::Test {
protected:
    TempDir dir{"indiweb_channel_test"};
    std::string fifo_path;
    int reader_fd = -1;

    void SetUp() override {
        fifo_path = dir.file("indiFIFO");
        ASSERT_EQ(::mkfifo(fifo_path.c_str(), 0666), 0);
    }

    void TearDown() override { close_reader(); }

    void open_reader() {
        reader_fd = ::open(fifo_path.c_str(), O_RDONLY | O_NONBLOCK);
        ASSERT_GE(reader_fd, 0);
    }

    void close_reader() {
        if (reader_fd >= 0) {
            ::close(reader_fd);
            reader_fd = -1;
        }
    }

    std::string drain() {
        std::string data;
        char buf[512];
        ssize_t n;
        while ((n = ::read(reader_fd, buf, sizeof(buf))) > 0) {
            data.append(buf, static_cast<size_t>(n));
        }
        return data;
    }
};

TEST_F(ControlChannelFifoTest, OpenFailsWhenPathMissing) {
    ControlChannel channel(dir.file("missing"));
    EXPECT_FALSE(channel.open());
    EXPECT_FALSE(channel.is_open());
    EXPECT_NE(channel.last_error().find("not found"), std::string::npos);
}

TEST_F(ControlChannelFifoTest, OpenFailsWithoutReader) {
    ControlChannel channel(fifo_path);
    EXPECT_FALSE(channel.open());
    EXPECT_NE(channel.last_error().find("No reader"), std::string::npos);
}

TEST_F(ControlChannelFifoTest, SendFailsWhenNotOpen) {
    ControlChannel channel(fifo_path);
    EXPECT_FALSE(channel.send_start(make_descriptor("CCD Simulator", "indi_simulator_ccd")));
    EXPECT_FALSE(channel.last_error().empty());
}

TEST_F(ControlChannelFifoTest, DirectivesReachReaderInOrder) {
    open_reader();

    ControlChannel channel(fifo_path);
    ASSERT_TRUE(channel.open()) << channel.last_error();

    EXPECT_TRUE(channel.send_start(make_descriptor("CCD Simulator", "indi_simulator_ccd")));
    EXPECT_TRUE(channel.send_start(make_descriptor("Telescope Simulator", "indi_simulator_telescope")));
    EXPECT_TRUE(channel.send_stop(make_descriptor("CCD Simulator", "indi_simulator_ccd")));

    EXPECT_EQ(drain(),
              "start indi_simulator_ccd -n \"CCD Simulator\"\n"
              "start indi_simulator_telescope -n \"Telescope Simulator\"\n"
              "stop indi_simulator_ccd -n \"CCD Simulator\"\n");
}

TEST_F(ControlChannelFifoTest, InvalidDescriptorWritesNothing) {
    open_reader();

    ControlChannel channel(fifo_path);
    ASSERT_TRUE(channel.open());
    EXPECT_FALSE(channel.send_start(make_descriptor("Bad \"Label\"", "indi_x")));
    EXPECT_EQ(drain(), "");
}

TEST_F(ControlChannelFifoTest, BrokenPipeAfterReaderLeaves) {
    open_reader();

    ControlChannel channel(fifo_path);
    ASSERT_TRUE(channel.open());
    close_reader();

    EXPECT_FALSE(channel.send_start(make_descriptor("CCD Simulator", "indi_simulator_ccd")));
    EXPECT_NE(channel.last_error().find("Broken pipe"), std::string::npos);
}

TEST_F(ControlChannelFifoTest, CloseIsIdempotent) {
    open_reader();

    ControlChannel channel(fifo_path);
    ASSERT_TRUE(channel.open());
    channel.close();
    channel.close();
    EXPECT_FALSE(channel.is_open());
}
