/**
 * driver_connector_test.cpp - XmlSwitchConnector unit tests
 *
 * A local TCP listener plays the device server: it accepts one client and
 * either records everything the client sends before closing, or answers
 * the first request with canned XML.
 */

#include "server/driver_connector.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "test_helpers.hpp"

using namespace indiweb::server;
using indiweb::driver::make_remote_descriptor;
using indiweb::tests::make_descriptor;

namespace {

// Bound, listening IPv4 socket on an ephemeral port
class LocalListener {
public:
    LocalListener() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
        ::listen(fd_, 4);

        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }
    ~LocalListener() { close(); }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    // Accept one client and read until it closes
    std::string accept_and_read() {
        int client = ::accept(fd_, nullptr, nullptr);
        if (client < 0) {
            return {};
        }
        std::string data;
        char buf[256];
        ssize_t n;
        while ((n = ::read(client, buf, sizeof(buf))) > 0) {
            data.append(buf, static_cast<size_t>(n));
        }
        ::close(client);
        return data;
    }

    // Accept one client, read its request, answer with reply and close
    std::string accept_and_reply(const std::string &reply) {
        int client = ::accept(fd_, nullptr, nullptr);
        if (client < 0) {
            return {};
        }
        std::string request;
        char buf[256];
        ssize_t n = ::read(client, buf, sizeof(buf));
        if (n > 0) {
            request.assign(buf, static_cast<size_t>(n));
        }
        ssize_t written = ::write(client, reply.data(), reply.size());
        (void)written;
        ::close(client);
        return request;
    }

    int port() const { return port_; }

private:
    int fd_ = -1;
    int port_ = 0;
};

}  // namespace

TEST(XmlSwitchConnectorTest, ConnectMessageSelectsConnectSwitch) {
    EXPECT_EQ(XmlSwitchConnector::build_connect_message("CCD Simulator"),
              "<newSwitchVector device=\"CCD Simulator\" name=\"CONNECTION\">\n"
              "  <oneSwitch name=\"CONNECT\">On</oneSwitch>\n"
              "</newSwitchVector>\n");
}

TEST(XmlSwitchConnectorTest, DeviceNameIsEscaped) {
    std::string message = XmlSwitchConnector::build_connect_message("A&B <\"x\">");
    EXPECT_NE(message.find("device=\"A&amp;B &lt;&quot;x&quot;&gt;\""), std::string::npos);
}

TEST(XmlSwitchConnectorTest, SendsConnectToLocalDriver) {
    LocalListener listener;
    std::string received;
    std::thread server([&] { received = listener.accept_and_read(); });

    XmlSwitchConnector connector("127.0.0.1", 1000);
    std::string error;
    EXPECT_TRUE(connector.connect(make_descriptor("Telescope Simulator", "indi_simulator_telescope"),
                                  listener.port(), error))
        << error;
    server.join();

    EXPECT_EQ(received, XmlSwitchConnector::build_connect_message("Telescope Simulator"));
}

TEST(XmlSwitchConnectorTest, RemoteDriverUsesDevicePartOfEndpoint) {
    LocalListener listener;
    std::string received;
    std::thread server([&] { received = listener.accept_and_read(); });

    XmlSwitchConnector connector("127.0.0.1", 1000);
    std::string error;
    EXPECT_TRUE(connector.connect(make_remote_descriptor("Focuser Simulator@10.0.0.2:7625"), listener.port(), error))
        << error;
    server.join();

    EXPECT_NE(received.find("device=\"Focuser Simulator\""), std::string::npos);
}

TEST(XmlSwitchConnectorTest, RefusedConnectionReportsError) {
    int port = 0;
    {
        LocalListener listener;
        port = listener.port();
    }

    XmlSwitchConnector connector("127.0.0.1", 500);
    std::string error;
    EXPECT_FALSE(connector.connect(make_descriptor("CCD Simulator", "indi_simulator_ccd"), port, error));
    EXPECT_FALSE(error.empty());
}

TEST(XmlSwitchConnectorTest, UnresolvableHostReportsError) {
    XmlSwitchConnector connector("no-such-host.invalid", 200);
    std::string error;
    EXPECT_FALSE(connector.connect(make_descriptor("CCD Simulator", "indi_simulator_ccd"), 7624, error));
    EXPECT_FALSE(error.empty());
}

/******************************************************************************
 * Device listing
 ******************************************************************************/

TEST(XmlSwitchConnectorTest, ListsDefinedDevicesWithConnectionState) {
    const std::string reply =
        "<defSwitchVector device=\"Telescope Simulator\" name=\"CONNECTION\" state=\"Idle\" perm=\"rw\" "
        "rule=\"OneOfMany\">\n"
        "  <defSwitch name=\"CONNECT\">\nOff\n</defSwitch>\n"
        "  <defSwitch name=\"DISCONNECT\">\nOn\n</defSwitch>\n"
        "</defSwitchVector>\n"
        "<defSwitchVector device=\"CCD Simulator\" name=\"CONNECTION\" state=\"Ok\" perm=\"rw\" "
        "rule=\"OneOfMany\">\n"
        "  <defSwitch name=\"CONNECT\">\nOn\n</defSwitch>\n"
        "  <defSwitch name=\"DISCONNECT\">\nOff\n</defSwitch>\n"
        "</defSwitchVector>\n"
        "<defNumberVector device=\"Focuser Simulator\" name=\"ABS_FOCUS_POSITION\" state=\"Idle\" perm=\"rw\">\n"
        "  <defNumber name=\"FOCUS_ABSOLUTE_POSITION\" format=\"%6.0f\" min=\"0\" max=\"100000\" "
        "step=\"1000\">\n50000\n</defNumber>\n"
        "</defNumberVector>\n"
        "<message device=\"Dome Simulator\" message=\"not a definition\"/>\n";

    LocalListener listener;
    std::string request;
    std::thread server([&] { request = listener.accept_and_reply(reply); });

    XmlSwitchConnector connector("127.0.0.1", 2000);
    std::vector<DeviceStatus> devices;
    std::string error;
    ASSERT_TRUE(connector.list_devices(listener.port(), devices, error)) << error;
    server.join();

    EXPECT_NE(request.find("<getProperties version=\"1.7\"/>"), std::string::npos);

    ASSERT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0].device, "CCD Simulator");
    EXPECT_TRUE(devices[0].connected);
    EXPECT_EQ(devices[1].device, "Focuser Simulator");
    EXPECT_FALSE(devices[1].connected);
    EXPECT_EQ(devices[2].device, "Telescope Simulator");
    EXPECT_FALSE(devices[2].connected);
}

TEST(XmlSwitchConnectorTest, ListIsEmptyWhenServerHasNoDevices) {
    LocalListener listener;
    std::thread server([&] { listener.accept_and_reply(""); });

    XmlSwitchConnector connector("127.0.0.1", 1000);
    std::vector<DeviceStatus> devices{DeviceStatus{"stale", true}};
    std::string error;
    ASSERT_TRUE(connector.list_devices(listener.port(), devices, error)) << error;
    server.join();

    EXPECT_TRUE(devices.empty());
}

TEST(XmlSwitchConnectorTest, ListFailsWhenServerUnreachable) {
    int port = 0;
    {
        LocalListener listener;
        port = listener.port();
    }

    XmlSwitchConnector connector("127.0.0.1", 500);
    std::vector<DeviceStatus> devices;
    std::string error;
    EXPECT_FALSE(connector.list_devices(port, devices, error));
    EXPECT_FALSE(error.empty());
}
