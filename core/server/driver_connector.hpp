#pragma once

#include <map>
#include <string>
#include <vector>

#include "driver/driver_descriptor.hpp"

namespace indiweb {
namespace server {

// A device published by the device server
struct DeviceStatus {
    std::string device;
    bool connected = false;  // CONNECTION.CONNECT is On
};

// Client side of the device server's XML protocol, an interface to enable mocking
class IDriverConnector {
public:
    virtual ~IDriverConnector() = default;

    // Ask the device server on port to switch the driver's CONNECTION
    // property to CONNECT=On. Returns false and sets error on failure.
    virtual bool connect(const driver::DriverDescriptor &descriptor, int port, std::string &error) = 0;

    // Send getProperties to the device server on port and list every device
    // that defines a property, sorted by name.
    virtual bool list_devices(int port, std::vector<DeviceStatus> &devices, std::string &error) = 0;
};

// Short-lived TCP client speaking the INDI client XML protocol.
// One connection per request: connect, send, (read,) close.
class XmlSwitchConnector : public IDriverConnector {
public:
    explicit XmlSwitchConnector(const std::string &host = "localhost", int timeout_ms = 1000);

    bool connect(const driver::DriverDescriptor &descriptor, int port, std::string &error) override;

    // Reads definitions until the server closes, goes quiet after its first
    // reply, or timeout_ms runs out
    bool list_devices(int port, std::vector<DeviceStatus> &devices, std::string &error) override;

    // The newSwitchVector message selecting CONNECTION.CONNECT for device
    static std::string build_connect_message(const std::string &device);

    const std::string &host() const { return host_; }
    int timeout_ms() const { return timeout_ms_; }

private:
    std::string host_;
    int timeout_ms_;

    int open_socket(int port, std::string &error) const;
    bool send_all(int fd, const std::string &data, std::string &error) const;
    bool read_definitions(int fd, std::map<std::string, bool> &devices, std::string &error) const;
};

}  // namespace server
}  // namespace indiweb
