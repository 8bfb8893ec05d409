#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "server/driver_connector.hpp"

namespace indiweb::tests {

class MockDriverConnector : public server::IDriverConnector {
public:
    MOCK_METHOD(bool, connect, (const driver::DriverDescriptor &, int, std::string &), (override));
    MOCK_METHOD(bool, list_devices, (int, std::vector<server::DeviceStatus> &, std::string &), (override));
};

}  // namespace indiweb::tests
