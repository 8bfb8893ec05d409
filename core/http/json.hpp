#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "driver/driver_descriptor.hpp"
#include "profile/profile_store.hpp"
#include "server/server_supervisor.hpp"

namespace indiweb {
namespace http {

/**
 * @brief JSON encoding utilities for the manager's API types
 *
 * Driver descriptors use the field names of the INDI driver definition
 * files where one exists (name, label, version, family, binary).
 */

nlohmann::json encode_driver(const driver::DriverDescriptor &descriptor);
nlohmann::json encode_drivers(const std::vector<driver::DriverDescriptor> &descriptors);
nlohmann::json encode_profile(const profile::Profile &profile);

// Running set sorted by label
nlohmann::json encode_running_drivers(const server::RunningDrivers &running);

// [{"device": ..., "connected": ...}] in the given order
nlohmann::json encode_devices(const std::vector<server::DeviceStatus> &devices);

// Decode functions for incoming requests

// PUT /api/profiles/{name}: keys absent from json keep the value in profile
bool decode_profile_update(const nlohmann::json &json, profile::Profile &profile, std::string &error);

// POST /api/profiles/{name}/drivers: {"drivers": [labels], "remote": "a@h,b@h"}
bool decode_profile_drivers(const nlohmann::json &json, std::vector<std::string> &labels,
                            std::optional<std::string> &remote, std::string &error);

// POST /api/profiles/custom
bool decode_custom_driver(const nlohmann::json &json, driver::DriverDescriptor &descriptor, std::string &error);

}  // namespace http
}  // namespace indiweb
