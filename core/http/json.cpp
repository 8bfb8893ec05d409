#include "json.hpp"

#include <algorithm>

namespace indiweb {
namespace http {

nlohmann::json encode_driver(const driver::DriverDescriptor &descriptor) {
    nlohmann::json json = {{"name", descriptor.name},     {"label", descriptor.label},
                           {"version", descriptor.version}, {"family", descriptor.family},
                           {"binary", descriptor.binary},   {"remote", descriptor.is_remote()}};
    if (descriptor.skeleton) {
        json["skeleton"] = *descriptor.skeleton;
    } else {
        json["skeleton"] = nullptr;
    }
    return json;
}

nlohmann::json encode_drivers(const std::vector<driver::DriverDescriptor> &descriptors) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto &descriptor : descriptors) {
        array.push_back(encode_driver(descriptor));
    }
    return array;
}

nlohmann::json encode_profile(const profile::Profile &profile) {
    return {{"name", profile.name},
            {"port", profile.port},
            {"autostart", profile.autostart},
            {"autoconnect", profile.autoconnect}};
}

nlohmann::json encode_running_drivers(const server::RunningDrivers &running) {
    std::vector<driver::DriverDescriptor> sorted;
    sorted.reserve(running.size());
    for (const auto &entry : running) {
        sorted.push_back(entry.second);
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const driver::DriverDescriptor &a, const driver::DriverDescriptor &b) { return a.label < b.label; });
    return encode_drivers(sorted);
}

nlohmann::json encode_devices(const std::vector<server::DeviceStatus> &devices) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto &status : devices) {
        result.push_back({{"device", status.device}, {"connected", status.connected}});
    }
    return result;
}

bool decode_profile_update(const nlohmann::json &json, profile::Profile &profile, std::string &error) {
    try {
        if (json.contains("port")) {
            if (!json.at("port").is_number_integer()) {
                error = "'port' must be an integer";
                return false;
            }
            profile.port = json.at("port").get<int>();
        }
        if (json.contains("autostart")) {
            profile.autostart = json.at("autostart").get<bool>();
        }
        if (json.contains("autoconnect")) {
            profile.autoconnect = json.at("autoconnect").get<bool>();
        }
        return true;
    } catch (const std::exception &e) {
        error = std::string("JSON parse error: ") + e.what();
        return false;
    }
}

bool decode_profile_drivers(const nlohmann::json &json, std::vector<std::string> &labels,
                            std::optional<std::string> &remote, std::string &error) {
    try {
        if (!json.contains("drivers")) {
            error = "Missing 'drivers'";
            return false;
        }
        const auto &drivers_json = json.at("drivers");
        if (!drivers_json.is_array()) {
            error = "'drivers' must be an array of labels";
            return false;
        }
        labels.clear();
        for (const auto &label : drivers_json) {
            labels.push_back(label.get<std::string>());
        }

        remote.reset();
        if (json.contains("remote") && !json.at("remote").is_null()) {
            std::string value = json.at("remote").get<std::string>();
            if (!value.empty()) {
                remote = value;
            }
        }
        return true;
    } catch (const std::exception &e) {
        error = std::string("JSON parse error: ") + e.what();
        return false;
    }
}

bool decode_custom_driver(const nlohmann::json &json, driver::DriverDescriptor &descriptor, std::string &error) {
    try {
        if (!json.contains("label")) {
            error = "Missing 'label'";
            return false;
        }
        if (!json.contains("binary")) {
            error = "Missing 'binary'";
            return false;
        }

        descriptor.label = json.at("label").get<std::string>();
        descriptor.binary = json.at("binary").get<std::string>();
        descriptor.name = json.value("name", descriptor.label);
        descriptor.family = json.value("family", std::string("Custom"));
        descriptor.version = json.value("version", std::string("1.0"));
        if (json.contains("skeleton") && !json.at("skeleton").is_null()) {
            descriptor.skeleton = json.at("skeleton").get<std::string>();
        }

        if (descriptor.label.empty() || descriptor.binary.empty()) {
            error = "'label' and 'binary' must not be empty";
            return false;
        }
        return true;
    } catch (const std::exception &e) {
        error = std::string("JSON parse error: ") + e.what();
        return false;
    }
}

}  // namespace http
}  // namespace indiweb
