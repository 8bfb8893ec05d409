#pragma once

#include <optional>
#include <string>

namespace indiweb {
namespace driver {

constexpr const char *kRemoteFamily = "Remote";
constexpr const char *kRemoteVersion = "1.0";

// Launch metadata for one INDI driver.
// The label is the external identity: HTTP routes, profiles and the
// supervisor's running set are all keyed by it.
struct DriverDescriptor {
    std::string name;                 // Driver name as declared in the definition file
    std::string label;                // Unique display label, e.g. "CCD Simulator"
    std::string version;              // e.g. "1.0"
    std::string family;               // Presentation group, e.g. "CCDs", "Telescopes"
    std::string binary;               // Executable started by indiserver, or remote endpoint
    std::optional<std::string> skeleton;  // Property skeleton file for custom drivers

    // Remote drivers are addressed as device@host[:port]
    bool is_remote() const { return binary.find('@') != std::string::npos; }

    // INDI device name the driver is expected to publish
    std::string device_name() const {
        if (is_remote()) {
            return binary.substr(0, binary.find('@'));
        }
        return label;
    }

    bool operator==(const DriverDescriptor &other) const {
        return name == other.name && label == other.label && version == other.version &&
               family == other.family && binary == other.binary && skeleton == other.skeleton;
    }
    bool operator!=(const DriverDescriptor &other) const { return !(*this == other); }
};

// Remote descriptors reuse the endpoint string for name, label and binary
inline DriverDescriptor make_remote_descriptor(const std::string &endpoint) {
    DriverDescriptor descriptor;
    descriptor.name = endpoint;
    descriptor.label = endpoint;
    descriptor.version = kRemoteVersion;
    descriptor.family = kRemoteFamily;
    descriptor.binary = endpoint;
    return descriptor;
}

}  // namespace driver
}  // namespace indiweb
