#pragma once

#include <optional>
#include <string>
#include <vector>

#include "driver/driver_descriptor.hpp"

namespace indiweb {
namespace profile {

struct Profile {
    std::string name;
    int port = 7624;
    bool autostart = false;
    bool autoconnect = false;
};

// Interface to the persisted profiles to enable mocking
/**
 * A profile is a named set of driver labels plus launch options. Remote
 * drivers are kept as one comma-joined endpoint list per profile
 * ("CCD Simulator@host:7624,Telescope Simulator@host").
 *
 * Custom drivers are user supplied descriptors that are merged into the
 * driver catalog's overlay.
 */
class IProfileStore {
public:
    virtual ~IProfileStore() = default;

    // Queries
    virtual std::vector<Profile> list_profiles() const = 0;
    virtual std::optional<Profile> get_profile(const std::string &name) const = 0;
    virtual std::vector<std::string> get_profile_driver_labels(const std::string &name) const = 0;
    virtual std::optional<std::string> get_profile_remote_drivers(const std::string &name) const = 0;
    virtual std::vector<driver::DriverDescriptor> get_custom_drivers() const = 0;

    // Mutations (return false and set error on failure)
    virtual bool add_profile(const std::string &name, std::string &error) = 0;
    virtual bool delete_profile(const std::string &name, std::string &error) = 0;
    virtual bool update_profile(const Profile &profile, std::string &error) = 0;
    virtual bool save_profile_drivers(const std::string &name, const std::vector<std::string> &labels,
                                      const std::optional<std::string> &remote_drivers, std::string &error) = 0;
    virtual bool save_custom_driver(const driver::DriverDescriptor &descriptor, std::string &error) = 0;
};

}  // namespace profile
}  // namespace indiweb
