#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "profile/profile_store.hpp"

namespace indiweb {
namespace profile {

// Profile store persisted as a single YAML document.
//
// profiles:
//   - name: Simulators
//     port: 7624
//     autostart: false
//     autoconnect: false
//     drivers: [Telescope Simulator, CCD Simulator, Focuser Simulator]
//     remote: "Camera@192.168.1.10:7624"
// custom_drivers:
//   - label: My Focuser
//     name: My Focuser
//     family: Focusers
//     binary: indi_my_focuser
//     version: "1.0"
//
// Every mutation rewrites the whole file (temp file + rename).
class YamlProfileStore : public IProfileStore {
public:
    // New profiles get default_port until updated
    explicit YamlProfileStore(const std::string &path, int default_port = 7624);

    // Read the file, or seed the default Simulators profile if it does not exist
    bool open(std::string &error);

    std::vector<Profile> list_profiles() const override;
    std::optional<Profile> get_profile(const std::string &name) const override;
    std::vector<std::string> get_profile_driver_labels(const std::string &name) const override;
    std::optional<std::string> get_profile_remote_drivers(const std::string &name) const override;
    std::vector<driver::DriverDescriptor> get_custom_drivers() const override;

    bool add_profile(const std::string &name, std::string &error) override;
    bool delete_profile(const std::string &name, std::string &error) override;
    bool update_profile(const Profile &profile, std::string &error) override;
    bool save_profile_drivers(const std::string &name, const std::vector<std::string> &labels,
                              const std::optional<std::string> &remote_drivers, std::string &error) override;
    bool save_custom_driver(const driver::DriverDescriptor &descriptor, std::string &error) override;

    const std::string &path() const { return path_; }

private:
    struct ProfileRecord {
        Profile profile;
        std::vector<std::string> drivers;
        std::optional<std::string> remote;
    };

    std::string path_;
    int default_port_;
    mutable std::mutex mutex_;
    std::vector<ProfileRecord> profiles_;  // File order
    std::vector<driver::DriverDescriptor> custom_drivers_;

    void seed_defaults_locked();
    bool load_locked(std::string &error);
    // Writes the given state; callers publish it only if this succeeds
    bool save_locked(const std::vector<ProfileRecord> &profiles,
                     const std::vector<driver::DriverDescriptor> &custom_drivers, std::string &error) const;

    const ProfileRecord *find_locked(const std::string &name) const;
};

}  // namespace profile
}  // namespace indiweb
