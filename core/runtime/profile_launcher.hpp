#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "driver/driver_catalog.hpp"
#include "profile/profile_store.hpp"
#include "server/server_supervisor.hpp"

namespace indiweb {
namespace runtime {

// What this process last launched. Cleared by stop().
struct Session {
    std::optional<std::string> active_profile;
};

// Result of resolving a profile into launchable descriptors
struct ResolvedProfile {
    profile::Profile profile;
    std::vector<driver::DriverDescriptor> drivers;  // Local drivers in profile order, then remote
};

// ProfileLauncher turns stored profiles into supervisor calls.
//
// It owns the session state (active profile) so that the HTTP layer and
// the autostart path observe the same view of what was launched.
class ProfileLauncher {
public:
    ProfileLauncher(driver::DriverCatalog &catalog, profile::IProfileStore &store, server::ServerSupervisor &supervisor,
                    std::string config_dir, std::chrono::milliseconds auto_connect_delay);

    // Labels through the catalog plus one descriptor per remote endpoint.
    // NOT_FOUND for an unknown profile or label.
    server::SupervisorResult resolve(const std::string &profile_name, ResolvedProfile &resolved) const;

    server::SupervisorResult start_profile(const std::string &profile_name);
    void stop();

    // Start the first profile flagged autostart. Returns false if none is.
    bool autostart(server::SupervisorResult &result);

    // Replace the catalog overlay with the store's custom drivers
    void reload_custom_drivers();

    Session session() const;

    // Split a comma-joined endpoint list, trimming whitespace and dropping empties
    static std::vector<std::string> split_remote_list(const std::string &remote);

private:
    driver::DriverCatalog &catalog_;
    profile::IProfileStore &store_;
    server::ServerSupervisor &supervisor_;
    std::string config_dir_;
    std::chrono::milliseconds auto_connect_delay_;

    mutable std::mutex session_mutex_;
    Session session_;
};

}  // namespace runtime
}  // namespace indiweb
