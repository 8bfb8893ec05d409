#include "profile_launcher.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "logging/logger.hpp"

namespace indiweb {
namespace runtime {

using server::SupervisorErrorCode;
using server::SupervisorResult;

namespace {
std::string trim(const std::string &value) {
    auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}
}  // namespace

ProfileLauncher::ProfileLauncher(driver::DriverCatalog &catalog, profile::IProfileStore &store,
                                 server::ServerSupervisor &supervisor, std::string config_dir,
                                 std::chrono::milliseconds auto_connect_delay)
    : catalog_(catalog),
      store_(store),
      supervisor_(supervisor),
      config_dir_(std::move(config_dir)),
      auto_connect_delay_(auto_connect_delay) {}

std::vector<std::string> ProfileLauncher::split_remote_list(const std::string &remote) {
    std::vector<std::string> endpoints;
    std::stringstream stream(remote);
    std::string item;
    while (std::getline(stream, item, ',')) {
        std::string endpoint = trim(item);
        if (!endpoint.empty()) {
            endpoints.push_back(endpoint);
        }
    }
    return endpoints;
}

SupervisorResult ProfileLauncher::resolve(const std::string &profile_name, ResolvedProfile &resolved) const {
    auto profile = store_.get_profile(profile_name);
    if (!profile) {
        return SupervisorResult::failure(SupervisorErrorCode::NOT_FOUND, "Profile not found: " + profile_name);
    }

    resolved.profile = *profile;
    resolved.drivers.clear();

    for (const auto &label : store_.get_profile_driver_labels(profile_name)) {
        auto descriptor = catalog_.by_label(label);
        if (!descriptor) {
            return SupervisorResult::failure(SupervisorErrorCode::NOT_FOUND,
                                             "Profile '" + profile_name + "' references unknown driver: " + label);
        }
        resolved.drivers.push_back(*descriptor);
    }

    auto remote = store_.get_profile_remote_drivers(profile_name);
    if (remote) {
        for (const auto &endpoint : split_remote_list(*remote)) {
            resolved.drivers.push_back(driver::make_remote_descriptor(endpoint));
        }
    }

    return SupervisorResult::ok();
}

SupervisorResult ProfileLauncher::start_profile(const std::string &profile_name) {
    ResolvedProfile resolved;
    auto result = resolve(profile_name, resolved);
    if (!result.success) {
        return result;
    }

    if (resolved.drivers.empty()) {
        return SupervisorResult::failure(SupervisorErrorCode::INVALID_ARGUMENT,
                                         "Profile '" + profile_name + "' has no drivers");
    }

    LOG_INFO("[Launcher] Starting profile '" << profile_name << "' on port " << resolved.profile.port << " with "
                                              << resolved.drivers.size() << " driver(s)");

    result = supervisor_.start(resolved.profile.port, resolved.drivers, config_dir_);
    if (!result.success) {
        LOG_ERROR("[Launcher] Profile '" << profile_name << "' failed: " << result.error_message);
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_.active_profile = profile_name;
    }

    if (resolved.profile.autoconnect) {
        auto scheduled = supervisor_.schedule_auto_connect(auto_connect_delay_);
        if (!scheduled.success) {
            LOG_WARN("[Launcher] Auto-connect not scheduled: " << scheduled.error_message);
        }
    }

    return SupervisorResult::ok();
}

void ProfileLauncher::stop() {
    supervisor_.stop();
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_.active_profile.reset();
}

bool ProfileLauncher::autostart(SupervisorResult &result) {
    for (const auto &profile : store_.list_profiles()) {
        if (profile.autostart) {
            LOG_INFO("[Launcher] Autostarting profile '" << profile.name << "'");
            result = start_profile(profile.name);
            return true;
        }
    }
    return false;
}

void ProfileLauncher::reload_custom_drivers() {
    catalog_.clear_custom();
    auto custom = store_.get_custom_drivers();
    catalog_.load_custom(custom);
    LOG_DEBUG("[Launcher] Custom driver overlay reloaded (" << custom.size() << " entries)");
}

Session ProfileLauncher::session() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_;
}

}  // namespace runtime
}  // namespace indiweb
