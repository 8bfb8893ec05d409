#include "yaml_profile_store.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>

#include "logging/logger.hpp"

namespace indiweb {
namespace profile {

namespace {
constexpr const char *kDefaultProfile = "Simulators";
constexpr int kDefaultPort = 7624;

void emit_profile(YAML::Emitter &out, const Profile &profile, const std::vector<std::string> &drivers,
                  const std::optional<std::string> &remote) {
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << profile.name;
    out << YAML::Key << "port" << YAML::Value << profile.port;
    out << YAML::Key << "autostart" << YAML::Value << profile.autostart;
    out << YAML::Key << "autoconnect" << YAML::Value << profile.autoconnect;
    out << YAML::Key << "drivers" << YAML::Value << YAML::BeginSeq;
    for (const auto &label : drivers) {
        out << label;
    }
    out << YAML::EndSeq;
    if (remote) {
        out << YAML::Key << "remote" << YAML::Value << *remote;
    }
    out << YAML::EndMap;
}

void emit_custom_driver(YAML::Emitter &out, const driver::DriverDescriptor &descriptor) {
    out << YAML::BeginMap;
    out << YAML::Key << "label" << YAML::Value << descriptor.label;
    out << YAML::Key << "name" << YAML::Value << descriptor.name;
    out << YAML::Key << "family" << YAML::Value << descriptor.family;
    out << YAML::Key << "binary" << YAML::Value << descriptor.binary;
    out << YAML::Key << "version" << YAML::Value << descriptor.version;
    if (descriptor.skeleton) {
        out << YAML::Key << "skeleton" << YAML::Value << *descriptor.skeleton;
    }
    out << YAML::EndMap;
}
}  // namespace

YamlProfileStore::YamlProfileStore(const std::string &path, int default_port)
    : path_(path), default_port_(default_port) {}

bool YamlProfileStore::open(std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!std::filesystem::exists(path_)) {
        LOG_INFO("[Profiles] " << path_ << " not found, creating default profile '" << kDefaultProfile << "'");
        seed_defaults_locked();

        std::filesystem::path parent = std::filesystem::path(path_).parent_path();
        std::error_code ec;
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        return save_locked(profiles_, custom_drivers_, error);
    }

    return load_locked(error);
}

void YamlProfileStore::seed_defaults_locked() {
    ProfileRecord simulators;
    simulators.profile.name = kDefaultProfile;
    simulators.profile.port = kDefaultPort;
    simulators.drivers = {"Telescope Simulator", "CCD Simulator", "Focuser Simulator"};

    profiles_.clear();
    profiles_.push_back(simulators);
    custom_drivers_.clear();
}

bool YamlProfileStore::load_locked(std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(path_);

        std::vector<ProfileRecord> profiles;
        if (yaml["profiles"]) {
            for (const auto &node : yaml["profiles"]) {
                ProfileRecord record;
                if (!node["name"]) {
                    error = "Profile entry missing 'name' in " + path_;
                    return false;
                }
                record.profile.name = node["name"].as<std::string>();
                record.profile.port = default_port_;
                if (node["port"]) {
                    record.profile.port = node["port"].as<int>();
                }
                if (node["autostart"]) {
                    record.profile.autostart = node["autostart"].as<bool>();
                }
                if (node["autoconnect"]) {
                    record.profile.autoconnect = node["autoconnect"].as<bool>();
                }
                if (node["drivers"]) {
                    for (const auto &label : node["drivers"]) {
                        record.drivers.push_back(label.as<std::string>());
                    }
                }
                if (node["remote"]) {
                    record.remote = node["remote"].as<std::string>();
                }
                profiles.push_back(record);
            }
        }

        std::vector<driver::DriverDescriptor> custom_drivers;
        if (yaml["custom_drivers"]) {
            for (const auto &node : yaml["custom_drivers"]) {
                driver::DriverDescriptor descriptor;
                if (!node["label"] || !node["binary"]) {
                    error = "Custom driver entry missing 'label' or 'binary' in " + path_;
                    return false;
                }
                descriptor.label = node["label"].as<std::string>();
                descriptor.binary = node["binary"].as<std::string>();
                descriptor.name = node["name"] ? node["name"].as<std::string>() : descriptor.label;
                descriptor.family = node["family"] ? node["family"].as<std::string>() : "Custom";
                descriptor.version = node["version"] ? node["version"].as<std::string>() : "1.0";
                if (node["skeleton"]) {
                    descriptor.skeleton = node["skeleton"].as<std::string>();
                }
                custom_drivers.push_back(descriptor);
            }
        }

        profiles_ = std::move(profiles);
        custom_drivers_ = std::move(custom_drivers);
        LOG_INFO("[Profiles] Loaded " << profiles_.size() << " profile(s) and " << custom_drivers_.size()
                                      << " custom driver(s) from " << path_);
        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open profile file: " + path_;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error in " + path_ + ": " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Profile load error: " + std::string(e.what());
        return false;
    }
}

bool YamlProfileStore::save_locked(const std::vector<ProfileRecord> &profiles,
                                   const std::vector<driver::DriverDescriptor> &custom_drivers,
                                   std::string &error) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "profiles" << YAML::Value << YAML::BeginSeq;
    for (const auto &record : profiles) {
        emit_profile(out, record.profile, record.drivers, record.remote);
    }
    out << YAML::EndSeq;
    out << YAML::Key << "custom_drivers" << YAML::Value << YAML::BeginSeq;
    for (const auto &descriptor : custom_drivers) {
        emit_custom_driver(out, descriptor);
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    if (!out.good()) {
        error = "YAML emit error: " + out.GetLastError();
        return false;
    }

    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::out | std::ios::trunc);
        if (!file) {
            error = "Cannot write " + tmp_path;
            return false;
        }
        file << out.c_str() << "\n";
        if (!file.good()) {
            error = "Write failed for " + tmp_path;
            return false;
        }
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        error = "Cannot replace " + path_;
        std::remove(tmp_path.c_str());
        return false;
    }
    return true;
}

const YamlProfileStore::ProfileRecord *YamlProfileStore::find_locked(const std::string &name) const {
    auto it = std::find_if(profiles_.begin(), profiles_.end(),
                           [&name](const ProfileRecord &record) { return record.profile.name == name; });
    return it == profiles_.end() ? nullptr : &*it;
}

std::vector<Profile> YamlProfileStore::list_profiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Profile> result;
    result.reserve(profiles_.size());
    for (const auto &record : profiles_) {
        result.push_back(record.profile);
    }
    return result;
}

std::optional<Profile> YamlProfileStore::get_profile(const std::string &name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const ProfileRecord *record = find_locked(name);
    if (record == nullptr) {
        return std::nullopt;
    }
    return record->profile;
}

std::vector<std::string> YamlProfileStore::get_profile_driver_labels(const std::string &name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const ProfileRecord *record = find_locked(name);
    if (record == nullptr) {
        return {};
    }
    return record->drivers;
}

std::optional<std::string> YamlProfileStore::get_profile_remote_drivers(const std::string &name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const ProfileRecord *record = find_locked(name);
    if (record == nullptr || !record->remote || record->remote->empty()) {
        return std::nullopt;
    }
    return record->remote;
}

std::vector<driver::DriverDescriptor> YamlProfileStore::get_custom_drivers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return custom_drivers_;
}

bool YamlProfileStore::add_profile(const std::string &name, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (name.empty()) {
        error = "Profile name must not be empty";
        return false;
    }
    if (find_locked(name) != nullptr) {
        error = "Profile already exists: " + name;
        return false;
    }

    auto profiles = profiles_;
    ProfileRecord record;
    record.profile.name = name;
    record.profile.port = default_port_;
    profiles.push_back(record);

    if (!save_locked(profiles, custom_drivers_, error)) {
        return false;
    }
    profiles_ = std::move(profiles);
    LOG_INFO("[Profiles] Added profile '" << name << "'");
    return true;
}

bool YamlProfileStore::delete_profile(const std::string &name, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (find_locked(name) == nullptr) {
        error = "Profile not found: " + name;
        return false;
    }

    auto profiles = profiles_;
    profiles.erase(std::remove_if(profiles.begin(), profiles.end(),
                                  [&name](const ProfileRecord &record) { return record.profile.name == name; }),
                   profiles.end());

    if (!save_locked(profiles, custom_drivers_, error)) {
        return false;
    }
    profiles_ = std::move(profiles);
    LOG_INFO("[Profiles] Deleted profile '" << name << "'");
    return true;
}

bool YamlProfileStore::update_profile(const Profile &profile, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (profile.port < 1 || profile.port > 65535) {
        error = "Port must be between 1 and 65535";
        return false;
    }

    auto profiles = profiles_;
    auto it = std::find_if(profiles.begin(), profiles.end(),
                           [&profile](const ProfileRecord &record) { return record.profile.name == profile.name; });
    if (it == profiles.end()) {
        error = "Profile not found: " + profile.name;
        return false;
    }

    // Only one profile may autostart
    if (profile.autostart) {
        for (auto &record : profiles) {
            record.profile.autostart = false;
        }
    }
    it->profile = profile;

    if (!save_locked(profiles, custom_drivers_, error)) {
        return false;
    }
    profiles_ = std::move(profiles);
    return true;
}

bool YamlProfileStore::save_profile_drivers(const std::string &name, const std::vector<std::string> &labels,
                                            const std::optional<std::string> &remote_drivers, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto profiles = profiles_;
    auto it = std::find_if(profiles.begin(), profiles.end(),
                           [&name](const ProfileRecord &record) { return record.profile.name == name; });
    if (it == profiles.end()) {
        // Saving drivers for an unknown profile creates it
        ProfileRecord record;
        record.profile.name = name;
        record.profile.port = default_port_;
        profiles.push_back(record);
        it = profiles.end() - 1;
    }

    it->drivers.clear();
    for (const auto &label : labels) {
        if (std::find(it->drivers.begin(), it->drivers.end(), label) == it->drivers.end()) {
            it->drivers.push_back(label);
        }
    }
    it->remote = remote_drivers;

    if (!save_locked(profiles, custom_drivers_, error)) {
        return false;
    }
    profiles_ = std::move(profiles);
    LOG_INFO("[Profiles] Saved " << labels.size() << " driver(s) for profile '" << name << "'");
    return true;
}

bool YamlProfileStore::save_custom_driver(const driver::DriverDescriptor &descriptor, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (descriptor.label.empty() || descriptor.binary.empty()) {
        error = "Custom driver requires a label and a binary";
        return false;
    }

    auto custom_drivers = custom_drivers_;
    auto it = std::find_if(custom_drivers.begin(), custom_drivers.end(),
                           [&descriptor](const driver::DriverDescriptor &d) { return d.label == descriptor.label; });
    if (it != custom_drivers.end()) {
        *it = descriptor;
    } else {
        custom_drivers.push_back(descriptor);
    }

    if (!save_locked(profiles_, custom_drivers, error)) {
        return false;
    }
    custom_drivers_ = std::move(custom_drivers);
    LOG_INFO("[Profiles] Saved custom driver '" << descriptor.label << "'");
    return true;
}

}  // namespace profile
}  // namespace indiweb
