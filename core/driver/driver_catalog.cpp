#include "driver_catalog.hpp"

#include <indililxml.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <set>

#include "logging/logger.hpp"

namespace indiweb {
namespace driver {

namespace {
constexpr const char *kRootTag = "driversList";
constexpr const char *kGroupTag = "devGroup";
constexpr const char *kDeviceTag = "device";
constexpr const char *kDriverTag = "driver";
constexpr const char *kVersionTag = "version";
constexpr const char *kDefaultVersion = "0.0";

std::string trim(const std::string &s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

// Skeleton files (foo_sk.xml) describe properties, not drivers
bool is_definition_file(const std::filesystem::path &path) {
    if (path.extension() != ".xml") {
        return false;
    }
    const std::string stem = path.stem().string();
    return stem.size() < 3 || stem.compare(stem.size() - 3, 3, "_sk") != 0;
}
}  // namespace

DriverCatalog::DriverCatalog()
    : builtin_(std::make_shared<const DescriptorSet>()), custom_(std::make_shared<const DescriptorSet>()) {}

std::shared_ptr<const DriverCatalog::DescriptorSet> DriverCatalog::builtin_snapshot() const {
    return std::atomic_load(&builtin_);
}

std::shared_ptr<const DriverCatalog::DescriptorSet> DriverCatalog::custom_snapshot() const {
    return std::atomic_load(&custom_);
}

std::optional<std::vector<DriverDescriptor>> DriverCatalog::parse_definition_file(const std::string &path,
                                                                                  std::string &error) {
    INDI::LilXmlParser parser;
    INDI::LilXmlDocument document = parser.readFromFile(path);

    if (!document.isValid()) {
        error = parser.hasErrorMessage() ? parser.errorMessage() : "no XML element found";
        return std::nullopt;
    }

    INDI::LilXmlElement root = document.root();
    if (root.tagName() != kRootTag) {
        error = "unexpected root element <" + root.tagName() + ">";
        return std::nullopt;
    }

    const std::filesystem::path directory = std::filesystem::path(path).parent_path();
    std::vector<DriverDescriptor> result;

    for (const auto &group : root.getElementsByTagName(kGroupTag)) {
        const std::string family = group.getAttribute("group").toString();

        for (const auto &device : group.getElementsByTagName(kDeviceTag)) {
            DriverDescriptor descriptor;
            descriptor.family = family;
            descriptor.label = trim(device.getAttribute("label").toString());

            auto drivers = device.getElementsByTagName(kDriverTag);
            if (descriptor.label.empty() || drivers.empty()) {
                LOG_WARN("[Catalog] " << path << ": skipping device without label or driver in group '" << family
                                      << "'");
                continue;
            }

            const auto &driver_element = drivers.front();
            descriptor.name = trim(driver_element.getAttribute("name").toString());
            descriptor.binary = trim(driver_element.context().toString());
            if (descriptor.binary.empty()) {
                LOG_WARN("[Catalog] " << path << ": skipping '" << descriptor.label << "' (empty driver binary)");
                continue;
            }
            if (descriptor.name.empty()) {
                descriptor.name = descriptor.label;
            }

            auto versions = device.getElementsByTagName(kVersionTag);
            if (!versions.empty()) {
                descriptor.version = trim(versions.front().context().toString());
            }
            if (descriptor.version.empty()) {
                descriptor.version = kDefaultVersion;
            }

            auto skel = device.getAttribute("skel");
            if (skel.isValid() && !skel.toString().empty()) {
                std::filesystem::path skel_path = directory / skel.toString();
                if (std::filesystem::exists(skel_path)) {
                    descriptor.skeleton = skel_path.string();
                } else {
                    LOG_DEBUG("[Catalog] Skeleton not found for '" << descriptor.label << "': " << skel_path);
                }
            }

            result.push_back(std::move(descriptor));
        }
    }

    return result;
}

std::optional<size_t> DriverCatalog::load(const std::string &directory) {
    LOG_INFO("[Catalog] Loading driver definitions from " << directory);

    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        LOG_ERROR("[Catalog] Cannot read driver directory " << directory << ": " << ec.message());
        return std::nullopt;
    }

    std::vector<std::filesystem::path> files;
    for (const auto &entry : it) {
        if (entry.is_regular_file(ec) && is_definition_file(entry.path())) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    // Build outside the published snapshot, swap in at the end
    auto next = std::make_shared<DescriptorSet>();
    size_t failed_files = 0;

    for (const auto &file : files) {
        std::string error;
        auto parsed = parse_definition_file(file.string(), error);
        if (!parsed) {
            ++failed_files;
            LOG_WARN("[Catalog] Skipping malformed definition file " << file.string() << ": " << error);
            continue;
        }

        for (auto &descriptor : *parsed) {
            if (next->label_to_index.count(descriptor.label) > 0) {
                LOG_WARN("[Catalog] Duplicate driver label '" << descriptor.label << "' in " << file.string()
                                                               << " (ignored)");
                continue;
            }
            next->label_to_index[descriptor.label] = next->descriptors.size();
            next->descriptors.push_back(std::move(descriptor));
        }
    }

    const size_t count = next->descriptors.size();
    std::atomic_store(&builtin_, std::shared_ptr<const DescriptorSet>(std::move(next)));

    LOG_INFO("[Catalog] Loaded " << count << " drivers from " << files.size() << " files (" << failed_files
                                 << " skipped)");
    return count;
}

void DriverCatalog::load_custom(const std::vector<DriverDescriptor> &descriptors) {
    auto next = std::make_shared<DescriptorSet>();

    for (const auto &descriptor : descriptors) {
        auto existing = next->label_to_index.find(descriptor.label);
        if (existing != next->label_to_index.end()) {
            next->descriptors[existing->second] = descriptor;
            continue;
        }
        next->label_to_index[descriptor.label] = next->descriptors.size();
        next->descriptors.push_back(descriptor);
    }

    LOG_INFO("[Catalog] Custom overlay replaced (" << next->descriptors.size() << " drivers)");
    std::atomic_store(&custom_, std::shared_ptr<const DescriptorSet>(std::move(next)));
}

void DriverCatalog::clear_custom() {
    std::atomic_store(&custom_, std::make_shared<const DescriptorSet>());
    LOG_DEBUG("[Catalog] Custom overlay cleared");
}

std::optional<DriverDescriptor> DriverCatalog::by_label(const std::string &label) const {
    auto custom = custom_snapshot();
    auto it = custom->label_to_index.find(label);
    if (it != custom->label_to_index.end()) {
        return custom->descriptors[it->second];
    }

    auto builtin = builtin_snapshot();
    it = builtin->label_to_index.find(label);
    if (it != builtin->label_to_index.end()) {
        return builtin->descriptors[it->second];
    }

    return std::nullopt;
}

std::vector<DriverDescriptor> DriverCatalog::all_drivers() const {
    auto builtin = builtin_snapshot();
    auto custom = custom_snapshot();

    std::vector<DriverDescriptor> result;
    result.reserve(builtin->descriptors.size() + custom->descriptors.size());
    for (const auto &descriptor : builtin->descriptors) {
        if (custom->label_to_index.count(descriptor.label) == 0) {
            result.push_back(descriptor);
        }
    }
    result.insert(result.end(), custom->descriptors.begin(), custom->descriptors.end());
    return result;
}

std::map<std::string, std::vector<DriverDescriptor>> DriverCatalog::groups_by_family() const {
    std::map<std::string, std::vector<DriverDescriptor>> groups;
    for (auto &descriptor : all_drivers()) {
        groups[descriptor.family].push_back(std::move(descriptor));
    }
    return groups;
}

std::vector<std::string> DriverCatalog::families() const {
    std::set<std::string> names;
    for (const auto &descriptor : all_drivers()) {
        names.insert(descriptor.family);
    }
    return std::vector<std::string>(names.begin(), names.end());
}

size_t DriverCatalog::size() const { return all_drivers().size(); }

size_t DriverCatalog::custom_count() const { return custom_snapshot()->descriptors.size(); }

}  // namespace driver
}  // namespace indiweb
