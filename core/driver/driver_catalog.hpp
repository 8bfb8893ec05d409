#ifndef INDIWEB_DRIVER_DRIVER_CATALOG_HPP
#define INDIWEB_DRIVER_DRIVER_CATALOG_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "driver/driver_descriptor.hpp"

namespace indiweb {
namespace driver {

// Driver Catalog - built-in INDI driver definitions plus a custom overlay
/**
 * Built-in descriptors come from the INDI driver XML files (usually
 * /usr/share/indi). Custom and remote descriptors come from the profile
 * store and live in a separate overlay that is rebuilt wholesale whenever
 * the store changes.
 *
 * Thread Safety:
 * - Both sets are immutable once published
 * - load(), load_custom() and clear_custom() build a new set and publish it
 *   with a single atomic shared_ptr store
 * - Readers take an atomic snapshot and never lock
 */
class DriverCatalog {
public:
    DriverCatalog();

    // Parse every definition file in directory and replace the built-in set.
    // Malformed files are logged and skipped. Returns the number of
    // descriptors loaded, or std::nullopt if the directory cannot be read
    // (the previous built-in set is kept).
    std::optional<size_t> load(const std::string &directory);

    // Parse a single driversList file.
    // Returns std::nullopt on malformed input and sets error.
    static std::optional<std::vector<DriverDescriptor>> parse_definition_file(const std::string &path,
                                                                              std::string &error);

    // Replace the custom overlay. Later entries win over earlier ones with
    // the same label; every entry wins over a built-in with the same label.
    void load_custom(const std::vector<DriverDescriptor> &descriptors);
    void clear_custom();

    // Lookup over built-in and custom (custom first)
    std::optional<DriverDescriptor> by_label(const std::string &label) const;

    // Families ordered by name; built-in descriptors in load order, then custom
    std::map<std::string, std::vector<DriverDescriptor>> groups_by_family() const;

    // Every visible descriptor, built-in first, in load order
    std::vector<DriverDescriptor> all_drivers() const;

    std::vector<std::string> families() const;
    size_t size() const;
    size_t custom_count() const;

private:
    struct DescriptorSet {
        std::vector<DriverDescriptor> descriptors;
        std::unordered_map<std::string, size_t> label_to_index;
    };

    std::shared_ptr<const DescriptorSet> builtin_;
    std::shared_ptr<const DescriptorSet> custom_;

    std::shared_ptr<const DescriptorSet> builtin_snapshot() const;
    std::shared_ptr<const DescriptorSet> custom_snapshot() const;
};

}  // namespace driver
}  // namespace indiweb

#endif  // INDIWEB_DRIVER_DRIVER_CATALOG_HPP
