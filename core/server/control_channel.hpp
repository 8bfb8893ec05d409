#pragma once

#include <optional>
#include <string>

#include "driver/driver_descriptor.hpp"

namespace indiweb {
namespace server {

// ControlChannel writes start/stop directives to the indiserver FIFO.
// The channel is one-way: indiserver never acknowledges a directive, so a
// successful send only means the whole line reached the pipe.
//
// Grammar (one directive per line):
//   start <binary> -n "<label>" [-s "<skeleton>"]
//   stop <binary> -n "<label>"
// Remote drivers (binary contains '@') carry no options.
class ControlChannel {
public:
    explicit ControlChannel(const std::string &fifo_path);
    ~ControlChannel();

    // Delete copy/move (owns a file descriptor)
    ControlChannel(const ControlChannel &) = delete;
    ControlChannel &operator=(const ControlChannel &) = delete;

    // Open the FIFO for writing without blocking.
    // Fails if the path is missing or no reader has attached yet.
    bool open();
    bool is_open() const { return fd_ >= 0; }
    void close();

    bool send_start(const driver::DriverDescriptor &descriptor);
    bool send_stop(const driver::DriverDescriptor &descriptor);

    // Encode a directive line (including the trailing newline).
    // Returns std::nullopt if a field cannot be carried by the grammar.
    static std::optional<std::string> format_start(const driver::DriverDescriptor &descriptor, std::string &error);
    static std::optional<std::string> format_stop(const driver::DriverDescriptor &descriptor, std::string &error);

    const std::string &path() const { return fifo_path_; }
    const std::string &last_error() const { return error_; }

private:
    std::string fifo_path_;
    int fd_;
    std::string error_;

    bool write_line(const std::string &line, int timeout_ms);
};

}  // namespace server
}  // namespace indiweb
