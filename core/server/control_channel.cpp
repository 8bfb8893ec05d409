#include "control_channel.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>

#include <chrono>
#include <cstring>

#include "logging/logger.hpp"

namespace indiweb {
namespace server {

namespace {
constexpr int kWriteTimeoutMs = 1000;

// indiserver parses quoted option values with sscanf("%[^\"]")
bool is_encodable(const std::string &value) {
    return value.find('"') == std::string::npos && value.find('\n') == std::string::npos &&
           value.find('\r') == std::string::npos;
}

bool validate(const driver::DriverDescriptor &descriptor, std::string &error) {
    if (descriptor.binary.empty()) {
        error = "Driver '" + descriptor.label + "' has no binary";
        return false;
    }
    // A remote endpoint takes the rest of the line, so only local binaries
    // must be a single token
    if (!is_encodable(descriptor.binary) ||
        (!descriptor.is_remote() && descriptor.binary.find_first_of(" \t") != std::string::npos)) {
        error = "Driver binary cannot be encoded: " + descriptor.binary;
        return false;
    }
    if (descriptor.is_remote()) {
        return true;
    }
    // indiserver treats any line containing '@' as a remote driver, and
    // "-n \"\"" does not match its %512[^"] so the driver keeps its default name
    if (descriptor.label.empty()) {
        error = "Driver '" + descriptor.binary + "' has an empty label";
        return false;
    }
    if (!is_encodable(descriptor.label) || descriptor.label.find('@') != std::string::npos) {
        error = "Driver label contains quotes, newlines or '@': " + descriptor.label;
        return false;
    }
    if (descriptor.skeleton &&
        (!is_encodable(*descriptor.skeleton) || descriptor.skeleton->find('@') != std::string::npos)) {
        error = "Skeleton path contains quotes, newlines or '@': " + *descriptor.skeleton;
        return false;
    }
    return true;
}
}  // namespace

ControlChannel::ControlChannel(const std::string &fifo_path) : fifo_path_(fifo_path), fd_(-1) {}

ControlChannel::~ControlChannel() { close(); }

bool ControlChannel::open() {
    error_.clear();
    if (fd_ >= 0) {
        return true;
    }

    struct stat st;
    if (::stat(fifo_path_.c_str(), &st) != 0) {
        error_ = "FIFO not found: " + fifo_path_;
        return false;
    }

    // O_NONBLOCK: fail with ENXIO instead of blocking while no reader exists
    int fd = ::open(fifo_path_.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENXIO) {
            error_ = "No reader on FIFO " + fifo_path_;
        } else {
            error_ = "Cannot open FIFO " + fifo_path_ + ": " + std::string(strerror(errno));
        }
        return false;
    }

    fd_ = fd;
    LOG_DEBUG("[Channel] Opened " << fifo_path_);
    return true;
}

void ControlChannel::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
        LOG_DEBUG("[Channel] Closed " << fifo_path_);
    }
}

std::optional<std::string> ControlChannel::format_start(const driver::DriverDescriptor &descriptor,
                                                        std::string &error) {
    if (!validate(descriptor, error)) {
        return std::nullopt;
    }

    std::string line = "start " + descriptor.binary;
    if (!descriptor.is_remote()) {
        line += " -n \"" + descriptor.label + "\"";
        if (descriptor.skeleton && !descriptor.skeleton->empty()) {
            line += " -s \"" + *descriptor.skeleton + "\"";
        }
    }
    line += "\n";
    return line;
}

std::optional<std::string> ControlChannel::format_stop(const driver::DriverDescriptor &descriptor,
                                                       std::string &error) {
    if (!validate(descriptor, error)) {
        return std::nullopt;
    }

    std::string line = "stop " + descriptor.binary;
    if (!descriptor.is_remote()) {
        line += " -n \"" + descriptor.label + "\"";
    }
    line += "\n";
    return line;
}

bool ControlChannel::send_start(const driver::DriverDescriptor &descriptor) {
    error_.clear();
    auto line = format_start(descriptor, error_);
    if (!line) {
        return false;
    }
    LOG_DEBUG("[Channel] > " << line->substr(0, line->size() - 1));
    return write_line(*line, kWriteTimeoutMs);
}

bool ControlChannel::send_stop(const driver::DriverDescriptor &descriptor) {
    error_.clear();
    auto line = format_stop(descriptor, error_);
    if (!line) {
        return false;
    }
    LOG_DEBUG("[Channel] > " << line->substr(0, line->size() - 1));
    return write_line(*line, kWriteTimeoutMs);
}

bool ControlChannel::write_line(const std::string &line, int timeout_ms) {
    if (fd_ < 0) {
        error_ = "Control channel not open";
        return false;
    }

    const char *buf = line.data();
    size_t total = 0;
    const size_t n = line.size();
    auto start_time = std::chrono::steady_clock::now();

    while (total < n) {
        ssize_t w = ::write(fd_, buf + total, n - total);
        if (w < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                // Pipe buffer full: wait for indiserver to drain it
                auto elapsed = std::chrono::steady_clock::now() - start_time;
                auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
                if (elapsed_ms >= timeout_ms) {
                    error_ = "Timeout writing to FIFO " + fifo_path_;
                    return false;
                }
                struct pollfd pfd;
                pfd.fd = fd_;
                pfd.events = POLLOUT;
                pfd.revents = 0;
                ::poll(&pfd, 1, static_cast<int>(timeout_ms - elapsed_ms));
                continue;
            }
            if (errno == EPIPE) {
                error_ = "Broken pipe (indiserver closed the FIFO)";
            } else {
                error_ = "Write failed: " + std::string(strerror(errno));
            }
            return false;
        }
        if (w == 0) {
            error_ = "Write returned 0 bytes";
            return false;
        }
        total += static_cast<size_t>(w);
    }
    return true;
}

}  // namespace server
}  // namespace indiweb
