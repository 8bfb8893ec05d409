#include "driver_connector.hpp"

#include <indililxml.h>

#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>

#include "logging/logger.hpp"

namespace indiweb {
namespace server {

namespace {
constexpr const char *kGetPropertiesMessage = "<getProperties version=\"1.7\"/>\n";
constexpr int kQuietMs = 250;

std::string xml_escape(const std::string &value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

std::string trim(const std::string &s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

// defTextVector, defNumberVector, defSwitchVector, defLightVector, defBLOBVector
bool is_definition(const std::string &tag) {
    const std::string suffix = "Vector";
    return tag.compare(0, 3, "def") == 0 && tag.size() > suffix.size() + 3 &&
           tag.compare(tag.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void collect_definition(const INDI::LilXmlElement &root, std::map<std::string, bool> &devices) {
    if (!is_definition(root.tagName())) {
        return;
    }
    const std::string device = root.getAttribute("device").toString();
    if (device.empty()) {
        return;
    }

    bool &connected = devices[device];
    if (root.tagName() != "defSwitchVector" || root.getAttribute("name").toString() != "CONNECTION") {
        return;
    }
    for (const auto &element : root.getElementsByTagName("defSwitch")) {
        if (element.getAttribute("name").toString() == "CONNECT") {
            connected = trim(element.context().toString()) == "On";
        }
    }
}
}  // namespace

XmlSwitchConnector::XmlSwitchConnector(const std::string &host, int timeout_ms)
    : host_(host), timeout_ms_(timeout_ms) {}

std::string XmlSwitchConnector::build_connect_message(const std::string &device) {
    return "<newSwitchVector device=\"" + xml_escape(device) +
           "\" name=\"CONNECTION\">\n"
           "  <oneSwitch name=\"CONNECT\">On</oneSwitch>\n"
           "</newSwitchVector>\n";
}

bool XmlSwitchConnector::connect(const driver::DriverDescriptor &descriptor, int port, std::string &error) {
    const std::string device = descriptor.device_name();

    int fd = open_socket(port, error);
    if (fd < 0) {
        return false;
    }

    bool ok = send_all(fd, build_connect_message(device), error);
    ::close(fd);

    if (ok) {
        LOG_DEBUG("[AutoConnect] CONNECT sent to '" << device << "'");
    }
    return ok;
}

bool XmlSwitchConnector::list_devices(int port, std::vector<DeviceStatus> &devices, std::string &error) {
    int fd = open_socket(port, error);
    if (fd < 0) {
        return false;
    }

    std::map<std::string, bool> found;
    bool ok = send_all(fd, kGetPropertiesMessage, error) && read_definitions(fd, found, error);
    ::close(fd);
    if (!ok) {
        return false;
    }

    devices.clear();
    for (const auto &[device, connected] : found) {
        devices.push_back(DeviceStatus{device, connected});
    }
    LOG_DEBUG("[Devices] " << devices.size() << " device(s) on port " << port);
    return true;
}

int XmlSwitchConnector::open_socket(int port, std::string &error) const {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo *addresses = nullptr;
    const std::string service = std::to_string(port);
    int rc = getaddrinfo(host_.c_str(), service.c_str(), &hints, &addresses);
    if (rc != 0) {
        error = "Cannot resolve " + host_ + ": " + gai_strerror(rc);
        return -1;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
    int fd = -1;
    error = "No address for " + host_;

    for (struct addrinfo *ai = addresses; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC | SOCK_NONBLOCK, ai->ai_protocol);
        if (fd < 0) {
            error = "socket() failed: " + std::string(strerror(errno));
            continue;
        }

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            break;
        }

        if (errno == EINPROGRESS) {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            int ready = ::poll(&pfd, 1, remaining_ms(deadline));
            if (ready > 0) {
                int so_error = 0;
                socklen_t len = sizeof(so_error);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
                if (so_error == 0) {
                    break;
                }
                error = "Connect to " + host_ + ":" + service + " failed: " + std::string(strerror(so_error));
            } else if (ready == 0) {
                error = "Connect to " + host_ + ":" + service + " timed out";
            } else {
                error = "poll() failed: " + std::string(strerror(errno));
            }
        } else {
            error = "Connect to " + host_ + ":" + service + " failed: " + std::string(strerror(errno));
        }

        ::close(fd);
        fd = -1;
    }

    freeaddrinfo(addresses);
    return fd;
}

bool XmlSwitchConnector::send_all(int fd, const std::string &data, std::string &error) const {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
    size_t total = 0;

    while (total < data.size()) {
        ssize_t w = ::send(fd, data.data() + total, data.size() - total, MSG_NOSIGNAL);
        if (w < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                int left = remaining_ms(deadline);
                if (left == 0) {
                    error = "Send timed out";
                    return false;
                }
                struct pollfd pfd;
                pfd.fd = fd;
                pfd.events = POLLOUT;
                pfd.revents = 0;
                ::poll(&pfd, 1, left);
                continue;
            }
            error = "Send failed: " + std::string(strerror(errno));
            return false;
        }
        total += static_cast<size_t>(w);
    }
    return true;
}

bool XmlSwitchConnector::read_definitions(int fd, std::map<std::string, bool> &devices, std::string &error) const {
    INDI::LilXmlParser parser;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
    bool replied = false;
    char buffer[4096];

    while (true) {
        int wait_ms = remaining_ms(deadline);
        if (replied) {
            wait_ms = std::min(wait_ms, kQuietMs);
        }
        if (wait_ms == 0) {
            break;
        }

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = ::poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = "poll() failed: " + std::string(strerror(errno));
            return false;
        }
        if (ready == 0) {
            break;
        }

        ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            error = "Receive failed: " + std::string(strerror(errno));
            return false;
        }
        if (n == 0) {
            // Server closed the connection
            break;
        }
        replied = true;

        auto documents = parser.parseChunk(buffer, static_cast<size_t>(n));
        if (documents.empty() && parser.hasErrorMessage()) {
            error = std::string("Bad XML from device server: ") + parser.errorMessage();
            return false;
        }
        for (const auto &document : documents) {
            collect_definition(document.root(), devices);
        }
    }
    return true;
}

}  // namespace server
}  // namespace indiweb
