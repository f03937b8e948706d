// =============================================================================
// Scry - Device Provider Implementation
// =============================================================================
#include "device_provider.hpp"
#include "adb_security.hpp"
#include "child_process.hpp"
#include "scry_log.hpp"

#include <algorithm>
#include <sstream>

namespace scry {

std::string AdbDeviceProvider::mdnsSerial(const std::string& adb_id) {
    if (adb_id.rfind("adb-", 0) != 0 || adb_id.find("._adb") == std::string::npos) return "";
    auto second_dash = adb_id.find('-', 4);
    if (second_dash == std::string::npos) return "";
    return adb_id.substr(4, second_dash - 4);
}

std::vector<std::string> AdbDeviceProvider::parseDevices(const std::string& output) {
    std::vector<std::string> ready;
    std::vector<std::string> mdns;

    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        // Skip header, daemon banners and empty lines
        if (line.find("List of devices") != std::string::npos) continue;
        if (line.empty() || line[0] == '*') continue;

        // "<id>\t<state>" (or space separated with -l)
        size_t sep = line.find_first_of("\t ");
        if (sep == std::string::npos) continue;

        std::string id = line.substr(0, sep);
        size_t state_begin = line.find_first_not_of("\t ", sep);
        if (state_begin == std::string::npos) continue;
        size_t state_end = line.find_first_of("\t \r", state_begin);
        std::string status = line.substr(state_begin, state_end == std::string::npos
                                                          ? std::string::npos
                                                          : state_end - state_begin);

        if (status != "device") {
            SLOG_DEBUG("adb", "Skipping %s (%s)", id.c_str(), status.c_str());
            continue;
        }
        if (!security::isValidAdbId(id)) {
            SLOG_WARN("adb", "Ignoring malformed device id: %s", id.c_str());
            continue;
        }
        if (!mdnsSerial(id).empty()) {
            mdns.push_back(id);
        } else {
            ready.push_back(id);
        }
    }

    // Only keep an mDNS record when its device is not reachable another way
    for (const auto& id : mdns) {
        const std::string serial = mdnsSerial(id);
        bool duplicate = std::find(ready.begin(), ready.end(), serial) != ready.end();
        if (duplicate) {
            SLOG_DEBUG("adb", "Ignoring mDNS duplicate %s of %s", id.c_str(), serial.c_str());
            continue;
        }
        ready.push_back(id);
    }
    return ready;
}

Result<std::vector<std::string>> AdbDeviceProvider::listDevices() {
    std::string output;
    int rc = ChildProcess::run({adb_path_, "devices"}, &output, 10000);
    if (rc != 0) {
        SLOG_ERROR("adb", "'%s devices' failed (rc=%d): %s", adb_path_.c_str(), rc,
                   output.substr(0, 200).c_str());
        return Error(ErrorKind::Connection, "adb devices failed", rc);
    }

    auto devices = parseDevices(output);
    SLOG_INFO("adb", "%zu device(s) ready", devices.size());
    for (const auto& id : devices) {
        SLOG_DEBUG("adb", "  %s (%s)", id.c_str(), security::classifyConnectionString(id).c_str());
    }
    return devices;
}

} // namespace scry
