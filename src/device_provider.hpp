// =============================================================================
// Scry - Device Provider
// =============================================================================
// Source of attached device identifiers. The session only needs ids; how they
// are discovered is up to the provider.
// =============================================================================
#pragma once

#include <string>
#include <vector>
#include "result.hpp"

namespace scry {

enum class DeviceState { Disconnected, Connecting, Streaming, Failed };

inline const char* deviceStateName(DeviceState s) {
    switch (s) {
        case DeviceState::Disconnected: return "Disconnected";
        case DeviceState::Connecting:   return "Connecting";
        case DeviceState::Streaming:    return "Streaming";
        case DeviceState::Failed:       return "Failed";
    }
    return "?";
}

struct Device {
    std::string id;
    DeviceState state = DeviceState::Disconnected;
};

class DeviceProvider {
public:
    virtual ~DeviceProvider() = default;

    // Ids of devices ready for a session. Fails with ErrorKind::Connection when
    // the enumeration mechanism itself is unavailable.
    virtual Result<std::vector<std::string>> listDevices() = 0;
};

/**
 * Lists devices via `adb devices`.
 * Offline and unauthorized entries are skipped. An mDNS entry
 * (adb-<serial>-xxxx._adb-tls-connect._tcp) is dropped when the same serial is
 * already listed over USB or TCP.
 */
class AdbDeviceProvider : public DeviceProvider {
public:
    explicit AdbDeviceProvider(std::string adb_path = "adb") : adb_path_(std::move(adb_path)) {}

    Result<std::vector<std::string>> listDevices() override;

    static std::vector<std::string> parseDevices(const std::string& output);

    // "adb-A9250700956-ieJaCE._adb-tls-connect._tcp" -> "A9250700956", else ""
    static std::string mdnsSerial(const std::string& adb_id);

private:
    std::string adb_path_;
};

} // namespace scry
