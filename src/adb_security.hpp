#pragma once
// =============================================================================
// adb_security.hpp
//
// Validation and quoting for everything that ends up on an adb command line
// or in a device shell line. These functions are the security boundary for
// all ADB process spawning in AdbTransport and FilePusher.
// =============================================================================

#include <string>
#include <cstring>
#include <cctype>

namespace scry {
namespace security {

// Dangerous shell metacharacters that could enable command injection
constexpr const char* SHELL_METACHARACTERS = "|;&$`\\\"'<>(){}[]!#*?~\n\r";

/**
 * Validate ADB device ID format.
 * Valid formats:
 *   - Serial number: alphanumeric, may include ':', '.', '-', '_'
 *   - IP:port: xxx.xxx.xxx.xxx:port
 *
 * @param adb_id  The device ID to validate
 * @return true if valid, false if potentially malicious
 */
inline bool isValidAdbId(const std::string& adb_id) {
    if (adb_id.empty() || adb_id.length() > 64) {
        return false;
    }

    for (char c : adb_id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != ':' && c != '.' && c != '-' && c != '_') {
            return false;
        }
    }

    return true;
}

/**
 * Validate a remote file path for push targets.
 * Only allows absolute paths in /sdcard/ and /data/local/tmp/, without
 * shell metacharacters or parent-directory components.
 *
 * @param remote_path  Path on the Android device
 * @return true if path is safe to operate on
 */
inline bool isAllowedRemotePath(const std::string& remote_path) {
    if (remote_path.empty() || remote_path.size() > 1024) {
        return false;
    }

    if (remote_path.find("/data/local/tmp/") != 0 &&
        remote_path.find("/sdcard/") != 0 &&
        remote_path.find("/storage/emulated/0/") != 0) {
        return false;
    }

    if (remote_path.back() == '/') return false;
    if (remote_path.find("/../") != std::string::npos) return false;

    for (char c : remote_path) {
        if (std::strchr(SHELL_METACHARACTERS, c) != nullptr) {
            return false;
        }
        if (static_cast<unsigned char>(c) < 0x20) return false;
    }

    return true;
}

/**
 * Quote an argument for the device shell using single quotes.
 * Embedded single quotes become '\'' so any byte sequence is passed verbatim.
 */
inline std::string quoteShellArg(const std::string& arg) {
    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted += '\'';
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

/**
 * Connection type of an `adb devices` id, for logs and the device list.
 *   "192.168.0.5:5555"                          -> "wifi"
 *   "adb-R5CT123-AbCdEf._adb-tls-connect._tcp"  -> "mdns" (wireless debugging)
 *   anything else                               -> "usb"
 */
inline std::string classifyConnectionString(const std::string& adb_id) {
    if (adb_id.find("._adb-tls-connect.") != std::string::npos) return "mdns";
    size_t colon_pos = adb_id.find(':');
    if (colon_pos == std::string::npos) return "usb";

    size_t dots = 0;
    for (size_t i = 0; i < colon_pos; i++) {
        if (adb_id[i] == '.') dots++;
    }
    return dots == 3 ? "wifi" : "usb";
}

} // namespace security
} // namespace scry
