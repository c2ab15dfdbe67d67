#pragma once

/**
 * @file device.hpp
 * @brief Device identity for activation binding
 *
 * A key is bound to the device that redeemed it. The engine identifies the
 * device by a stable hash of the platform's machine identifier unless the
 * application supplies its own id.
 */

#include <string>

namespace keygate {
namespace device {

/**
 * @brief Generate a stable identifier for this device
 *
 * Hashes the platform machine identifier:
 * - Linux: /etc/machine-id, /var/lib/dbus/machine-id or the DMI product UUID
 * - macOS: IOPlatformUUID from IOKit
 * - Windows: the MachineGuid registry value
 *
 * @return 32 lowercase hex characters, or an empty string if the platform
 *         exposes no machine identifier
 */
[[nodiscard]] std::string generate_device_id();

/**
 * @brief Hash a raw machine identifier into device id form
 *
 * SHA-256 of the input, hex encoded and truncated to 32 characters.
 * Returns an empty string for empty input.
 */
[[nodiscard]] std::string hash_identifier(const std::string& raw_id);

/**
 * @brief Get the platform name
 *
 * @return "macos", "linux", "windows", or "unknown"
 */
[[nodiscard]] std::string get_platform_name();

/**
 * @brief Get a human-readable hostname
 *
 * @return The system hostname or "unknown" on failure
 */
[[nodiscard]] std::string get_hostname();

}  // namespace device
}  // namespace keygate
