#pragma once

#include <dbus/dbus.h>
#include <optional>
#include <string>

namespace bluez {

// Get adapter path (usually /org/bluez/hci0)
std::optional<std::string> get_adapter_path(DBusConnection* conn);

// Adapter1.Powered
bool is_adapter_powered(DBusConnection* conn, const std::string& adapter_path);

// Stop discovery on the default adapter; inquiry slows down connection setup
void stop_discovery(DBusConnection* conn);

// Get BlueZ device path from MAC address
std::string get_device_path(const std::string& adapter_path, const std::string& mac_address);

// Device1.Alias (falls back to Name); empty if the device is unknown to BlueZ
std::string get_device_name(DBusConnection* conn, const std::string& mac_address);

} // namespace bluez
