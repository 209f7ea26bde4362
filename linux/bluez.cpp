#include "bluez.hpp"
#include <algorithm>
#include <cstring>
#include <iostream>

namespace bluez {

// Helper to call a method with no arguments and no return
static bool call_method_void(DBusConnection* conn, const char* dest, const char* path,
                              const char* iface, const char* method) {
    DBusMessage* msg = dbus_message_new_method_call(dest, path, iface, method);
    if (!msg) return false;

    DBusError err;
    dbus_error_init(&err);

    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 5000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        // Not discovering
        if (strcmp(err.name, "org.bluez.Error.Failed") == 0 &&
            strstr(err.message, "No discovery started")) {
            dbus_error_free(&err);
            return true;
        }
        std::cerr << "bluez: " << method << " failed: " << err.message << std::endl;
        dbus_error_free(&err);
        return false;
    }

    if (reply) dbus_message_unref(reply);
    return true;
}

// Get a property variant from org.bluez; caller unrefs the reply
static DBusMessage* get_property(DBusConnection* conn, const char* path,
                                 const char* iface, const char* prop) {
    DBusMessage* msg = dbus_message_new_method_call("org.bluez", path,
        "org.freedesktop.DBus.Properties", "Get");
    if (!msg) return nullptr;

    dbus_message_append_args(msg, DBUS_TYPE_STRING, &iface,
                             DBUS_TYPE_STRING, &prop, DBUS_TYPE_INVALID);

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 2000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        dbus_error_free(&err);
        return nullptr;
    }
    return reply;
}

// Helper to get a string property
static std::string get_string_property(DBusConnection* conn, const char* path,
                                        const char* iface, const char* prop) {
    DBusMessage* reply = get_property(conn, path, iface, prop);
    if (!reply) return "";

    std::string result;
    DBusMessageIter iter, variant;
    if (dbus_message_iter_init(reply, &iter) &&
        dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_VARIANT) {
        dbus_message_iter_recurse(&iter, &variant);
        if (dbus_message_iter_get_arg_type(&variant) == DBUS_TYPE_STRING) {
            const char* val;
            dbus_message_iter_get_basic(&variant, &val);
            result = val;
        }
    }
    dbus_message_unref(reply);
    return result;
}

// Helper to get a bool property
static bool get_bool_property(DBusConnection* conn, const char* path,
                               const char* iface, const char* prop) {
    DBusMessage* reply = get_property(conn, path, iface, prop);
    if (!reply) return false;

    bool result = false;
    DBusMessageIter iter, variant;
    if (dbus_message_iter_init(reply, &iter) &&
        dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_VARIANT) {
        dbus_message_iter_recurse(&iter, &variant);
        if (dbus_message_iter_get_arg_type(&variant) == DBUS_TYPE_BOOLEAN) {
            dbus_bool_t val;
            dbus_message_iter_get_basic(&variant, &val);
            result = val;
        }
    }
    dbus_message_unref(reply);
    return result;
}

std::optional<std::string> get_adapter_path(DBusConnection* conn) {
    DBusMessage* msg = dbus_message_new_method_call("org.bluez", "/",
        "org.freedesktop.DBus.ObjectManager", "GetManagedObjects");
    if (!msg) return std::nullopt;

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 5000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        std::cerr << "bluez: GetManagedObjects failed: " << err.message << std::endl;
        dbus_error_free(&err);
        return std::nullopt;
    }

    std::optional<std::string> result;

    if (reply) {
        DBusMessageIter iter, dict;
        if (dbus_message_iter_init(reply, &iter) &&
            dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {

            dbus_message_iter_recurse(&iter, &dict);

            while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
                DBusMessageIter entry, ifaces;
                dbus_message_iter_recurse(&dict, &entry);

                const char* obj_path;
                dbus_message_iter_get_basic(&entry, &obj_path);
                dbus_message_iter_next(&entry);

                // Check interfaces
                if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_ARRAY) {
                    dbus_message_iter_recurse(&entry, &ifaces);

                    while (dbus_message_iter_get_arg_type(&ifaces) == DBUS_TYPE_DICT_ENTRY) {
                        DBusMessageIter iface_entry;
                        dbus_message_iter_recurse(&ifaces, &iface_entry);

                        const char* iface_name;
                        dbus_message_iter_get_basic(&iface_entry, &iface_name);

                        if (strcmp(iface_name, "org.bluez.Adapter1") == 0) {
                            result = obj_path;
                            break;
                        }
                        dbus_message_iter_next(&ifaces);
                    }
                }

                if (result) break;
                dbus_message_iter_next(&dict);
            }
        }
        dbus_message_unref(reply);
    }

    return result;
}

bool is_adapter_powered(DBusConnection* conn, const std::string& adapter_path) {
    return get_bool_property(conn, adapter_path.c_str(), "org.bluez.Adapter1", "Powered");
}

void stop_discovery(DBusConnection* conn) {
    auto adapter = get_adapter_path(conn);
    if (!adapter) return;

    if (!get_bool_property(conn, adapter->c_str(), "org.bluez.Adapter1", "Discovering")) {
        return;
    }

    if (call_method_void(conn, "org.bluez", adapter->c_str(),
                         "org.bluez.Adapter1", "StopDiscovery")) {
        std::cout << "bluez: discovery stopped" << std::endl;
    }
}

std::string get_device_path(const std::string& adapter_path, const std::string& mac_address) {
    std::string result = mac_address;
    std::replace(result.begin(), result.end(), ':', '_');
    std::transform(result.begin(), result.end(), result.begin(), ::toupper);
    return adapter_path + "/dev_" + result;
}

std::string get_device_name(DBusConnection* conn, const std::string& mac_address) {
    auto adapter = get_adapter_path(conn);
    if (!adapter) return "";

    std::string path = get_device_path(*adapter, mac_address);
    std::string name = get_string_property(conn, path.c_str(), "org.bluez.Device1", "Alias");
    if (name.empty()) {
        name = get_string_property(conn, path.c_str(), "org.bluez.Device1", "Name");
    }
    return name;
}

} // namespace bluez
