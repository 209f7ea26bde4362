#include "dbus.hpp"
#include <cstring>
#include <iostream>
#include <vector>

namespace dbus_service {

// Global pointers for callbacks (set in init)
static Callbacks* g_callbacks = nullptr;
static State* g_state = nullptr;

static const char* PROPERTY_NAMES[] = {"State", "PeerAddress", "Sending"};

// Introspection XML
static const char* INTROSPECT_XML =
    "<!DOCTYPE node PUBLIC \"-//freedesktop//DTD D-BUS Object Introspection 1.0//EN\"\n"
    "\"http://www.freedesktop.org/standards/dbus/1.0/introspect.dtd\">\n"
    "<node>\n"
    "  <interface name=\"org.l2stream.Link\">\n"
    "    <method name=\"Start\"/>\n"
    "    <method name=\"Connect\">\n"
    "      <arg name=\"address\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"send\" type=\"b\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"Stop\"/>\n"
    "    <method name=\"Disconnect\"/>\n"
    "    <property name=\"State\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"PeerAddress\" type=\"s\" access=\"read\"/>\n"
    "    <property name=\"Sending\" type=\"b\" access=\"read\"/>\n"
    "  </interface>\n"
    "  <interface name=\"org.freedesktop.DBus.Properties\">\n"
    "    <method name=\"Get\">\n"
    "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"property\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"value\" type=\"v\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"GetAll\">\n"
    "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"properties\" type=\"a{sv}\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <signal name=\"PropertiesChanged\">\n"
    "      <arg name=\"interface\" type=\"s\"/>\n"
    "      <arg name=\"changed_properties\" type=\"a{sv}\"/>\n"
    "      <arg name=\"invalidated_properties\" type=\"as\"/>\n"
    "    </signal>\n"
    "  </interface>\n"
    "  <interface name=\"org.freedesktop.DBus.Introspectable\">\n"
    "    <method name=\"Introspect\">\n"
    "      <arg name=\"xml\" type=\"s\" direction=\"out\"/>\n"
    "    </method>\n"
    "  </interface>\n"
    "</node>\n";

// Helper to append variant with string
static void append_variant_string(DBusMessageIter* iter, const char* value) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "s", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &value);
    dbus_message_iter_close_container(iter, &variant);
}

// Helper to append variant with bool
static void append_variant_bool(DBusMessageIter* iter, dbus_bool_t value) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "b", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BOOLEAN, &value);
    dbus_message_iter_close_container(iter, &variant);
}

// Append the value of `prop` as a variant; false for unknown properties
static bool append_property(DBusMessageIter* iter, const State& state, const char* prop) {
    if (strcmp(prop, "State") == 0) {
        append_variant_string(iter, state.state.c_str());
    } else if (strcmp(prop, "PeerAddress") == 0) {
        append_variant_string(iter, state.peer_address.c_str());
    } else if (strcmp(prop, "Sending") == 0) {
        append_variant_bool(iter, state.sending);
    } else {
        return false;
    }
    return true;
}

// Append {name: value} entries for the given properties
static void append_property_dict(DBusMessageIter* iter, const State& state,
                                 const char** property_names, int num_properties) {
    DBusMessageIter dict, entry;
    dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "{sv}", &dict);

    for (int i = 0; i < num_properties; i++) {
        const char* prop = property_names[i];
        dbus_message_iter_open_container(&dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &prop);
        append_property(&entry, state, prop);
        dbus_message_iter_close_container(&dict, &entry);
    }

    dbus_message_iter_close_container(iter, &dict);
}

// Handle Get property
static DBusMessage* handle_get(DBusMessage* msg, const State& state) {
    const char* iface;
    const char* prop;

    if (!dbus_message_get_args(msg, nullptr,
            DBUS_TYPE_STRING, &iface,
            DBUS_TYPE_STRING, &prop,
            DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Invalid arguments");
    }

    if (strcmp(iface, INTERFACE_NAME) != 0) {
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_INTERFACE, "Unknown interface");
    }

    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter;
    dbus_message_iter_init_append(reply, &iter);

    if (!append_property(&iter, state, prop)) {
        dbus_message_unref(reply);
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_PROPERTY, "Unknown property");
    }
    return reply;
}

// Handle GetAll properties
static DBusMessage* handle_get_all(DBusMessage* msg, const State& state) {
    const char* iface;

    if (!dbus_message_get_args(msg, nullptr,
            DBUS_TYPE_STRING, &iface,
            DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Invalid arguments");
    }

    if (strcmp(iface, INTERFACE_NAME) != 0) {
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_INTERFACE, "Unknown interface");
    }

    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter;
    dbus_message_iter_init_append(reply, &iter);
    append_property_dict(&iter, state, PROPERTY_NAMES, 3);
    return reply;
}

// Handle Connect(s address, b send)
static DBusMessage* handle_connect(DBusMessage* msg) {
    const char* address;
    dbus_bool_t send = FALSE;

    if (!dbus_message_get_args(msg, nullptr,
            DBUS_TYPE_STRING, &address,
            DBUS_TYPE_BOOLEAN, &send,
            DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS,
                                      "Expected address and send flag");
    }

    std::cout << "dbus: Connect(" << address << ", " << (send ? "send" : "receive")
              << ") called" << std::endl;
    if (g_callbacks && g_callbacks->on_connect) g_callbacks->on_connect(address, send);
    return dbus_message_new_method_return(msg);
}

// Message handler
static DBusHandlerResult message_handler(DBusConnection* conn, DBusMessage* msg, void* data) {
    (void)data;

    const char* iface = dbus_message_get_interface(msg);
    const char* member = dbus_message_get_member(msg);
    const char* path = dbus_message_get_path(msg);

    if (!path || strcmp(path, OBJECT_PATH) != 0) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    DBusMessage* reply = nullptr;

    // Introspection
    if (iface && strcmp(iface, "org.freedesktop.DBus.Introspectable") == 0 &&
        member && strcmp(member, "Introspect") == 0) {
        reply = dbus_message_new_method_return(msg);
        dbus_message_append_args(reply, DBUS_TYPE_STRING, &INTROSPECT_XML, DBUS_TYPE_INVALID);
    }
    // Properties
    else if (iface && strcmp(iface, "org.freedesktop.DBus.Properties") == 0) {
        if (member && strcmp(member, "Get") == 0) {
            reply = handle_get(msg, *g_state);
        } else if (member && strcmp(member, "GetAll") == 0) {
            reply = handle_get_all(msg, *g_state);
        } else if (member && strcmp(member, "Set") == 0) {
            reply = dbus_message_new_error(msg, DBUS_ERROR_PROPERTY_READ_ONLY,
                                           "Property is read-only");
        }
    }
    // Our interface methods
    else if (iface && strcmp(iface, INTERFACE_NAME) == 0) {
        if (member && strcmp(member, "Start") == 0) {
            std::cout << "dbus: Start() called" << std::endl;
            if (g_callbacks && g_callbacks->on_start) g_callbacks->on_start();
            reply = dbus_message_new_method_return(msg);
        } else if (member && strcmp(member, "Connect") == 0) {
            reply = handle_connect(msg);
        } else if (member && strcmp(member, "Stop") == 0) {
            std::cout << "dbus: Stop() called" << std::endl;
            if (g_callbacks && g_callbacks->on_stop) g_callbacks->on_stop();
            reply = dbus_message_new_method_return(msg);
        } else if (member && strcmp(member, "Disconnect") == 0) {
            std::cout << "dbus: Disconnect() called" << std::endl;
            if (g_callbacks && g_callbacks->on_disconnect) g_callbacks->on_disconnect();
            reply = dbus_message_new_method_return(msg);
        }
    }

    if (reply) {
        dbus_connection_send(conn, reply, nullptr);
        dbus_message_unref(reply);
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

DBusConnection* init(Callbacks* callbacks, State* state) {
    g_callbacks = callbacks;
    g_state = state;

    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "dbus: connection error: " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }

    // Register object path
    DBusObjectPathVTable vtable = {};
    vtable.message_function = message_handler;

    if (!dbus_connection_register_object_path(conn, OBJECT_PATH, &vtable, nullptr)) {
        std::cerr << "dbus: failed to register object path" << std::endl;
        dbus_connection_unref(conn);
        return nullptr;
    }

    return conn;
}

bool request_name(DBusConnection* conn) {
    DBusError err;
    dbus_error_init(&err);

    int ret = dbus_bus_request_name(conn, SERVICE_NAME, DBUS_NAME_FLAG_REPLACE_EXISTING, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "dbus: name error: " << err.message << std::endl;
        dbus_error_free(&err);
        return false;
    }

    if (ret != DBUS_REQUEST_NAME_REPLY_PRIMARY_OWNER) {
        std::cerr << "dbus: not primary owner of " << SERVICE_NAME << std::endl;
        return false;
    }

    std::cout << "dbus: registered service " << SERVICE_NAME << std::endl;
    return true;
}

void emit_properties_changed(DBusConnection* conn, const State& state,
                              const char** property_names, int num_properties) {
    DBusMessage* signal = dbus_message_new_signal(OBJECT_PATH,
        "org.freedesktop.DBus.Properties", "PropertiesChanged");
    if (!signal) return;

    DBusMessageIter iter;
    dbus_message_iter_init_append(signal, &iter);

    // Interface name
    const char* iface = INTERFACE_NAME;
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &iface);

    // Changed properties dict
    append_property_dict(&iter, state, property_names, num_properties);

    // Invalidated properties (empty array)
    DBusMessageIter invalidated;
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "s", &invalidated);
    dbus_message_iter_close_container(&iter, &invalidated);

    dbus_connection_send(conn, signal, nullptr);
    dbus_message_unref(signal);
}

void update_from_status(DBusConnection* conn, State* state,
                        const l2stream::link::LinkStatus& status) {
    std::vector<const char*> changed;

    std::string new_state(l2stream::to_string(status.state));
    if (state->state != new_state) {
        state->state = new_state;
        changed.push_back("State");
    }

    if (state->peer_address != status.peer_address) {
        state->peer_address = status.peer_address;
        changed.push_back("PeerAddress");
    }

    if (state->sending != status.sending) {
        state->sending = status.sending;
        changed.push_back("Sending");
    }

    if (!changed.empty()) {
        emit_properties_changed(conn, *state, changed.data(), static_cast<int>(changed.size()));
    }
}

void process_pending(DBusConnection* conn) {
    dbus_connection_read_write(conn, 0);
    while (dbus_connection_dispatch(conn) == DBUS_DISPATCH_DATA_REMAINS) {
        // Keep processing
    }
}

int get_fd(DBusConnection* conn) {
    int fd = -1;
    if (!dbus_connection_get_unix_fd(conn, &fd)) {
        return -1;
    }
    return fd;
}

void cleanup(DBusConnection* conn) {
    if (conn) {
        dbus_connection_unref(conn);
    }
    g_callbacks = nullptr;
    g_state = nullptr;
}

DBusConnection* connect_client() {
    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get_private(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "dbus: connection error: " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }
    dbus_connection_set_exit_on_disconnect(conn, FALSE);
    return conn;
}

// Send and wait; consumes msg, caller unrefs the reply
static DBusMessage* send_blocking(DBusConnection* conn, DBusMessage* msg) {
    DBusError err;
    dbus_error_init(&err);

    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 5000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        if (strcmp(err.name, DBUS_ERROR_SERVICE_UNKNOWN) == 0 ||
            strcmp(err.name, DBUS_ERROR_NAME_HAS_NO_OWNER) == 0) {
            std::cerr << "dbus: " << SERVICE_NAME << " is not running" << std::endl;
        } else {
            std::cerr << "dbus: call failed: " << err.message << std::endl;
        }
        dbus_error_free(&err);
        return nullptr;
    }
    return reply;
}

bool call(DBusConnection* conn, const char* method) {
    DBusMessage* msg = dbus_message_new_method_call(SERVICE_NAME, OBJECT_PATH,
                                                    INTERFACE_NAME, method);
    if (!msg) return false;

    DBusMessage* reply = send_blocking(conn, msg);
    if (!reply) return false;
    dbus_message_unref(reply);
    return true;
}

bool call_connect(DBusConnection* conn, const std::string& address, bool send) {
    DBusMessage* msg = dbus_message_new_method_call(SERVICE_NAME, OBJECT_PATH,
                                                    INTERFACE_NAME, "Connect");
    if (!msg) return false;

    const char* addr = address.c_str();
    dbus_bool_t send_flag = send ? TRUE : FALSE;
    if (!dbus_message_append_args(msg, DBUS_TYPE_STRING, &addr,
                                  DBUS_TYPE_BOOLEAN, &send_flag, DBUS_TYPE_INVALID)) {
        dbus_message_unref(msg);
        return false;
    }

    DBusMessage* reply = send_blocking(conn, msg);
    if (!reply) return false;
    dbus_message_unref(reply);
    return true;
}

std::optional<State> get_state(DBusConnection* conn) {
    DBusMessage* msg = dbus_message_new_method_call(SERVICE_NAME, OBJECT_PATH,
        "org.freedesktop.DBus.Properties", "GetAll");
    if (!msg) return std::nullopt;

    const char* iface = INTERFACE_NAME;
    dbus_message_append_args(msg, DBUS_TYPE_STRING, &iface, DBUS_TYPE_INVALID);

    DBusMessage* reply = send_blocking(conn, msg);
    if (!reply) return std::nullopt;

    State state;
    DBusMessageIter iter, dict;
    if (dbus_message_iter_init(reply, &iter) &&
        dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {
        dbus_message_iter_recurse(&iter, &dict);

        while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
            DBusMessageIter entry, variant;
            dbus_message_iter_recurse(&dict, &entry);

            const char* name;
            dbus_message_iter_get_basic(&entry, &name);
            dbus_message_iter_next(&entry);
            dbus_message_iter_recurse(&entry, &variant);

            int type = dbus_message_iter_get_arg_type(&variant);
            if (type == DBUS_TYPE_STRING) {
                const char* val;
                dbus_message_iter_get_basic(&variant, &val);
                if (strcmp(name, "State") == 0) state.state = val;
                else if (strcmp(name, "PeerAddress") == 0) state.peer_address = val;
            } else if (type == DBUS_TYPE_BOOLEAN && strcmp(name, "Sending") == 0) {
                dbus_bool_t val;
                dbus_message_iter_get_basic(&variant, &val);
                state.sending = val;
            }

            dbus_message_iter_next(&dict);
        }
    }

    dbus_message_unref(reply);
    return state;
}

} // namespace dbus_service
