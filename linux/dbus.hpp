#pragma once

#include <dbus/dbus.h>
#include <link/service.hpp>
#include <functional>
#include <optional>
#include <string>

namespace dbus_service {

// D-Bus service configuration
constexpr const char* SERVICE_NAME = "org.l2stream.Link";
constexpr const char* OBJECT_PATH = "/org/l2stream/Link";
constexpr const char* INTERFACE_NAME = "org.l2stream.Link";

// Callbacks for method invocations
struct Callbacks {
    std::function<void()> on_start;
    std::function<void(const std::string& address, bool send)> on_connect;
    std::function<void()> on_stop;
    std::function<void()> on_disconnect;
};

// Current state exposed via D-Bus
struct State {
    std::string state = "none";
    std::string peer_address;
    bool sending = false;
};

// Initialize D-Bus service, returns connection (caller owns)
// Sets up object path and method handlers
DBusConnection* init(Callbacks* callbacks, State* state);

// Request the service name on the bus
bool request_name(DBusConnection* conn);

// Emit PropertiesChanged signal for given properties
void emit_properties_changed(DBusConnection* conn, const State& state,
                              const char** property_names, int num_properties);

// Update state from the link status and emit signals
void update_from_status(DBusConnection* conn, State* state,
                        const l2stream::link::LinkStatus& status);

// Process pending D-Bus messages (call in event loop)
void process_pending(DBusConnection* conn);

// Get file descriptor for polling
int get_fd(DBusConnection* conn);

// Cleanup
void cleanup(DBusConnection* conn);

// Client side, used by the control subcommands

// Open a private session bus connection (caller closes and unrefs)
DBusConnection* connect_client();

// Call a method on the running daemon; false if it is not reachable
bool call(DBusConnection* conn, const char* method);
bool call_connect(DBusConnection* conn, const std::string& address, bool send);

// Read all properties from the running daemon
std::optional<State> get_state(DBusConnection* conn);

} // namespace dbus_service
