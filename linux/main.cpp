#include "dbus.hpp"
#include "endpoints.hpp"
#include "l2cap.hpp"

#include <config/options.hpp>
#include <link/service.hpp>
#include <types/config.hpp>

#include <bluetooth/bluetooth.h>

#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

// Global state (for daemon mode)
static std::atomic<bool> g_running{true};
static DBusConnection* g_session_dbus = nullptr;
static DBusConnection* g_system_dbus = nullptr;
static dbus_service::State g_dbus_state;
static dbus_service::Callbacks g_dbus_callbacks;

// Signal handler
static void signal_handler(int signum) {
    (void)signum;
    g_running = false;
}

static bool valid_address(const std::string& address) {
    return bachk(address.c_str()) == 0;
}

// Main event loop: serve control calls and publish status changes
static void run_event_loop(l2stream::link::LinkService& service) {
    while (g_running) {
        pollfd pfd = {};
        pfd.fd = dbus_service::get_fd(g_session_dbus);
        pfd.events = POLLIN;

        // Poll with 100ms timeout; state changes made by workers are picked up here
        int ret = poll(&pfd, pfd.fd >= 0 ? 1 : 0, 100);
        if (ret < 0) {
            if (errno == EINTR) continue;
            std::cerr << "poll error: " << strerror(errno) << std::endl;
            break;
        }

        if (pfd.revents & POLLIN) {
            dbus_service::process_pending(g_session_dbus);
        }

        dbus_service::update_from_status(g_session_dbus, &g_dbus_state, service.status());
    }
}

// ============================================================================
// Subcommand implementations
// ============================================================================

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  daemon [options]               Run the streaming daemon\n"
              << "  start                          Listen for incoming connections\n"
              << "  connect <address> [--send]     Connect to a peer, optionally sending\n"
              << "  stop                           Stop listening and streaming\n"
              << "  disconnect                     Drop the current peer and listen again\n"
              << "  status                         Show current status\n"
              << "  help                           Show this help\n"
              << "\n"
              << "Daemon options:\n"
              << l2stream::config::options_help();
}

static int cmd_daemon(const char* prog, const std::vector<std::string>& args) {
    std::string error;
    auto config = l2stream::config::parse_options(args, error);
    if (!config) {
        std::cerr << "l2stream: " << error << std::endl;
        print_usage(prog);
        return 1;
    }
    if (!config->connect_address.empty() && !valid_address(config->connect_address)) {
        std::cerr << "l2stream: --connect: invalid address " << config->connect_address
                  << std::endl;
        return 1;
    }

    // Set up signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::cout << "l2stream daemon starting..." << std::endl;

    // Workers use the system bus from their own threads
    dbus_threads_init_default();

    DBusError err;
    dbus_error_init(&err);

    g_system_dbus = dbus_bus_get(DBUS_BUS_SYSTEM, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "Failed to connect to system D-Bus: " << err.message << std::endl;
        dbus_error_free(&err);
        return 1;
    }

    l2cap::Transport transport(g_system_dbus, config->psm);
    endpoints::LinuxEndpoints endpoints(*config);
    l2stream::link::LinkService service(transport, endpoints, *config);

    if (!service.initialize()) {
        std::cerr << "Bluetooth is not available" << std::endl;
        dbus_connection_unref(g_system_dbus);
        return 1;
    }

    // Set up D-Bus service callbacks
    g_dbus_callbacks.on_start = [&service]() {
        service.start();
    };

    g_dbus_callbacks.on_connect = [&service](const std::string& address, bool send) {
        if (!valid_address(address)) {
            std::cerr << "Invalid address: " << address << std::endl;
            return;
        }
        service.connect(address, send);
    };

    g_dbus_callbacks.on_stop = [&service]() {
        service.stop();
    };

    g_dbus_callbacks.on_disconnect = [&service]() {
        service.disconnect();
    };

    // Initialize session D-Bus service
    g_session_dbus = dbus_service::init(&g_dbus_callbacks, &g_dbus_state);
    if (!g_session_dbus) {
        std::cerr << "Failed to initialize D-Bus service" << std::endl;
        service.close();
        dbus_connection_unref(g_system_dbus);
        return 1;
    }

    if (!dbus_service::request_name(g_session_dbus)) {
        std::cerr << "Failed to request D-Bus name" << std::endl;
        service.close();
        dbus_service::cleanup(g_session_dbus);
        dbus_connection_unref(g_system_dbus);
        return 1;
    }

    service.start();
    if (!config->connect_address.empty()) {
        service.connect(config->connect_address, config->send);
    }

    std::cout << "Daemon ready. D-Bus service: " << dbus_service::SERVICE_NAME << std::endl;

    // Run event loop
    run_event_loop(service);

    std::cout << "Shutting down..." << std::endl;

    // Cleanup
    service.close();
    dbus_service::cleanup(g_session_dbus);
    dbus_connection_unref(g_system_dbus);

    std::cout << "Daemon stopped" << std::endl;
    return 0;
}

// Run `fn` against a private session bus connection
template <typename Fn>
static int with_client(Fn fn) {
    DBusConnection* conn = dbus_service::connect_client();
    if (!conn) return 1;

    int ret = fn(conn);

    dbus_connection_close(conn);
    dbus_connection_unref(conn);
    return ret;
}

static int cmd_simple(const char* method) {
    return with_client([method](DBusConnection* conn) {
        return dbus_service::call(conn, method) ? 0 : 1;
    });
}

static int cmd_connect(const std::vector<std::string>& args) {
    std::string address;
    bool send = false;

    for (const auto& arg : args) {
        if (arg == "--send") {
            send = true;
        } else if (address.empty()) {
            address = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            return 1;
        }
    }

    if (address.empty()) {
        std::cerr << "Usage: l2stream connect <address> [--send]" << std::endl;
        return 1;
    }
    if (!valid_address(address)) {
        std::cerr << "Invalid address: " << address << std::endl;
        return 1;
    }

    return with_client([&](DBusConnection* conn) {
        if (!dbus_service::call_connect(conn, address, send)) return 1;
        std::cout << "Connecting to " << address << (send ? " (sending)" : "") << std::endl;
        return 0;
    });
}

static int cmd_status() {
    return with_client([](DBusConnection* conn) {
        auto state = dbus_service::get_state(conn);
        if (!state) return 1;

        std::cout << "State: " << state->state << std::endl;
        std::cout << "PeerAddress: " << (state->peer_address.empty() ? "(none)" : state->peer_address)
                  << std::endl;
        std::cout << "Sending: " << (state->sending ? "true" : "false") << std::endl;
        return 0;
    });
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    if (cmd == "daemon") {
        return cmd_daemon(argv[0], args);
    } else if (cmd == "start") {
        return cmd_simple("Start");
    } else if (cmd == "connect") {
        return cmd_connect(args);
    } else if (cmd == "stop") {
        return cmd_simple("Stop");
    } else if (cmd == "disconnect") {
        return cmd_simple("Disconnect");
    } else if (cmd == "status") {
        return cmd_status();
    } else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    } else {
        std::cerr << "Unknown command: " << cmd << std::endl;
        print_usage(argv[0]);
        return 1;
    }
}
