#include <catch2/catch.hpp>

#include "fake_transport.hpp"

#include <link/service.hpp>

#include <chrono>
#include <mutex>
#include <thread>

using namespace l2stream;
using namespace l2stream::link;
using test::wait_until;
using transport::TransportError;

namespace {

constexpr const char* PEER_A = "11:22:33:44:55:66";
constexpr const char* PEER_B = "AA:BB:CC:DD:EE:FF";

// Inbound connection through the current listener; returns the peer's end
std::unique_ptr<test::FakeSocket> accept_from(test::FakeTransport& transport, const char* peer) {
    auto [local, remote] = test::make_socket_pair(peer, "00:00:00:00:00:00");
    transport.latest_queue()->push(std::move(local));
    return std::move(remote);
}

bool no_workers(const LinkService& service) {
    return !service.is_active(WorkerRole::Listener) && !service.is_active(WorkerRole::Connector) &&
           !service.is_active(WorkerRole::Sender) && !service.is_active(WorkerRole::Receiver);
}

} // namespace

TEST_CASE( "Service initialization", "[service][init]" ) {
    test::FakeTransport transport;
    test::FakeEndpoints endpoints;
    Config config;

    SECTION( "without an adapter" ) {
        transport.adapter = false;
        LinkService service(transport, endpoints, config);
        REQUIRE( !service.initialize() );
        REQUIRE( ConnectionState::None == service.state() );

        // Operations are ignored until initialized
        service.start();
        REQUIRE( ConnectionState::None == service.state() );
        REQUIRE( 0 == transport.listen_count() );
    }

    SECTION( "with an adapter" ) {
        LinkService service(transport, endpoints, config);
        REQUIRE( service.initialize() );
        REQUIRE( ConnectionState::None == service.state() );
        REQUIRE( no_workers(service) );
    }

    SECTION( "again while listening" ) {
        LinkService service(transport, endpoints, config);
        REQUIRE( service.initialize() );
        service.start();

        REQUIRE( service.initialize() );
        REQUIRE( ConnectionState::Listening == service.state() );
        REQUIRE( service.is_active(WorkerRole::Listener) );
        REQUIRE( 1 == transport.listen_count() );
        REQUIRE( 1 == transport.open_listeners() );

        // The running listener still hands over its peer
        auto peer = accept_from(transport, PEER_A);
        REQUIRE( wait_until([&] { return service.state() == ConnectionState::Connected; }) );
        REQUIRE( PEER_A == service.status().peer_address );

        service.close();
    }
}

TEST_CASE( "Start listens and an accepted peer connects", "[service][listen][scenario]" ) {
    test::FakeTransport transport;
    test::FakeEndpoints endpoints;
    Config config;
    LinkService service(transport, endpoints, config);
    REQUIRE( service.initialize() );

    service.start();
    REQUIRE( ConnectionState::Listening == service.state() );
    REQUIRE( service.is_active(WorkerRole::Listener) );
    REQUIRE( 1 == transport.listen_count() );
    REQUIRE( 1 == transport.open_listeners() );

    auto peer = accept_from(transport, PEER_A);
    REQUIRE( wait_until([&] { return service.state() == ConnectionState::Connected; }) );

    REQUIRE( service.is_active(WorkerRole::Receiver) );
    REQUIRE( !service.is_active(WorkerRole::Listener) );
    REQUIRE( !service.is_active(WorkerRole::Sender) );
    REQUIRE( 0 == transport.open_listeners() );

    auto status = service.status();
    REQUIRE( PEER_A == status.peer_address );
    REQUIRE( !status.sending );

    // Received bytes reach the sink
    auto data = test::pattern(3000);
    REQUIRE( peer->write(data) );
    REQUIRE( wait_until([&] { auto log = endpoints.log(0); return log && log->size() == 3000; }) );
    REQUIRE( endpoints.log(0)->bytes() == data );

    service.close();
}

TEST_CASE( "Losing the peer returns to listening", "[service][recovery]" ) {
    test::FakeTransport transport;
    test::FakeEndpoints endpoints;
    Config config;
    LinkService service(transport, endpoints, config);
    REQUIRE( service.initialize() );
    service.start();

    auto peer = accept_from(transport, PEER_A);
    REQUIRE( wait_until([&] { return service.state() == ConnectionState::Connected; }) );

    peer->close();
    REQUIRE( wait_until([&] { return service.state() == ConnectionState::Listening; }) );

    REQUIRE( service.is_active(WorkerRole::Listener) );
    REQUIRE( 2 == transport.listen_count() );
    REQUIRE( 1 == transport.open_listeners() );
    REQUIRE( service.status().peer_address.empty() );
    REQUIRE( wait_until([&] { return !service.is_active(WorkerRole::Receiver); }) );
    REQUIRE( wait_until([&] { return endpoints.log(0)->is_closed(); }) );

    // The new listener accepts the next peer
    auto next = accept_from(transport, PEER_B);
    REQUIRE( wait_until([&] { return service.state() == ConnectionState::Connected; }) );
    REQUIRE( PEER_B == service.status().peer_address );

    service.close();
}

TEST_CASE( "Connect keeps listening until the attempt resolves", "[service][connect][scenario]" ) {
    test::FakeTransport transport;
    test::FakeEndpoints endpoints;
    Config config;
    LinkService service(transport, endpoints, config);
    REQUIRE( service.initialize() );
    service.start();

    transport.hold_connects();
    service.connect(PEER_A, true);

    REQUIRE( ConnectionState::Connecting == service.state() );
    REQUIRE( service.is_active(WorkerRole::Connector) );
    REQUIRE( service.is_active(WorkerRole::Listener) );
    REQUIRE( PEER_A == service.status().peer_address );
    REQUIRE( service.status().sending );
    REQUIRE( wait_until([&] { return transport.discovery_cancels() == 1; }) );

    SECTION( "success starts both pumps" ) {
        transport.release_connects(TransportError::None);
        REQUIRE( wait_until([&] { return service.state() == ConnectionState::Connected; }) );

        REQUIRE( !service.is_active(WorkerRole::Listener) );
        REQUIRE( !service.is_active(WorkerRole::Connector) );
        REQUIRE( service.is_active(WorkerRole::Sender) );
        REQUIRE( service.is_active(WorkerRole::Receiver) );
        REQUIRE( 0 == transport.open_listeners() );

        auto status = service.status();
        REQUIRE( PEER_A == status.peer_address );
        REQUIRE( status.sending );

        // The connected socket stays open once the connector retires
        REQUIRE( !transport.remote(0).peer_closed() );
    }

    SECTION( "failure returns to listening" ) {
        transport.release_connects(TransportError::Unreachable);
        REQUIRE( wait_until([&] { return service.state() == ConnectionState::Listening; }) );

        REQUIRE( service.is_active(WorkerRole::Listener) );
        REQUIRE( 1 == transport.listen_count() );
        REQUIRE( wait_until([&] { return !service.is_active(WorkerRole::Connector); }) );
        REQUIRE( service.status().peer_address.empty() );
    }

    SECTION( "an inbound peer wins over the pending attempt" ) {
        auto peer = accept_from(transport, PEER_B);
        REQUIRE( wait_until([&] { return service.state() == ConnectionState::Connected; }) );

        REQUIRE( PEER_B == service.status().peer_address );
        REQUIRE( !service.status().sending );
        REQUIRE( !service.is_active(WorkerRole::Connector) );
        REQUIRE( !service.is_active(WorkerRole::Sender) );
        REQUIRE( wait_until([&] { return transport.remote(0).peer_closed(); }) );
    }

    service.close();
}

TEST_CASE( "A superseded connector is ignored", "[service][connect][supersede]" ) {
    test::FakeTransport transport;
    test::FakeEndpoints endpoints;
    Config config;
    LinkService service(transport, endpoints, config);
    REQUIRE( service.initialize() );
    service.start();

    transport.hold_connects();
    service.connect(PEER_A, false);
    service.connect(PEER_B, false);

    // The first attempt's socket is closed and its failure is not reported
    REQUIRE( wait_until([&] { return transport.remote(0).peer_closed(); }) );
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    REQUIRE( ConnectionState::Connecting == service.state() );
    REQUIRE( PEER_B == service.status().peer_address );
    REQUIRE( service.is_active(WorkerRole::Connector) );

    transport.release_connects(TransportError::None);
    REQUIRE( wait_until([&] { return service.state() == ConnectionState::Connected; }) );
    REQUIRE( PEER_B == service.status().peer_address );
    REQUIRE( !transport.remote(1).peer_closed() );

    service.close();
}

TEST_CASE( "Connected without a source receives only", "[service][connect]" ) {
    test::FakeTransport transport;
    test::FakeEndpoints endpoints;
    endpoints.source_fails = true;
    Config config;
    LinkService service(transport, endpoints, config);
    REQUIRE( service.initialize() );

    service.connect(PEER_A, true);
    REQUIRE( wait_until([&] { return service.state() == ConnectionState::Connected; }) );
    REQUIRE( !service.is_active(WorkerRole::Sender) );
    REQUIRE( service.is_active(WorkerRole::Receiver) );

    service.close();
}

TEST_CASE( "Peer lookup runs on the connector thread", "[service][connect]" ) {
    test::FakeTransport transport;
    transport.describe_delay = std::chrono::milliseconds(300);
    test::FakeEndpoints endpoints;
    Config config;
    LinkService service(transport, endpoints, config);
    REQUIRE( service.initialize() );

    auto begin = std::chrono::steady_clock::now();
    service.connect(PEER_A, false);
    REQUIRE( std::chrono::steady_clock::now() - begin < std::chrono::milliseconds(150) );

    // Status stays readable while the lookup is in progress
    begin = std::chrono::steady_clock::now();
    REQUIRE( ConnectionState::Connecting == service.state() );
    REQUIRE( std::chrono::steady_clock::now() - begin < std::chrono::milliseconds(150) );

    REQUIRE( wait_until([&] { return service.state() == ConnectionState::Connected; }) );
    REQUIRE( 1 == transport.describe_calls() );

    service.close();
}

TEST_CASE( "Sender streams a file to the peer", "[service][connect][sender]" ) {
    test::FakeTransport transport;
    test::FakeEndpoints endpoints;
    endpoints.source_blocks = false;
    endpoints.source_data = test::pattern(2000);
    Config config;
    LinkService service(transport, endpoints, config);
    REQUIRE( service.initialize() );

    service.connect(PEER_A, true);
    REQUIRE( wait_until([&] { return service.state() == ConnectionState::Connected; }) );
    REQUIRE( wait_until([&] { return transport.remote(0).available() == 2000; }) );

    // An exhausted file keeps the connection up
    REQUIRE( wait_until([&] { return !service.is_active(WorkerRole::Sender); }) );
    REQUIRE( ConnectionState::Connected == service.state() );
    REQUIRE( service.is_active(WorkerRole::Receiver) );

    service.close();
}

TEST_CASE( "Stop cancels every worker", "[service][stop]" ) {
    test::FakeTransport transport;
    test::FakeEndpoints endpoints;
    Config config;
    LinkService service(transport, endpoints, config);
    REQUIRE( service.initialize() );
    service.start();

    SECTION( "while listening" ) {
        service.stop();
    }

    SECTION( "while connecting" ) {
        transport.hold_connects();
        service.connect(PEER_A, true);
        service.stop();
        REQUIRE( wait_until([&] { return transport.remote(0).peer_closed(); }) );
    }

    SECTION( "while connected" ) {
        service.connect(PEER_A, true);
        REQUIRE( wait_until([&] { return service.state() == ConnectionState::Connected; }) );
        service.stop();
        REQUIRE( wait_until([&] { return transport.remote(0).peer_closed(); }) );
    }

    REQUIRE( ConnectionState::None == service.state() );
    REQUIRE( no_workers(service) );
    REQUIRE( wait_until([&] { return transport.open_listeners() == 0; }) );
    REQUIRE( service.status().peer_address.empty() );

    // Nothing restarts on its own
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    REQUIRE( ConnectionState::None == service.state() );

    service.start();
    REQUIRE( ConnectionState::Listening == service.state() );
    REQUIRE( service.is_active(WorkerRole::Listener) );

    service.close();
}

TEST_CASE( "Disconnect drops the peer and listens again", "[service][disconnect]" ) {
    test::FakeTransport transport;
    test::FakeEndpoints endpoints;
    Config config;
    LinkService service(transport, endpoints, config);
    REQUIRE( service.initialize() );
    service.start();

    SECTION( "nothing to disconnect" ) {
        service.disconnect();
        REQUIRE( ConnectionState::Listening == service.state() );
        REQUIRE( 1 == transport.listen_count() );
    }

    SECTION( "connected peer" ) {
        auto peer = accept_from(transport, PEER_A);
        REQUIRE( wait_until([&] { return service.state() == ConnectionState::Connected; }) );

        service.disconnect();
        REQUIRE( ConnectionState::Listening == service.state() );
        REQUIRE( service.is_active(WorkerRole::Listener) );
        REQUIRE( !service.is_active(WorkerRole::Receiver) );
        REQUIRE( wait_until([&] { return peer->peer_closed(); }) );
        REQUIRE( 2 == transport.listen_count() );
    }

    service.close();
}

TEST_CASE( "Listener failures are recoverable", "[service][listen][recovery]" ) {
    test::FakeTransport transport;
    test::FakeEndpoints endpoints;
    Config config;
    LinkService service(transport, endpoints, config);
    REQUIRE( service.initialize() );

    SECTION( "accept error ends the listener, start replaces it" ) {
        service.start();
        transport.latest_queue()->fail();
        REQUIRE( wait_until([&] { return !service.is_active(WorkerRole::Listener); }) );
        REQUIRE( ConnectionState::Listening == service.state() );

        service.start();
        REQUIRE( service.is_active(WorkerRole::Listener) );
        REQUIRE( 2 == transport.listen_count() );
        REQUIRE( 1 == transport.open_listeners() );
    }

    SECTION( "listen error leaves no listener, start retries" ) {
        transport.listen_fails = true;
        service.start();
        REQUIRE( ConnectionState::Listening == service.state() );
        REQUIRE( !service.is_active(WorkerRole::Listener) );

        transport.listen_fails = false;
        service.start();
        REQUIRE( service.is_active(WorkerRole::Listener) );
        REQUIRE( 2 == transport.listen_count() );
    }

    service.close();
}

TEST_CASE( "Connected always cancels listener and connector", "[service][connected]" ) {
    test::FakeTransport transport;
    test::FakeEndpoints endpoints;
    Config config;
    LinkService service(transport, endpoints, config);
    REQUIRE( service.initialize() );
    service.start();

    transport.hold_connects();
    service.connect(PEER_A, false);
    REQUIRE( service.is_active(WorkerRole::Listener) );
    REQUIRE( service.is_active(WorkerRole::Connector) );

    auto [local, remote] = test::make_socket_pair(PEER_B, "00:00:00:00:00:00");
    service.connected(std::move(local), false);

    REQUIRE( ConnectionState::Connected == service.state() );
    REQUIRE( !service.is_active(WorkerRole::Listener) );
    REQUIRE( !service.is_active(WorkerRole::Connector) );
    REQUIRE( service.is_active(WorkerRole::Receiver) );
    REQUIRE( 0 == transport.open_listeners() );
    REQUIRE( wait_until([&] { return transport.remote(0).peer_closed(); }) );

    service.close();
}

TEST_CASE( "At most one worker per role across call sequences", "[service][registry]" ) {
    test::FakeTransport transport;
    test::FakeEndpoints endpoints;
    Config config;
    LinkService service(transport, endpoints, config);
    REQUIRE( service.initialize() );
    transport.hold_connects();

    auto check = [&]() {
        REQUIRE( transport.open_listeners() <= 1 );
        auto state = service.state();
        if (state == ConnectionState::None) {
            REQUIRE( no_workers(service) );
        }
        if (state == ConnectionState::Connected) {
            REQUIRE( !service.is_active(WorkerRole::Listener) );
            REQUIRE( !service.is_active(WorkerRole::Connector) );
        }
        if (state != ConnectionState::Connecting) {
            REQUIRE( !service.is_active(WorkerRole::Connector) );
        }
    };

    std::vector<std::unique_ptr<test::FakeSocket>> peers;
    for (int round = 0; round < 3; ++round) {
        service.start();
        check();
        service.connect(PEER_A, round % 2 == 0);
        check();
        service.start();
        check();
        service.connect(PEER_B, true);
        check();

        auto [local, remote] = test::make_socket_pair(PEER_A, "00:00:00:00:00:00");
        peers.push_back(std::move(remote));
        service.connected(std::move(local), round % 2 == 1);
        check();
        service.start();
        check();
        service.stop();
        check();
        service.start();
        check();
    }

    service.close();
    REQUIRE( ConnectionState::None == service.state() );
    REQUIRE( no_workers(service) );
}

TEST_CASE( "Close is final", "[service][close]" ) {
    test::FakeTransport transport;
    test::FakeEndpoints endpoints;
    Config config;
    LinkService service(transport, endpoints, config);
    REQUIRE( service.initialize() );
    service.start();

    auto peer = accept_from(transport, PEER_A);
    REQUIRE( wait_until([&] { return service.state() == ConnectionState::Connected; }) );

    service.close();
    REQUIRE( ConnectionState::None == service.state() );
    REQUIRE( no_workers(service) );
    REQUIRE( peer->peer_closed() );
    REQUIRE( endpoints.log(0)->is_closed() );

    service.close();
    service.start();
    service.connect(PEER_B, false);
    REQUIRE( ConnectionState::None == service.state() );
    REQUIRE( 1 == transport.listen_count() );
    REQUIRE( !service.initialize() );
}

TEST_CASE( "A connection accepted while the listener stops is closed", "[service][listen][stop]" ) {
    test::FakeTransport transport;
    test::FakeEndpoints endpoints;
    Config config;
    LinkService service(transport, endpoints, config);
    REQUIRE( service.initialize() );
    service.start();

    auto queue = transport.latest_queue();
    {
        std::lock_guard lock(queue->mutex);
        queue->hold = true;
    }
    auto peer = accept_from(transport, PEER_A);
    REQUIRE( wait_until([&] { return queue->is_taken(); }) );

    service.stop();
    queue->release();

    REQUIRE( wait_until([&] { return peer->peer_closed(); }) );
    REQUIRE( ConnectionState::None == service.state() );
    REQUIRE( no_workers(service) );
    REQUIRE( service.status().peer_address.empty() );
    REQUIRE( !endpoints.log(0) );

    service.close();
}
