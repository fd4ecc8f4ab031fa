/**
 * @file test_listeners.cpp
 * @brief Unit tests for listener protocol variants
 *
 * Tests:
 * - Factory validation for TCP, UDP, SMB and HTTP listeners
 * - Accessors, configured options and mutable options
 * - Construct/deconstruct with the pre-shared key
 * - Agent traffic through handle() with and without a handshake
 */

#include <gtest/gtest.h>
#include "harbor/crypto.hpp"
#include "harbor/errors.hpp"
#include "harbor/http_listener.hpp"
#include "harbor/pake_authenticator.hpp"
#include "harbor/smb_listener.hpp"
#include "harbor/tcp_listener.hpp"
#include "harbor/udp_listener.hpp"

using namespace harbor;

class ListenerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(Crypto::initialize());
        psk_ = Crypto::derive_pre_shared_key("merlin");
        chain_ = TransformChain::parse("aes,gob-base");
    }

    static Options tcp_options() {
        return {
            {"Protocol", "tcp"},
            {"Name", "T1"},
            {"Interface", "127.0.0.1"},
            {"Port", "7777"},
            {"PSK", "merlin"},
            {"Transforms", "aes,gob-base"}
        };
    }

    static Message checkin(const std::string& agent_id) {
        Message message;
        message.agent_id = agent_id;
        message.type = MessageType::CHECKIN;
        message.payload = {0x01, 0x02};
        return message;
    }

    // Agent side of one request/response under a key
    Message exchange(Listener& listener, const std::string& agent_id,
                     const Message& message, const std::vector<uint8_t>& key) {
        auto reply = listener.handle(agent_id, chain_.construct(message, key));
        return chain_.deconstruct(reply, key);
    }

    std::vector<uint8_t> psk_;
    TransformChain chain_;
    const std::string agent_id_ = "9b2f4c1e-5a6d-4e7f-8a9b-0c1d2e3f4a5b";
};

// ============================================================================
// TCP Listener Tests
// ============================================================================

TEST_F(ListenerTest, TcpListenerCreated) {
    auto listener = TcpListener::create("id-1", tcp_options());

    EXPECT_EQ(listener->protocol(), Protocol::TCP);
    EXPECT_EQ(listener->status(), "Created");
    EXPECT_EQ(listener->server(), nullptr);
    EXPECT_EQ(listener->name(), "T1");
    EXPECT_EQ(listener->id(), "id-1");
    EXPECT_EQ(listener->addr(), "127.0.0.1:7777");
    EXPECT_EQ(listener->port(), 7777);
    EXPECT_EQ(listener->transforms(), "aes,gob-base");
    EXPECT_EQ(listener->authenticator_name(), "none");
    EXPECT_EQ(listener->pre_shared_key_secret(), Crypto::bytes_to_hex(psk_));
}

TEST_F(ListenerTest, TcpListenerRejectsEmptyName) {
    auto options = tcp_options();
    options["Name"] = "";
    EXPECT_THROW(TcpListener::create("id", options), ValidationError);

    options.erase("Name");
    EXPECT_THROW(TcpListener::create("id", options), ValidationError);
}

TEST_F(ListenerTest, TcpListenerRejectsInvalidInterface) {
    auto options = tcp_options();
    options["Interface"] = "not-an-address";
    EXPECT_THROW(TcpListener::create("id", options), ValidationError);
}

TEST_F(ListenerTest, TcpListenerRejectsNonNumericPort) {
    auto options = tcp_options();
    options["Port"] = "seven";
    EXPECT_THROW(TcpListener::create("id", options), ValidationError);
}

TEST_F(ListenerTest, TcpListenerRejectsUnknownTransform) {
    auto options = tcp_options();
    options["Transforms"] = "aes,rot13";
    EXPECT_THROW(TcpListener::create("id", options), ValidationError);
}

TEST_F(ListenerTest, TcpListenerRequiresTransforms) {
    auto options = tcp_options();
    options.erase("Transforms");

    try {
        TcpListener::create("id", options);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("Transforms"), std::string::npos) << e.what();
    }

    options["Transforms"] = "  ";
    EXPECT_THROW(TcpListener::create("id", options), ValidationError);
}

TEST_F(ListenerTest, TcpListenerOpaqueAuthenticator) {
    auto options = tcp_options();
    options["Authenticator"] = "OPAQUE";
    EXPECT_EQ(TcpListener::create("id", options)->authenticator_name(), "opaque");
}

TEST_F(ListenerTest, TcpListenerRetainsOptions) {
    auto options = tcp_options();
    auto listener = TcpListener::create("id", options);
    EXPECT_EQ(listener->options(), options);

    auto configured = listener->configured_options();
    EXPECT_EQ(configured.at("ID"), "id");
    EXPECT_EQ(configured.at("Protocol"), "TCP");
    EXPECT_EQ(configured.at("Interface"), "127.0.0.1");
    EXPECT_EQ(configured.at("Port"), "7777");
    EXPECT_EQ(configured.at("Authenticator"), "none");
}

TEST_F(ListenerTest, EmptyPskYieldsEmptyKey) {
    auto options = tcp_options();
    options.erase("PSK");
    auto listener = TcpListener::create("id", options);
    EXPECT_EQ(listener->pre_shared_key_secret(), "");

    // aes needs key material from the caller
    EXPECT_THROW(listener->construct(checkin(agent_id_)), TransformError);
    auto key = Crypto::generate_random_bytes(32);
    EXPECT_EQ(listener->deconstruct(listener->construct(checkin(agent_id_), key), key), checkin(agent_id_));
}

// ============================================================================
// Other Variant Tests
// ============================================================================

TEST_F(ListenerTest, UdpListenerCreated) {
    auto options = tcp_options();
    options["Protocol"] = "udp";
    options["Interface"] = "::1";
    auto listener = UdpListener::create("id", options);

    EXPECT_EQ(listener->protocol(), Protocol::UDP);
    EXPECT_EQ(listener->status(), "Created");
    EXPECT_EQ(listener->server(), nullptr);
    EXPECT_EQ(listener->addr(), "[::1]:7777");
}

TEST_F(ListenerTest, UdpListenerRejectsMissingPort) {
    auto options = tcp_options();
    options.erase("Port");
    EXPECT_THROW(UdpListener::create("id", options), ValidationError);
}

TEST_F(ListenerTest, SmbListenerCreated) {
    Options options = {
        {"Protocol", "smb"}, {"Name", "S1"}, {"Pipe", "merlinpipe"},
        {"PSK", "merlin"}, {"Transforms", "aes,gob-base"}
    };
    auto listener = SmbListener::create("id", options);

    EXPECT_EQ(listener->protocol(), Protocol::SMB);
    EXPECT_EQ(listener->status(), "Created");
    EXPECT_EQ(listener->addr(), "merlinpipe");
    EXPECT_EQ(listener->configured_options().at("Pipe"), "merlinpipe");
}

TEST_F(ListenerTest, SmbListenerRequiresPipe) {
    Options options = {{"Protocol", "smb"}, {"Name", "S1"}, {"Transforms", "gob-base"}};
    EXPECT_THROW(SmbListener::create("id", options), ValidationError);
}

TEST_F(ListenerTest, HttpListenerOwnsServer) {
    Options options = {
        {"Protocol", "http"}, {"Name", "H1"}, {"Interface", "127.0.0.1"}, {"Port", "8080"},
        {"PSK", "merlin"}, {"Transforms", "aes,gob-base"}, {"URLS", "/a,/b"}
    };
    auto server = HttpServer::create("id", options);
    auto listener = HttpListener::create("id", options, server);

    EXPECT_EQ(listener->protocol(), Protocol::HTTP);
    EXPECT_EQ(listener->server(), server);
    EXPECT_EQ(listener->status(), "Created");
    EXPECT_EQ(listener->addr(), "127.0.0.1:8080");
    EXPECT_EQ(listener->configured_options().at("URLS"), "/a,/b");
    EXPECT_EQ(listener->configured_options().at("Protocol"), "HTTP");
}

TEST_F(ListenerTest, CreatedListenersAreSolelyOwned) {
    auto tcp = TcpListener::create("t", tcp_options());
    EXPECT_EQ(tcp.use_count(), 1);

    Options options = {
        {"Protocol", "http"}, {"Name", "H1"}, {"Interface", "127.0.0.1"}, {"Port", "8080"},
        {"PSK", "merlin"}, {"Transforms", "aes,gob-base"}
    };
    auto server = HttpServer::create("id", options);
    EXPECT_EQ(server.use_count(), 1);

    // The server only holds a weak reference to its listener
    auto listener = HttpListener::create("id", options, server);
    EXPECT_EQ(listener.use_count(), 1);
    std::weak_ptr<HttpListener> weak = listener;
    listener.reset();
    EXPECT_TRUE(weak.expired());
    EXPECT_THROW(server->dispatch(agent_id_, {0x01}), LifecycleError);
}

TEST_F(ListenerTest, HttpServerRejectsTlsProtocols) {
    Options options = {{"Protocol", "https"}, {"Interface", "127.0.0.1"}, {"Port", "443"}};
    EXPECT_THROW(HttpServer::create("id", options), ValidationError);
}

TEST_F(ListenerTest, HttpServerRejectsRelativeUrl) {
    Options options = {{"Protocol", "http"}, {"Interface", "127.0.0.1"}, {"Port", "80"}, {"URLS", "agent"}};
    EXPECT_THROW(HttpServer::create("id", options), ValidationError);
}

TEST_F(ListenerTest, ProtocolFromString) {
    EXPECT_EQ(protocol_from_string("HTTP"), Protocol::HTTP);
    EXPECT_EQ(protocol_from_string("https"), Protocol::HTTP);
    EXPECT_EQ(protocol_from_string("h2c"), Protocol::HTTP);
    EXPECT_EQ(protocol_from_string("http3"), Protocol::HTTP);
    EXPECT_EQ(protocol_from_string("Smb"), Protocol::SMB);
    EXPECT_EQ(protocol_from_string("tcp"), Protocol::TCP);
    EXPECT_EQ(protocol_from_string("udp"), Protocol::UDP);
    EXPECT_EQ(protocol_from_string("icmp"), Protocol::UNKNOWN);
    EXPECT_EQ(protocol_to_string(Protocol::SMB), "SMB");
}

// ============================================================================
// Option Tests
// ============================================================================

TEST_F(ListenerTest, SetOptionNameAndDescription) {
    auto listener = TcpListener::create("id", tcp_options());

    listener->set_option("Name", "Renamed");
    listener->set_option("description", "Updated");
    EXPECT_EQ(listener->name(), "Renamed");
    EXPECT_EQ(listener->description(), "Updated");
}

TEST_F(ListenerTest, SetOptionRejectsStructuralFields) {
    auto listener = TcpListener::create("id", tcp_options());

    EXPECT_THROW(listener->set_option("Port", "9999"), UnhandledError);
    EXPECT_THROW(listener->set_option("Transforms", "gob-base"), UnhandledError);
    EXPECT_THROW(listener->set_option("Protocol", "udp"), UnhandledError);
    EXPECT_THROW(listener->set_option("Name", " "), ValidationError);
    EXPECT_EQ(listener->port(), 7777);
    EXPECT_EQ(listener->name(), "T1");
}

// ============================================================================
// Traffic Tests
// ============================================================================

TEST_F(ListenerTest, ConstructDeconstructWithPreSharedKey) {
    auto listener = TcpListener::create("id", tcp_options());
    Message message = checkin(agent_id_);

    auto wire = listener->construct(message);
    EXPECT_EQ(listener->deconstruct(wire), message);
    EXPECT_EQ(chain_.deconstruct(wire, psk_), message);
}

TEST_F(ListenerTest, HandleWithoutAuthenticator) {
    auto listener = TcpListener::create("id", tcp_options());

    // First contact is acknowledged by the none authenticator
    Message first = exchange(*listener, agent_id_, checkin(agent_id_), psk_);
    EXPECT_EQ(first.type, MessageType::IDLE);

    Message forwarded;
    listener->set_message_handler([&](const Message& message) {
        forwarded = message;
        Message jobs;
        jobs.agent_id = message.agent_id;
        jobs.type = MessageType::JOBS;
        return jobs;
    });

    Message second = exchange(*listener, agent_id_, checkin(agent_id_), psk_);
    EXPECT_EQ(second.type, MessageType::JOBS);
    EXPECT_EQ(forwarded, checkin(agent_id_));
}

TEST_F(ListenerTest, HandleFullHandshake) {
    auto options = tcp_options();
    options["Authenticator"] = "opaque";
    auto listener = TcpListener::create("id", options);

    PakeClient client(agent_id_, psk_);
    Message challenge = exchange(*listener, agent_id_, client.begin(), psk_);
    Message result = exchange(*listener, agent_id_, client.respond(challenge), psk_);
    client.complete(result);
    ASSERT_TRUE(client.is_authenticated());

    // Post-handshake traffic uses the session key
    auto session_key = *client.session_key();
    Message reply = exchange(*listener, agent_id_, checkin(agent_id_), session_key);
    EXPECT_EQ(reply.type, MessageType::IDLE);
    EXPECT_EQ(reply.agent_id, agent_id_);
}

TEST_F(ListenerTest, HandleRejectsTrafficBeforeHandshake) {
    auto options = tcp_options();
    options["Authenticator"] = "opaque";
    auto listener = TcpListener::create("id", options);

    EXPECT_THROW(listener->handle(agent_id_, chain_.construct(checkin(agent_id_), psk_)), AuthenticationError);
}

TEST_F(ListenerTest, HandleRestartsHandshakeUnderPreSharedKey) {
    auto options = tcp_options();
    options["Authenticator"] = "opaque";
    auto listener = TcpListener::create("id", options);

    PakeClient client(agent_id_, psk_);
    Message challenge = exchange(*listener, agent_id_, client.begin(), psk_);
    client.complete(exchange(*listener, agent_id_, client.respond(challenge), psk_));

    // Agent restarted and lost its session key
    PakeClient restarted(agent_id_, psk_);
    Message new_challenge = exchange(*listener, agent_id_, restarted.begin(), psk_);
    restarted.complete(exchange(*listener, agent_id_, restarted.respond(new_challenge), psk_));
    EXPECT_TRUE(restarted.is_authenticated());

    Message reply = exchange(*listener, agent_id_, checkin(agent_id_), *restarted.session_key());
    EXPECT_EQ(reply.type, MessageType::IDLE);
}

TEST_F(ListenerTest, PreSharedKeyTrafficKeepsSession) {
    auto options = tcp_options();
    options["Authenticator"] = "opaque";
    auto listener = TcpListener::create("id", options);

    PakeClient client(agent_id_, psk_);
    Message challenge = exchange(*listener, agent_id_, client.begin(), psk_);
    client.complete(exchange(*listener, agent_id_, client.respond(challenge), psk_));
    auto session_key = *client.session_key();

    // Anyone holding the pre-shared key can claim the agent ID
    EXPECT_THROW(listener->handle(agent_id_, chain_.construct(checkin(agent_id_), psk_)),
                 AuthenticationError);

    Message junk;
    junk.agent_id = agent_id_;
    junk.type = MessageType::OPAQUE;
    junk.payload = {'{', '}'};
    EXPECT_THROW(listener->handle(agent_id_, chain_.construct(junk, psk_)), AuthenticationError);

    Message reply = exchange(*listener, agent_id_, checkin(agent_id_), session_key);
    EXPECT_EQ(reply.type, MessageType::IDLE);
}

TEST_F(ListenerTest, UnfinishedHandshakeKeepsSession) {
    auto options = tcp_options();
    options["Authenticator"] = "opaque";
    auto listener = TcpListener::create("id", options);

    PakeClient client(agent_id_, psk_);
    Message challenge = exchange(*listener, agent_id_, client.begin(), psk_);
    client.complete(exchange(*listener, agent_id_, client.respond(challenge), psk_));

    PakeClient impostor(agent_id_, psk_);
    exchange(*listener, agent_id_, impostor.begin(), psk_);

    Message reply = exchange(*listener, agent_id_, checkin(agent_id_), *client.session_key());
    EXPECT_EQ(reply.type, MessageType::IDLE);
}

TEST_F(ListenerTest, HandleRejectsWrongKey) {
    auto listener = TcpListener::create("id", tcp_options());
    auto wrong = Crypto::derive_pre_shared_key("other");

    EXPECT_THROW(listener->handle(agent_id_, chain_.construct(checkin(agent_id_), wrong)), TransformError);
}

TEST_F(ListenerTest, HandleRejectsMismatchedAgentId) {
    auto listener = TcpListener::create("id", tcp_options());

    EXPECT_THROW(listener->handle("someone-else", chain_.construct(checkin(agent_id_), psk_)),
                 AuthenticationError);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
