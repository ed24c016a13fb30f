#include <gtest/gtest.h>
#include "realtime_server.h"
#include "socket.h"
#include "test_helpers.h"
#include <thread>

using namespace cloudless;
using namespace cloudless::testing_support;

class RealtimeServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auth_.add_token("tok-alice", "alice");
        auth_.add_token("tok-bob", "bob");
        store_.insert_room(make_room("r1"));
        store_.upsert_member(make_member("r1", "alice"));
        store_.upsert_member(make_member("r1", "bob"));

        ASSERT_TRUE(server_.start());
        ASSERT_GT(server_.get_port(), 0);
    }

    void TearDown() override {
        server_.stop();
        for (socket_t s : clients_) {
            close_socket(s);
        }
    }

    socket_t connect_client() {
        socket_t s = create_tcp_client("127.0.0.1", server_.get_port());
        EXPECT_TRUE(is_valid_socket(s));
        clients_.push_back(s);
        return s;
    }

    socket_t connect_and_hello(const std::string& token, const std::string& room_id = "r1") {
        socket_t s = connect_client();
        nlohmann::json hello = {{"type", "hello"}, {"token", token}, {"room_id", room_id}};
        EXPECT_GT(send_tcp_string_framed(s, hello.dump()), 0);
        return s;
    }

    nlohmann::json receive_frame(socket_t s) {
        std::string text;
        if (!receive_tcp_string_framed(s, text)) {
            return nlohmann::json();
        }
        return nlohmann::json::parse(text);
    }

    // Skips frames until one of the given type arrives
    nlohmann::json receive_frame_of_type(socket_t s, const std::string& type) {
        for (int i = 0; i < 10; ++i) {
            nlohmann::json frame = receive_frame(s);
            if (frame.is_null()) {
                break;
            }
            if (frame.value("type", "") == type) {
                return frame;
            }
        }
        return nlohmann::json();
    }

    MemoryRecordStore store_;
    StaticTokenVerifier auth_;
    PresenceRegistry presence_{store_};
    SignalRouter router_{store_, presence_, auth_};
    RealtimeServer server_{router_, 0, 2000};
    std::vector<socket_t> clients_;
};

TEST_F(RealtimeServerTest, HelloAdmitsConnection) {
    socket_t alice = connect_and_hello("tok-alice");
    nlohmann::json online = receive_frame(alice);
    EXPECT_EQ(online["type"], "online_users");
    EXPECT_EQ(online["users"], nlohmann::json({"alice"}));
    EXPECT_TRUE(presence_.is_user_online("r1", "alice"));
    EXPECT_EQ(server_.get_connection_count(), 1);
    EXPECT_EQ(server_.get_accepted_count(), 1u);
}

TEST_F(RealtimeServerTest, FramesFlowBetweenClients) {
    socket_t alice = connect_and_hello("tok-alice");
    ASSERT_EQ(receive_frame(alice)["type"], "online_users");
    socket_t bob = connect_and_hello("tok-bob");
    ASSERT_EQ(receive_frame(bob)["type"], "online_users");
    ASSERT_EQ(receive_frame(alice)["type"], "user_joined");

    nlohmann::json chat = {{"type", "chat"}, {"encrypted_content", "CIPHER"}, {"nonce", "N"}};
    ASSERT_GT(send_tcp_string_framed(alice, chat.dump()), 0);
    nlohmann::json received = receive_frame_of_type(bob, "chat");
    EXPECT_EQ(received["sender_id"], "alice");
    EXPECT_EQ(received["encrypted_content"], "CIPHER");

    ASSERT_GT(send_tcp_string_framed(bob, R"({"type":"ping"})"), 0);
    EXPECT_EQ(receive_frame_of_type(bob, "pong")["type"], "pong");
}

TEST_F(RealtimeServerTest, BadTokenIsClosedWith4001) {
    socket_t s = connect_and_hello("wrong");
    nlohmann::json close = receive_frame(s);
    EXPECT_EQ(close["type"], "close");
    EXPECT_EQ(close["code"], CLOSE_INVALID_TOKEN);
}

TEST_F(RealtimeServerTest, UnknownRoomIsClosedWith4004) {
    socket_t s = connect_and_hello("tok-alice", "nowhere");
    nlohmann::json close = receive_frame(s);
    EXPECT_EQ(close["type"], "close");
    EXPECT_EQ(close["code"], CLOSE_ROOM_UNAVAILABLE);
}

TEST_F(RealtimeServerTest, MissingHelloIsRejected) {
    socket_t s = connect_client();
    ASSERT_GT(send_tcp_string_framed(s, R"({"type":"ping"})"), 0);
    nlohmann::json close = receive_frame(s);
    EXPECT_EQ(close["type"], "close");
    EXPECT_EQ(close["code"], CLOSE_INVALID_TOKEN);
    EXPECT_EQ(close["reason"], "Expected hello frame");
}

TEST_F(RealtimeServerTest, ClientDisconnectReleasesPresence) {
    socket_t alice = connect_and_hello("tok-alice");
    ASSERT_EQ(receive_frame(alice)["type"], "online_users");
    socket_t bob = connect_and_hello("tok-bob");
    ASSERT_EQ(receive_frame(bob)["type"], "online_users");

    shutdown_socket(bob);
    nlohmann::json left = receive_frame_of_type(alice, "user_left");
    EXPECT_EQ(left["user_id"], "bob");
    EXPECT_FALSE(presence_.is_user_online("r1", "bob"));
}

TEST_F(RealtimeServerTest, StopClosesOpenConnections) {
    socket_t alice = connect_and_hello("tok-alice");
    ASSERT_EQ(receive_frame(alice)["type"], "online_users");

    server_.stop();
    EXPECT_FALSE(server_.is_running());
    nlohmann::json close = receive_frame_of_type(alice, "close");
    EXPECT_EQ(close["code"], CLOSE_NORMAL);
    EXPECT_EQ(server_.get_connection_count(), 0);
    EXPECT_FALSE(presence_.is_user_online("r1", "alice"));
}
