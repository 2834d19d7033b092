#include "messaging/EventSender.hh"
#include "messaging/MessageHelper.hh"
#include "messaging/Sockets.hh"
#include "Blob.hh"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace Trio::BlobLiterals;
using namespace Trio::Messaging;

namespace {

constexpr auto ENDPOINT = std::string_view {"inproc://trio.test.eventsender"};
const auto IDENTITY = Identity {"alice"_B};

}

class EventSenderTest : public testing::Test {
protected:
    virtual void SetUp()
    {
        serverSocket->set(zmq::sockopt::router_mandatory, 1);
        bindSocket(*serverSocket, ENDPOINT);
        clientSocket.set(zmq::sockopt::routing_id, "alice");
        connectSocket(clientSocket, ENDPOINT);
        // ROUTER learns the routing id only after the peer has spoken
        sendFrames(clientSocket, {"hello"});
        auto frames = std::vector<Message> {};
        recvMultipart(*serverSocket, std::back_inserter(frames));
        ASSERT_FALSE(frames.empty());
        ASSERT_EQ("alice", frames.front().to_string());
    }

    MessageContext context;
    Socket clientSocket {context, SocketType::dealer};
    SharedSocket serverSocket {makeSharedSocket(context, SocketType::router)};
    RouterEventSender eventSender {serverSocket};
};

TEST_F(EventSenderTest, testEventFrames)
{
    const auto params = nlohmann::json {
        {"player_name", "Alice"}, {"player_count", 1}};
    EXPECT_TRUE(eventSender.send(IDENTITY, "ABCDE:player_joined", params));
    const auto frames = recvFrames(clientSocket);
    EXPECT_EQ(
        (std::vector<std::string> {
            "ABCDE:player_joined", "player_count", "1",
            "player_name", "\"Alice\""}),
        frames);
}

TEST_F(EventSenderTest, testEventWithoutParameters)
{
    EXPECT_TRUE(
        eventSender.send(IDENTITY, "ABCDE:game_over", nlohmann::json::object()));
    EXPECT_EQ(
        std::vector<std::string> {"ABCDE:game_over"}, recvFrames(clientSocket));
}

TEST_F(EventSenderTest, testUnreachableIdentity)
{
    EXPECT_FALSE(
        eventSender.send(
            Identity {"bob"_B}, "ABCDE:your_turn", nlohmann::json::object()));
}

TEST_F(EventSenderTest, testParametersMustBeObject)
{
    EXPECT_THROW(
        eventSender.send(IDENTITY, "ABCDE:chat", nlohmann::json::array()),
        std::invalid_argument);
}
