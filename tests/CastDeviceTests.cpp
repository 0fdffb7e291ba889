// CastDeviceTests.cpp
// Request/reply matching, heartbeat handling and reply parsing.

#include <gtest/gtest.h>

#include "FakeCastDevice.hpp"
#include "castd/CastDevice.hpp"
#include "castd/Errors.hpp"
#include "castd/JsonUtil.hpp"

using namespace castd;
using namespace castd::fakes;

namespace {

class CastDeviceTests : public ::testing::Test {
   protected:
    std::shared_ptr<FakeCastDevice> receiver = std::make_shared<FakeCastDevice>();
    FakeCastChannel channel{receiver};
    CastDevice device{channel, std::chrono::milliseconds(200)};
};

Json::Value json(const std::string& text) {
    auto parsed = parse_json(text);
    return parsed ? *parsed : Json::Value();
}

}  // namespace

TEST_F(CastDeviceTests, LaunchReturnsTransport) {
    device.connect(kReceiverId);
    Application app = device.launch(kDefaultMediaReceiverAppId);

    EXPECT_EQ(app.app_id, kDefaultMediaReceiverAppId);
    EXPECT_EQ(app.transport_id, kFakeTransportId);
    EXPECT_EQ(app.session_id, kFakeSessionId);
    EXPECT_EQ(receiver->connects(), std::vector<std::string>{kReceiverId});
}

TEST_F(CastDeviceTests, LaunchErrorIsProtocolError) {
    receiver->set_fail_launch(true);
    try {
        device.launch(kDefaultMediaReceiverAppId);
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_NE(std::string(e.what()).find("LAUNCH_ERROR"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("NOT_ALLOWED"), std::string::npos);
    }
}

TEST_F(CastDeviceTests, MissingReplyTimesOut) {
    receiver->set_unresponsive(true);
    EXPECT_THROW(device.receiver_status(), ProtocolError);
}

TEST_F(CastDeviceTests, AnswersPingWhileWaitingForReply) {
    receiver->set_app_running(true);
    receiver->queue_ping();

    auto apps = device.receiver_status();

    ASSERT_EQ(apps.size(), 1u);
    EXPECT_EQ(receiver->pongs(), 1);
}

TEST_F(CastDeviceTests, SkipsUnrelatedMessages) {
    receiver->set_app_running(true);
    channel.push_incoming(make_string_message(kReceiverId, "*", ns::kReceiver,
                                              "{\"type\":\"RECEIVER_STATUS\",\"requestId\":0,"
                                              "\"status\":{\"applications\":[]}}"));
    channel.push_incoming(make_string_message(kReceiverId, "*", "urn:x-cast:com.example", "hello"));

    auto apps = device.receiver_status();
    ASSERT_EQ(apps.size(), 1u);
    EXPECT_EQ(apps.front().transport_id, kFakeTransportId);
}

TEST_F(CastDeviceTests, ReplyOnOtherNamespaceIsSkipped) {
    receiver->set_app_running(true);
    // Same requestId as the coming GET_STATUS, but from the media namespace.
    channel.push_incoming(make_string_message(kFakeTransportId, kSenderId, ns::kMedia,
                                              "{\"type\":\"MEDIA_STATUS\",\"requestId\":1,"
                                              "\"status\":[]}"));

    auto apps = device.receiver_status();

    ASSERT_EQ(apps.size(), 1u);
    EXPECT_EQ(apps.front().transport_id, kFakeTransportId);
}

TEST_F(CastDeviceTests, RequestIdsContinueAcrossDevices) {
    receiver->set_app_running(true);
    device.connect(kReceiverId);
    device.launch(kDefaultMediaReceiverAppId);
    device.receiver_status();
    ASSERT_EQ(device.next_request_id(), 3);

    // A late duplicate of the first reply must not satisfy the next device's
    // first request.
    channel.push_incoming(make_string_message(kReceiverId, kSenderId, ns::kReceiver,
                                              "{\"type\":\"RECEIVER_STATUS\",\"requestId\":1,"
                                              "\"status\":{\"applications\":[]}}"));
    CastDevice next{channel, std::chrono::milliseconds(200), device.next_request_id()};

    auto apps = next.receiver_status();

    ASSERT_EQ(apps.size(), 1u);
    EXPECT_EQ(next.next_request_id(), 4);
}

TEST_F(CastDeviceTests, LoadThenCommandsDriveMediaStatus) {
    device.launch(kDefaultMediaReceiverAppId);
    MediaInfo media;
    media.content_id = "http://192.168.1.20:8000";
    auto loaded = device.load(kFakeTransportId, kFakeSessionId, media);

    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded.front().player_state, PlayerState::Playing);
    EXPECT_EQ(receiver->loaded_content_id(), media.content_id);

    device.pause(kFakeTransportId, loaded.front().media_session_id);
    device.seek(kFakeTransportId, loaded.front().media_session_id, 42.0);
    auto entries = device.media_status(kFakeTransportId);

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries.front().player_state, PlayerState::Paused);
    EXPECT_DOUBLE_EQ(entries.front().current_time, 42.0);
    ASSERT_TRUE(entries.front().duration.has_value());
    EXPECT_DOUBLE_EQ(*entries.front().duration, 120.5);
    EXPECT_EQ(receiver->media_commands(), (std::vector<std::string>{"LOAD", "PAUSE", "SEEK"}));
}

TEST_F(CastDeviceTests, ReceiveClassifiesNamespaces) {
    channel.push_incoming(make_string_message(kReceiverId, kSenderId, ns::kHeartbeat, "{\"type\":\"PING\"}"));
    channel.push_incoming(make_string_message(kReceiverId, kSenderId, ns::kConnection, "{\"type\":\"CLOSE\"}"));
    channel.push_incoming(make_string_message(kReceiverId, kSenderId, ns::kMedia, "not json"));

    auto ping = device.receive(std::chrono::milliseconds(50));
    auto close = device.receive(std::chrono::milliseconds(50));
    auto garbage = device.receive(std::chrono::milliseconds(50));

    ASSERT_TRUE(ping && close && garbage);
    EXPECT_EQ(ping->kind, MessageKind::Heartbeat);
    EXPECT_EQ(ping->type, "PING");
    EXPECT_EQ(close->kind, MessageKind::Connection);
    EXPECT_EQ(garbage->kind, MessageKind::Unparsed);
    EXPECT_EQ(garbage->raw, "not json");
    EXPECT_FALSE(device.receive(std::chrono::milliseconds(10)).has_value());
}

TEST_F(CastDeviceTests, LinkFailureIsTransportError) {
    receiver->drop_link();
    EXPECT_THROW(device.receive(std::chrono::milliseconds(10)), TransportError);
    EXPECT_THROW(device.connect(kReceiverId), TransportError);
}

TEST(CastDeviceParseTests, MediaEntriesWithoutDuration) {
    auto entries = parse_media_entries(json(
        R"({"type":"MEDIA_STATUS","status":[{"mediaSessionId":7,"playerState":"BUFFERING","currentTime":3.5}]})"));

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries.front().media_session_id, 7);
    EXPECT_EQ(entries.front().player_state, PlayerState::Buffering);
    EXPECT_DOUBLE_EQ(entries.front().current_time, 3.5);
    EXPECT_FALSE(entries.front().duration.has_value());
}

TEST(CastDeviceParseTests, EmptyStatusMeansNoEntries) {
    EXPECT_TRUE(parse_media_entries(json(R"({"type":"MEDIA_STATUS","status":[]})")).empty());
    EXPECT_TRUE(parse_applications(json(R"({"type":"RECEIVER_STATUS","status":{}})")).empty());
}

TEST(CastDeviceParseTests, UnknownPlayerStateIsProtocolError) {
    EXPECT_THROW(parse_media_entries(json(R"({"status":[{"playerState":"REWINDING"}]})")),
                 ProtocolError);
}

TEST(CastDeviceParseTests, MistypedFieldIsProtocolError) {
    EXPECT_THROW(parse_media_entries(json(R"({"status":[{"currentTime":"soon"}]})")),
                 ProtocolError);
}
