// ApiTests.cpp
// Gateway requests end to end through the API worker, against a fake
// receiver and a fake network scan.

#include <gtest/gtest.h>

#include <thread>

#include "FakeCastDevice.hpp"
#include "castd/Api.hpp"
#include "castd/Errors.hpp"
#include "castd/JsonUtil.hpp"

using namespace castd;
using namespace castd::fakes;
using namespace std::chrono_literals;

namespace {

CasterOptions fast_options() {
    CasterOptions options;
    options.status.first_poll_delay = 20ms;
    options.status.poll_interval = 20ms;
    options.status.receive_timeout = 10ms;
    options.status.reply_timeout = 500ms;
    return options;
}

Discovery living_room_network() {
    auto fetcher = std::make_unique<FakeDescriptionFetcher>();
    fetcher->add("http://10.0.0.5:8008/ssdp/device-desc.xml", device_description("LivingRoomTV"));
    return Discovery(std::make_unique<FakeServiceBrowser>(std::vector<std::string>{"10.0.0.5"}),
                     std::move(fetcher));
}

ApiRequest make(ApiRequest::Kind kind) {
    ApiRequest request;
    request.kind = kind;
    return request;
}

ApiRequest select_request(const std::string& address) {
    ApiRequest request = make(ApiRequest::Kind::SelectDevice);
    request.address = address;
    return request;
}

ApiRequest control(Command command) {
    ApiRequest request = make(ApiRequest::Kind::Control);
    request.command = command;
    return request;
}

Json::Value body_of(const ApiReply& reply) {
    auto parsed = parse_json(reply.body);
    return parsed ? *parsed : Json::Value();
}

class ApiTests : public ::testing::Test {
   protected:
    std::shared_ptr<FakeCastDevice> receiver = std::make_shared<FakeCastDevice>();
    Caster caster{std::make_shared<FakeCastConnector>(receiver), fast_options()};
    Discovery discovery = living_room_network();
    Api api{caster, discovery, 8000, 10ms};

    ApiReply call(const ApiRequest& request) { return api.handle(request); }

    std::string playback_state() {
        return body_of(call(make(ApiRequest::Kind::MediaStatus)))["playbackState"].asString();
    }
};

}  // namespace

TEST_F(ApiTests, StatusBeforeAnySessionIsInactive) {
    ApiReply reply = call(make(ApiRequest::Kind::MediaStatus));

    EXPECT_EQ(reply.status, 200u);
    EXPECT_EQ(reply.body, R"({"playbackState":"Inactive"})");
}

TEST_F(ApiTests, DiscoverThenListDevices) {
    EXPECT_EQ(call(make(ApiRequest::Kind::Discover)).status, 200u);

    Json::Value devices = body_of(call(make(ApiRequest::Kind::Devices)));
    ASSERT_TRUE(devices.isArray());
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0]["name"].asString(), "LivingRoomTV");
    EXPECT_EQ(devices[0]["address"].asString(), "10.0.0.5");
}

TEST_F(ApiTests, SelectBeforeDiscoveryIsConflict) {
    ApiReply reply = call(select_request("10.0.0.5"));

    EXPECT_EQ(reply.status, 409u);
    EXPECT_EQ(body_of(reply)["error"].asString(), "DeviceNotFound");
}

TEST_F(ApiTests, PlayWithoutSelectionIsConflict) {
    ApiReply reply = call(control(Command::play()));

    EXPECT_EQ(reply.status, 409u);
    EXPECT_EQ(body_of(reply)["error"].asString(), "NoDeviceSelected");
}

TEST_F(ApiTests, PlayWithoutMediaSendsNothing) {
    call(make(ApiRequest::Kind::Discover));
    call(select_request("10.0.0.5"));

    ApiReply reply = call(control(Command::play()));

    EXPECT_EQ(reply.status, 409u);
    EXPECT_EQ(body_of(reply)["error"].asString(), "NoActiveMedia");
    EXPECT_TRUE(receiver->media_commands().empty());
}

TEST_F(ApiTests, CastByIndexIsApplicationError) {
    call(make(ApiRequest::Kind::Discover));
    call(select_request("10.0.0.5"));

    ApiReply reply = call(control(Command::begin(0)));

    EXPECT_EQ(reply.status, 400u);
    EXPECT_EQ(body_of(reply)["error"].asString(), "ApplicationError");
}

TEST_F(ApiTests, UnreachableDeviceIsBadGateway) {
    call(make(ApiRequest::Kind::Discover));
    call(select_request("10.0.0.5"));
    receiver->set_refuse_connections(true);

    ApiReply reply = call(make(ApiRequest::Kind::Begin));

    EXPECT_EQ(reply.status, 502u);
    EXPECT_EQ(body_of(reply)["error"].asString(), "TransportError");
}

TEST_F(ApiTests, BeginUsesRequestedPort) {
    call(make(ApiRequest::Kind::Discover));
    call(select_request("10.0.0.5"));

    ApiRequest begin = make(ApiRequest::Kind::Begin);
    begin.port = 9100;
    ASSERT_EQ(call(begin).status, 200u);

    EXPECT_EQ(receiver->loaded_content_id(), "http://192.168.1.20:9100");
    EXPECT_EQ(call(make(ApiRequest::Kind::Close)).status, 200u);
}

TEST_F(ApiTests, LivingRoomSession) {
    ASSERT_EQ(call(make(ApiRequest::Kind::Discover)).status, 200u);
    ASSERT_EQ(call(select_request("10.0.0.5")).status, 200u);
    ASSERT_EQ(call(make(ApiRequest::Kind::Begin)).status, 200u);
    EXPECT_EQ(receiver->loaded_content_id(), "http://192.168.1.20:8000");

    ASSERT_TRUE(eventually([&] { return playback_state() == "PLAYING"; }));
    Json::Value status = body_of(call(make(ApiRequest::Kind::MediaStatus)));
    EXPECT_DOUBLE_EQ(status["videoLength"].asDouble(), 120.5);
    EXPECT_FALSE(status.isMember("linkLost"));

    EXPECT_EQ(call(control(Command::pause())).status, 200u);
    EXPECT_TRUE(eventually([&] { return playback_state() == "PAUSED"; }));

    EXPECT_EQ(call(control(Command::seek(60.0))).status, 200u);
    EXPECT_EQ(call(control(Command::play())).status, 200u);
    EXPECT_TRUE(eventually([&] { return playback_state() == "PLAYING"; }));

    ApiReply again = call(make(ApiRequest::Kind::Begin));
    EXPECT_EQ(again.status, 409u);
    EXPECT_EQ(body_of(again)["error"].asString(), "AlreadyStreaming");

    EXPECT_EQ(call(make(ApiRequest::Kind::Close)).status, 200u);
    EXPECT_EQ(receiver->media_commands(),
              (std::vector<std::string>{"LOAD", "PAUSE", "SEEK", "PLAY", "STOP"}));
}

TEST_F(ApiTests, StatusReportsLostLink) {
    call(make(ApiRequest::Kind::Discover));
    call(select_request("10.0.0.5"));
    ASSERT_EQ(call(make(ApiRequest::Kind::Begin)).status, 200u);
    ASSERT_TRUE(eventually([&] { return playback_state() == "PLAYING"; }));

    receiver->drop_link();

    ASSERT_TRUE(eventually([&] { return caster.link_lost(); }));
    Json::Value status = body_of(call(make(ApiRequest::Kind::MediaStatus)));
    EXPECT_TRUE(status["linkLost"].asBool());
    // Last known status is kept
    EXPECT_EQ(status["playbackState"].asString(), "PLAYING");
}

TEST(RequestQueueTests, WorkerAnswersInOrder) {
    auto receiver = std::make_shared<FakeCastDevice>();
    Caster caster(std::make_shared<FakeCastConnector>(receiver), fast_options());
    Discovery discovery = living_room_network();
    Api api(caster, discovery, 8000, 10ms);
    RequestQueue queue;
    std::thread worker([&] { serve(api, queue); });

    auto discover = queue.submit(make(ApiRequest::Kind::Discover));
    auto devices = queue.submit(make(ApiRequest::Kind::Devices));

    EXPECT_EQ(discover.get().status, 200u);
    EXPECT_EQ(body_of(devices.get()).size(), 1u);

    queue.close();
    worker.join();
}

TEST(RequestQueueTests, SubmitAfterCloseThrows) {
    RequestQueue queue;
    queue.close();

    EXPECT_THROW(queue.submit(make(ApiRequest::Kind::MediaStatus)), ApplicationError);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(RequestQueueTests, CloseDrainsPendingRequests) {
    RequestQueue queue;
    auto reply = queue.submit(make(ApiRequest::Kind::MediaStatus));
    queue.close();

    auto pending = queue.pop();
    ASSERT_TRUE(pending.has_value());
    pending->reply.set_value(ApiReply{200, "{}"});
    EXPECT_EQ(reply.get().body, "{}");
    EXPECT_FALSE(queue.pop().has_value());
}
