// DiscoveryTests.cpp
// Address de-duplication, friendly-name resolution and failure handling.

#include <gtest/gtest.h>

#include "FakeCastDevice.hpp"
#include "castd/Discovery.hpp"
#include "castd/Errors.hpp"

using namespace castd;
using namespace castd::fakes;

namespace {

constexpr std::chrono::milliseconds kScan{10};

}  // namespace

TEST(DiscoveryTests, DescriptionUrl) {
    EXPECT_EQ(description_url(boost::asio::ip::make_address("10.0.0.5")),
              "http://10.0.0.5:8008/ssdp/device-desc.xml");
    EXPECT_EQ(description_url(boost::asio::ip::make_address("fe80::1")),
              "http://[fe80::1]:8008/ssdp/device-desc.xml");
}

TEST(DiscoveryTests, ExtractFriendlyName) {
    EXPECT_EQ(extract_friendly_name(device_description("Kitchen speaker")), "Kitchen speaker");
    EXPECT_EQ(extract_friendly_name("<friendlyName></friendlyName>"), "");
    EXPECT_FALSE(extract_friendly_name("<root><device/></root>").has_value());
}

TEST(DiscoveryTests, DuplicateAddressesCollapse) {
    auto browser = std::make_unique<FakeServiceBrowser>(
        std::vector<std::string>{"10.0.0.5", "10.0.0.7", "10.0.0.5", "10.0.0.5"});
    auto fetcher = std::make_unique<FakeDescriptionFetcher>();
    fetcher->add("http://10.0.0.5:8008/ssdp/device-desc.xml", device_description("LivingRoomTV"));
    fetcher->add("http://10.0.0.7:8008/ssdp/device-desc.xml", device_description("Bedroom"));
    FakeDescriptionFetcher* fetcher_view = fetcher.get();

    Discovery discovery(std::move(browser), std::move(fetcher));
    auto devices = discovery.run(kScan);

    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].friendly_name, "LivingRoomTV");
    EXPECT_EQ(devices[0].address.to_string(), "10.0.0.5");
    EXPECT_EQ(devices[1].friendly_name, "Bedroom");
    EXPECT_EQ(devices[1].address.to_string(), "10.0.0.7");
    // One description fetch per unique address
    EXPECT_EQ(fetcher_view->fetched.size(), 2u);
}

TEST(DiscoveryTests, UnreachableDescriptionFallsBackToUnknown) {
    Discovery discovery(std::make_unique<FakeServiceBrowser>(std::vector<std::string>{"10.0.0.9"}),
                        std::make_unique<FakeDescriptionFetcher>());
    auto devices = discovery.run(kScan);

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].friendly_name, kUnknownDeviceName);
}

TEST(DiscoveryTests, DescriptionWithoutNameFallsBackToUnknown) {
    auto fetcher = std::make_unique<FakeDescriptionFetcher>();
    fetcher->add("http://10.0.0.9:8008/ssdp/device-desc.xml", "<root/>");
    Discovery discovery(std::make_unique<FakeServiceBrowser>(std::vector<std::string>{"10.0.0.9"}),
                        std::move(fetcher));

    EXPECT_EQ(discovery.run(kScan).at(0).friendly_name, kUnknownDeviceName);
}

TEST(DiscoveryTests, EmptyScanIsNotAnError) {
    Discovery discovery(std::make_unique<FakeServiceBrowser>(std::vector<std::string>{}),
                        std::make_unique<FakeDescriptionFetcher>());
    EXPECT_TRUE(discovery.run(kScan).empty());
}

TEST(DiscoveryTests, BrowserFailurePropagates) {
    Discovery discovery(std::make_unique<FakeServiceBrowser>(std::vector<std::string>{}, true),
                        std::make_unique<FakeDescriptionFetcher>());
    EXPECT_THROW(discovery.run(kScan), DiscoveryError);
}
