#include "DnsToggle.hpp"
#include "Errors.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::_;
using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::IsEmpty;
using ::testing::Return;
using ::testing::Throw;

namespace {

class MockNetworkdBus : public NetworkdBus {
public:
  MOCK_METHOD(int32_t, getLinkByName, (const std::string &name), (override));
  MOCK_METHOD(void, setLinkDomains,
              (int32_t ifindex, const std::vector<LinkDomain> &domains),
              (override));
};

Config makeConfig() {
  Config config{};
  config.vpn_interface = "wg0";
  config.wifi_interface = "wlan0";
  config.manage_dns = true;
  return config;
}

} // namespace

TEST(DnsToggleTests, EnableRoutesAllDomainsThroughVpn) {
  Config config = makeConfig();
  MockNetworkdBus networkd;
  DnsToggle dns(config, networkd);

  InSequence order;
  EXPECT_CALL(networkd, getLinkByName("wg0")).WillOnce(Return(12));
  EXPECT_CALL(networkd,
              setLinkDomains(12, ElementsAre(AllOf(
                                     Field(&LinkDomain::name, ""),
                                     Field(&LinkDomain::routing_only, true)))));

  dns.handle(ControlMessage::ENABLE);
}

TEST(DnsToggleTests, DisableClearsDomains) {
  Config config = makeConfig();
  MockNetworkdBus networkd;
  DnsToggle dns(config, networkd);

  EXPECT_CALL(networkd, getLinkByName("wg0")).WillOnce(Return(12));
  EXPECT_CALL(networkd, setLinkDomains(12, IsEmpty()));

  dns.handle(ControlMessage::DISABLE);
}

TEST(DnsToggleTests, QuitDoesNothing) {
  Config config = makeConfig();
  MockNetworkdBus networkd;
  DnsToggle dns(config, networkd);

  EXPECT_CALL(networkd, getLinkByName(_)).Times(0);
  EXPECT_CALL(networkd, setLinkDomains(_, _)).Times(0);
  dns.handle(ControlMessage::QUIT);
}

TEST(DnsToggleTests, BusFailureIsLoggedNotThrown) {
  Config config = makeConfig();
  MockNetworkdBus networkd;
  DnsToggle dns(config, networkd);

  EXPECT_CALL(networkd, getLinkByName("wg0"))
      .WillRepeatedly(Throw(SystemBusError(
          "GetLinkByName: org.freedesktop.network1.LinkUnknown: no such link")));
  EXPECT_CALL(networkd, setLinkDomains(_, _)).Times(0);

  EXPECT_NO_THROW(dns.handle(ControlMessage::ENABLE));
  EXPECT_THROW(dns.disable(), SystemBusError);
}

TEST(DnsToggleTests, LinkIsLookedUpEveryTime) {
  Config config = makeConfig();
  MockNetworkdBus networkd;
  DnsToggle dns(config, networkd);

  // networkd recreated the link in between
  EXPECT_CALL(networkd, getLinkByName("wg0"))
      .WillOnce(Return(12))
      .WillOnce(Return(15));
  EXPECT_CALL(networkd, setLinkDomains(12, _));
  EXPECT_CALL(networkd, setLinkDomains(15, _));

  dns.enable();
  dns.disable();
}
