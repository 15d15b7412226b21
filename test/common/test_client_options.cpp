#include <gtest/gtest.h>
#include <stdexcept>
#include "async_modbus/common/client_options.hpp"

using asyncmb::ClientOptions;
using asyncmb::kDefaultModbusTcpPort;
using asyncmb::ParseRegisterNumber;
using asyncmb::ParseTarget;

TEST(ParseTarget, HostOnlyUsesDefaultPort) {
  auto target = ParseTarget("192.168.0.10");
  EXPECT_EQ(target.host, "192.168.0.10");
  EXPECT_EQ(target.port, kDefaultModbusTcpPort);
  EXPECT_EQ(kDefaultModbusTcpPort, 502);
}

TEST(ParseTarget, HostAndPort) {
  auto target = ParseTarget("plc.local:1502");
  EXPECT_EQ(target.host, "plc.local");
  EXPECT_EQ(target.port, 1502);

  EXPECT_EQ(ParseTarget("localhost:65535").port, 65535);
}

TEST(ParseTarget, RejectsMalformedAddresses) {
  EXPECT_THROW((void)ParseTarget(""), std::invalid_argument);
  EXPECT_THROW((void)ParseTarget(":502"), std::invalid_argument);
  EXPECT_THROW((void)ParseTarget("host:"), std::invalid_argument);
  EXPECT_THROW((void)ParseTarget("host:0"), std::invalid_argument);
  EXPECT_THROW((void)ParseTarget("host:65536"), std::invalid_argument);
  EXPECT_THROW((void)ParseTarget("host:50x"), std::invalid_argument);
  EXPECT_THROW((void)ParseTarget("host:-1"), std::invalid_argument);
}

TEST(ParseTarget, BareIpv6LiteralIsAllHost) {
  auto target = ParseTarget("fe80::1");
  EXPECT_EQ(target.host, "fe80::1");
  EXPECT_EQ(target.port, kDefaultModbusTcpPort);

  target = ParseTarget("2001:db8::5:502");
  EXPECT_EQ(target.host, "2001:db8::5:502");
  EXPECT_EQ(target.port, kDefaultModbusTcpPort);
}

TEST(ParseTarget, BracketedIpv6) {
  auto target = ParseTarget("[fe80::1]:1502");
  EXPECT_EQ(target.host, "fe80::1");
  EXPECT_EQ(target.port, 1502);

  target = ParseTarget("[::1]");
  EXPECT_EQ(target.host, "::1");
  EXPECT_EQ(target.port, kDefaultModbusTcpPort);

  EXPECT_THROW((void)ParseTarget("[::1"), std::invalid_argument);
  EXPECT_THROW((void)ParseTarget("[]:502"), std::invalid_argument);
  EXPECT_THROW((void)ParseTarget("[::1]502"), std::invalid_argument);
  EXPECT_THROW((void)ParseTarget("[::1]:"), std::invalid_argument);
  EXPECT_THROW((void)ParseTarget("[::1]:70000"), std::invalid_argument);
}

TEST(ClientOptions, Defaults) {
  ClientOptions options;
  EXPECT_TRUE(options.address.empty());
  EXPECT_EQ(options.timeout.count(), 1000);
  EXPECT_EQ(options.unit_id, 1);
}

TEST(ParseRegisterNumber, AcceptsFullRange) {
  EXPECT_EQ(ParseRegisterNumber("0"), 0);
  EXPECT_EQ(ParseRegisterNumber("300"), 300);
  EXPECT_EQ(ParseRegisterNumber("65535"), 65535);
}

TEST(ParseRegisterNumber, RejectsOutOfRangeInsteadOfWrapping) {
  EXPECT_THROW((void)ParseRegisterNumber("65536"), std::invalid_argument);
  EXPECT_THROW((void)ParseRegisterNumber("70000"), std::invalid_argument);
  EXPECT_THROW((void)ParseRegisterNumber("99999999999999999999"), std::invalid_argument);
  EXPECT_THROW((void)ParseRegisterNumber("-1"), std::invalid_argument);
  EXPECT_THROW((void)ParseRegisterNumber(""), std::invalid_argument);
  EXPECT_THROW((void)ParseRegisterNumber("12abc"), std::invalid_argument);
}
