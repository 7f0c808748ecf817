#include <gtest/gtest.h>

#include <stdexcept>

#include "titan_api/server.hpp"

namespace titan_api {

TEST(BindAddressTest, ParsesHostAndPort) {
  auto address = BindAddress::parse("127.0.0.1:3030");
  EXPECT_EQ(address.host, "127.0.0.1");
  EXPECT_EQ(address.port, 3030);
}

TEST(BindAddressTest, AcceptsSchemeAndTrailingSlash) {
  auto address = BindAddress::parse("http://0.0.0.0:8080/");
  EXPECT_EQ(address.host, "0.0.0.0");
  EXPECT_EQ(address.port, 8080);
}

TEST(BindAddressTest, RejectsMalformedAddresses) {
  EXPECT_THROW(BindAddress::parse("localhost"), std::invalid_argument);
  EXPECT_THROW(BindAddress::parse(":3030"), std::invalid_argument);
  EXPECT_THROW(BindAddress::parse("localhost:"), std::invalid_argument);
  EXPECT_THROW(BindAddress::parse("localhost:http"), std::invalid_argument);
  EXPECT_THROW(BindAddress::parse("localhost:0"), std::invalid_argument);
  EXPECT_THROW(BindAddress::parse("localhost:70000"), std::invalid_argument);
}

TEST(ServerTest, RequiresWorkers) {
  EXPECT_THROW(Server(BindAddress::parse("127.0.0.1:3030"), 0), std::invalid_argument);
}

TEST(ServerTest, StopWithoutStartIsNoop) {
  Server server(BindAddress::parse("127.0.0.1:3030"), 2);
  EXPECT_FALSE(server.is_running());
  server.stop();
  EXPECT_FALSE(server.is_running());
  EXPECT_EQ(server.address().port, 3030);
}

}  // namespace titan_api
