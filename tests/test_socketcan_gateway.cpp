#include <gtest/gtest.h>
#include <can_gateway/socketcan_gateway.hpp>

#include <cstring>

using namespace vhil;
using can_gateway::FromSocketCanFrame;
using can_gateway::ToSocketCanFrame;

TEST(SocketCanConversion, StandardFrame) {
  auto f = ToSocketCanFrame(can::MakeFrame(0x123, {0xDE, 0xAD}, 0.0));
  ASSERT_TRUE(f.has_value());
  EXPECT_EQ(f->can_id, 0x123u);
  EXPECT_EQ(f->can_dlc, 2);
  EXPECT_EQ(f->data[0], 0xDE);
  EXPECT_EQ(f->data[1], 0xAD);
}

TEST(SocketCanConversion, ExtendedFrameCarriesEffFlag) {
  auto f = ToSocketCanFrame(can::MakeFrame(0x18DAF110, {0x02, 0x10, 0x03}, 0.0, true));
  ASSERT_TRUE(f.has_value());
  EXPECT_NE(f->can_id & CAN_EFF_FLAG, 0u);
  EXPECT_EQ(f->can_id & CAN_EFF_MASK, 0x18DAF110u);
}

TEST(SocketCanConversion, OversizedPayloadIsRefused) {
  can::CanFrame big;
  big.id = 0x10;
  big.data.assign(9, 0xFF);
  EXPECT_FALSE(ToSocketCanFrame(big).has_value());
}

TEST(SocketCanConversion, FromRawMarksReceive) {
  can_frame raw{};
  raw.can_id = 0x0ABCDEF0 | CAN_EFF_FLAG;
  raw.can_dlc = 3;
  const uint8_t bytes[] = {1, 2, 3};
  std::memcpy(raw.data, bytes, sizeof(bytes));

  auto f = FromSocketCanFrame(raw, 42.5);
  EXPECT_EQ(f.id, 0x0ABCDEF0u);
  EXPECT_TRUE(f.extended);
  EXPECT_EQ(f.dlc, 3);
  EXPECT_EQ(f.data, (std::vector<uint8_t>{1, 2, 3}));
  EXPECT_DOUBLE_EQ(f.timestamp, 42.5);
  EXPECT_EQ(f.direction, can::Direction::kRx);
}

TEST(SocketCanConversion, StandardRoundTripKeepsPayload) {
  const auto in = can::MakeFrame(0x7FF, {1, 2, 3, 4, 5, 6, 7, 8}, 0.0);
  auto raw = ToSocketCanFrame(in);
  ASSERT_TRUE(raw.has_value());
  auto out = FromSocketCanFrame(*raw, 1.0);
  EXPECT_EQ(out.id, in.id);
  EXPECT_FALSE(out.extended);
  EXPECT_EQ(out.data, in.data);
}

TEST(SocketCanGateway, MissingInterfaceFailsToStart) {
  can::VirtualCanBus bus;
  can_gateway::SocketCanGateway gw(bus, "vhil-nonexistent0");
  auto r = gw.Start();
  ASSERT_FALSE(r.HasValue());
  EXPECT_EQ(r.Error().value, core::Errc::kUnavailable);
  EXPECT_FALSE(gw.Running());

  // No subscription left behind
  bus.Transmit(0x100, {0x01});
  EXPECT_TRUE(bus.DeliveryFailures().empty());
  gw.Stop();
}
