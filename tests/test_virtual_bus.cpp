#include <gtest/gtest.h>
#include <can/virtual_bus.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace vhil::can;
using vhil::core::ErrorCode;
using vhil::core::Errc;
using vhil::core::Result;
using namespace std::chrono_literals;

namespace {

struct FakeClock {
  double now = 1000.0;
  Clock fn() { return [this] { return now; }; }
};

const std::vector<uint8_t> kEight{1, 2, 3, 4, 5, 6, 7, 8};

} // namespace

TEST(VirtualBus, OversizedPayloadIsRejectedWithoutStateChange) {
  VirtualCanBus bus;
  int calls = 0;
  bus.Subscribe(0x123, [&](const CanFrame&) -> Result<void> { ++calls; return {}; });

  EXPECT_FALSE(bus.Transmit(0x123, std::vector<uint8_t>(9, 0xAA)));
  const auto s = bus.Statistics();
  EXPECT_EQ(s.tx_count, 0u);
  EXPECT_EQ(s.trace_size, 0u);
  EXPECT_EQ(calls, 0);
}

TEST(VirtualBus, TransmitCountsTracesAndDelivers) {
  FakeClock clk;
  VirtualCanBus bus({}, clk.fn());
  std::vector<CanFrame> got;
  bus.Subscribe(0x100, [&](const CanFrame& f) -> Result<void> { got.push_back(f); return {}; });

  ASSERT_TRUE(bus.Transmit(0x100, {0xDE, 0xAD}));
  ASSERT_EQ(got.size(), 1u);
  EXPECT_EQ(got[0].id, 0x100u);
  EXPECT_EQ(got[0].dlc, 2);
  EXPECT_DOUBLE_EQ(got[0].timestamp, 1000.0);
  EXPECT_EQ(got[0].direction, Direction::kTx);

  const auto s = bus.Statistics();
  EXPECT_EQ(s.tx_count, 1u);
  EXPECT_EQ(s.rx_count, 0u);
  EXPECT_EQ(s.channel, "virtual0");
  EXPECT_EQ(s.bitrate, 500000u);
  EXPECT_EQ(bus.FrameCount(), 1u);
}

TEST(VirtualBus, ExactSubscribersRunBeforeWildcardInRegistrationOrder) {
  VirtualCanBus bus;
  std::vector<std::string> order;
  bus.Subscribe(kWildcardId, [&](const CanFrame&) -> Result<void> { order.push_back("w1"); return {}; });
  bus.Subscribe(0x200, [&](const CanFrame&) -> Result<void> { order.push_back("e1"); return {}; });
  bus.Subscribe(0x200, [&](const CanFrame&) -> Result<void> { order.push_back("e2"); return {}; });
  bus.Subscribe(kWildcardId, [&](const CanFrame&) -> Result<void> { order.push_back("w2"); return {}; });
  bus.Subscribe(0x201, [&](const CanFrame&) -> Result<void> { order.push_back("other"); return {}; });

  ASSERT_TRUE(bus.Transmit(0x200, {0x01}));
  EXPECT_EQ(order, (std::vector<std::string>{"e1", "e2", "w1", "w2"}));
}

TEST(VirtualBus, FailingSubscriberDoesNotStopDelivery) {
  VirtualCanBus bus;
  int after = 0;
  const auto bad_err = bus.Subscribe(0x10, [](const CanFrame&) -> Result<void> {
    return ErrorCode(Errc::kHandlerFailed, "nope");
  });
  const auto bad_throw = bus.Subscribe(0x10, [](const CanFrame&) -> Result<void> {
    throw std::runtime_error("boom");
  });
  bus.Subscribe(0x10, [&](const CanFrame&) -> Result<void> { ++after; return {}; });

  EXPECT_TRUE(bus.Transmit(0x10, {0x00}));
  EXPECT_EQ(after, 1);

  const auto failures = bus.DeliveryFailures();
  ASSERT_EQ(failures.size(), 2u);
  EXPECT_EQ(failures[0].frame_id, 0x10u);
  EXPECT_EQ(failures[0].token, bad_err);
  EXPECT_NE(failures[0].reason.find("nope"), std::string::npos);
  EXPECT_EQ(failures[1].token, bad_throw);
  EXPECT_NE(failures[1].reason.find("boom"), std::string::npos);
  EXPECT_EQ(bus.Statistics().delivery_failures, 2u);
}

TEST(VirtualBus, DeliveryFailureLogIsBounded) {
  VirtualCanBus bus;
  bus.Subscribe(0x10, [](const CanFrame&) -> Result<void> { return ErrorCode(Errc::kHandlerFailed); });
  for (std::size_t i = 0; i < kMaxDeliveryFailures + 10; ++i) bus.Transmit(0x10, {});
  EXPECT_EQ(bus.DeliveryFailures().size(), kMaxDeliveryFailures);
}

TEST(VirtualBus, UnsubscribeStopsDeliveryAndUnknownTokenIsNoop) {
  VirtualCanBus bus;
  int calls = 0;
  const auto tok = bus.Subscribe(0x300, [&](const CanFrame&) -> Result<void> { ++calls; return {}; });
  bus.Unsubscribe(0x300, tok + 100);
  bus.Unsubscribe(0x999, tok);
  bus.Transmit(0x300, {});
  EXPECT_EQ(calls, 1);

  bus.Unsubscribe(0x300, tok);
  bus.Transmit(0x300, {});
  EXPECT_EQ(calls, 1);
}

TEST(VirtualBus, UnsubscribeWaitsForDeliveryRunningOnAnotherThread) {
  VirtualCanBus bus;
  struct Listener { std::atomic<int> hits{0}; };
  auto* l = new Listener;
  std::atomic<bool> entered{false};
  std::atomic<bool> finished{false};
  const auto tok = bus.Subscribe(0x100, [&, l](const CanFrame&) -> Result<void> {
    entered = true;
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    l->hits++;
    finished = true;
    return {};
  });

  std::thread tx([&] { bus.Transmit(0x100, {0x01}); });
  while (!entered) std::this_thread::yield();
  bus.Unsubscribe(0x100, tok);
  EXPECT_TRUE(finished);
  EXPECT_EQ(l->hits.load(), 1);
  delete l;
  tx.join();

  bus.Transmit(0x100, {0x02});
  EXPECT_EQ(bus.DeliveryFailures().size(), 0u);
}

TEST(VirtualBus, SubscriberMayUnsubscribeItself) {
  VirtualCanBus bus;
  int calls = 0;
  SubscriptionToken tok = 0;
  tok = bus.Subscribe(0x120, [&](const CanFrame&) -> Result<void> {
    ++calls;
    bus.Unsubscribe(0x120, tok);
    return {};
  });
  bus.Transmit(0x120, {});
  bus.Transmit(0x120, {});
  EXPECT_EQ(calls, 1);
}

TEST(VirtualBus, SubscriberMayTransmitReentrantly) {
  VirtualCanBus bus;
  bus.Subscribe(0x100, [&](const CanFrame&) -> Result<void> {
    bus.Transmit(0x101, {0x01});
    return {};
  });
  ASSERT_TRUE(bus.Transmit(0x100, {}));
  EXPECT_EQ(bus.FrameCount(0x101), 1u);
  EXPECT_EQ(bus.Statistics().tx_count, 2u);
}

TEST(VirtualBus, BusLoadOverTrailingSecond) {
  FakeClock clk;
  VirtualCanBus bus({}, clk.fn());
  for (int i = 0; i < 10; ++i) ASSERT_TRUE(bus.Transmit(0x100, kEight));

  const double expected = 10 * (8 * 8 + 47) / 500000.0 * 100.0;
  EXPECT_DOUBLE_EQ(bus.Statistics().bus_load, expected);

  // Frames older than one second no longer count
  clk.now += 1.0;
  EXPECT_DOUBLE_EQ(bus.BusLoad(), 0.0);
}

TEST(VirtualBus, TraceIsBoundedAndEvictsOldestFirst) {
  VirtualCanBus bus;
  const std::size_t extra = 25;
  for (std::size_t i = 0; i < kDefaultTraceCapacity + extra; ++i) {
    const auto n = static_cast<uint32_t>(i);
    bus.Transmit(0x100, {static_cast<uint8_t>(n & 0xFF), static_cast<uint8_t>((n >> 8) & 0xFF)});
  }
  const auto trace = bus.Trace();
  ASSERT_EQ(trace.size(), kDefaultTraceCapacity);
  // First survivor is frame number `extra`
  EXPECT_EQ(trace.front().data[0], extra & 0xFF);
  EXPECT_EQ(trace.front().data[1], (extra >> 8) & 0xFF);

  const auto s = bus.Statistics();
  EXPECT_EQ(s.tx_count, kDefaultTraceCapacity + extra);
  EXPECT_EQ(s.trace_evicted, extra);
}

TEST(VirtualBus, TraceFilterLastFrameAndClear) {
  VirtualCanBus bus;
  bus.Transmit(0x100, {0x01});
  bus.Transmit(0x200, {0x02});
  bus.Transmit(0x100, {0x03});

  EXPECT_EQ(bus.Trace(0x100).size(), 2u);
  EXPECT_EQ(bus.FrameCount(0x200), 1u);
  auto last = bus.LastFrame(0x100);
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->data, std::vector<uint8_t>{0x03});
  EXPECT_FALSE(bus.LastFrame(0x7FF).has_value());

  bus.ClearTrace();
  EXPECT_TRUE(bus.Trace().empty());
  EXPECT_EQ(bus.Statistics().tx_count, 3u);  // counters survive
}

TEST(VirtualBus, ConvenienceBuilders) {
  VirtualCanBus bus;
  ASSERT_TRUE(bus.TransmitBatteryStatus(80.0, 400.0, 10.0, 30.0));
  DoorStatus doors;
  doors.fl_open = true;
  ASSERT_TRUE(bus.TransmitDoorStatus(doors));

  auto batt = bus.LastFrame(kBmsStatusId);
  ASSERT_TRUE(batt.has_value());
  EXPECT_EQ(batt->dlc, 8);
  auto decoded = DecodeBatteryStatus(batt->data);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_NEAR(decoded->soc, 80.0, 0.5);

  auto body = bus.LastFrame(kBdcStatusId);
  ASSERT_TRUE(body.has_value());
  EXPECT_EQ(body->dlc, 4);
  EXPECT_EQ(body->data[0], 0x01);
}

TEST(VirtualBus, ExternalDeliveryCountsAsReceive) {
  VirtualCanBus bus;
  std::vector<Direction> seen;
  bus.Subscribe(kWildcardId, [&](const CanFrame& f) -> Result<void> { seen.push_back(f.direction); return {}; });

  EXPECT_TRUE(bus.DeliverExternal(MakeFrame(0x1ABCDEF0, {1, 2}, 5.0, true)));
  EXPECT_FALSE(bus.DeliverExternal(MakeFrame(0x10, std::vector<uint8_t>(9, 0), 5.0)));

  const auto s = bus.Statistics();
  EXPECT_EQ(s.rx_count, 1u);
  EXPECT_EQ(s.tx_count, 0u);
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0], Direction::kRx);
  EXPECT_TRUE(bus.Trace().front().extended);
}

TEST(VirtualBus, AwaitFrameTimesOutWithNothing) {
  VirtualCanBus bus;
  bus.Start();
  bus.Transmit(0x100, {0x01});
  const auto t0 = std::chrono::steady_clock::now();
  EXPECT_FALSE(bus.AwaitFrame(30ms).has_value());
  EXPECT_GE(std::chrono::steady_clock::now() - t0, 25ms);
}

TEST(VirtualBus, ShutdownCancelsOutstandingAwait) {
  VirtualCanBus bus;
  bus.Start();
  std::atomic<bool> returned{false};
  std::thread waiter([&] {
    EXPECT_FALSE(bus.AwaitFrame(10s).has_value());
    returned = true;
  });
  std::this_thread::sleep_for(20ms);
  const auto t0 = std::chrono::steady_clock::now();
  bus.Shutdown();
  waiter.join();
  EXPECT_TRUE(returned.load());
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 2s);
  EXPECT_FALSE(bus.Running());

  // Later waits return at once
  const auto t1 = std::chrono::steady_clock::now();
  EXPECT_FALSE(bus.AwaitFrame(5s).has_value());
  EXPECT_LT(std::chrono::steady_clock::now() - t1, 1s);
}

TEST(VirtualBus, ConcurrentTransmittersAreAllCounted) {
  VirtualCanBus bus;
  std::atomic<int> delivered{0};
  bus.Subscribe(kWildcardId, [&](const CanFrame&) -> Result<void> { ++delivered; return {}; });

  std::vector<std::thread> producers;
  for (int t = 0; t < 4; ++t)
    producers.emplace_back([&bus, t] {
      for (int i = 0; i < 250; ++i) bus.Transmit(0x100 + t, {static_cast<uint8_t>(i)});
    });
  for (auto& th : producers) th.join();

  EXPECT_EQ(bus.Statistics().tx_count, 1000u);
  EXPECT_EQ(delivered.load(), 1000);
}
