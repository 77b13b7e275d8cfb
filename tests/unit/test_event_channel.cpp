#include "instrument-bench/Errors.hpp"
#include "instrument-bench/EventChannel.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace instbench;

TEST(EventChannelTest, EveryListenerReceivesArguments) {
  EventChannel<int, const std::string &> channel;
  std::vector<std::string> seen;
  channel.connect([&](int n, const std::string &s) {
    seen.push_back("a" + std::to_string(n) + s);
  });
  channel.connect([&](int n, const std::string &s) {
    seen.push_back("b" + std::to_string(n) + s);
  });

  channel.emit(7, "x");
  EXPECT_EQ((std::vector<std::string>{"a7x", "b7x"}), seen);
}

TEST(EventChannelTest, DisconnectStopsDelivery) {
  EventChannel<int> channel;
  int total = 0;
  auto id = channel.connect([&](int n) { total += n; });
  channel.emit(2);
  EXPECT_TRUE(channel.disconnect(id));
  EXPECT_FALSE(channel.disconnect(id));
  channel.emit(5);
  EXPECT_EQ(2, total);
  EXPECT_EQ(0u, channel.listener_count());
}

TEST(EventChannelTest, ListenerMayDisconnectItselfWhileEmitting) {
  EventChannel<> channel;
  int calls = 0;
  EventChannel<>::ListenerId id = 0;
  id = channel.connect([&] {
    ++calls;
    channel.disconnect(id);
  });

  channel.emit();
  channel.emit();
  EXPECT_EQ(1, calls);
}

TEST(EventChannelTest, EmitWithoutListenersIsHarmless) {
  EventChannel<double> channel;
  EXPECT_NO_THROW(channel.emit(1.5));
}

TEST(ErrorsTest, CategoriesFollowTheExceptionType) {
  EXPECT_EQ(ErrorCategory::Connection,
            ConnectionError(ConnectionFailure::TimedOut, "x").category());
  EXPECT_EQ(ErrorCategory::Protocol,
            ProtocolError(ProtocolFault::Malformed, "x").category());
  EXPECT_EQ(ErrorCategory::Usage,
            UsageError(UsageFault::OutOfRange, "x").category());
  EXPECT_EQ(ErrorCategory::Resource, ResourceError("x").category());
}

TEST(ErrorsTest, ConnectionMessageLeadsWithDiagnostic) {
  ConnectionError unreachable(ConnectionFailure::Unreachable, "10.0.0.1:5025");
  EXPECT_EQ("unreachable: 10.0.0.1:5025", std::string(unreachable.what()));
  EXPECT_STREQ("timed out", describe(ConnectionFailure::TimedOut));
  EXPECT_STREQ("unexpected identity",
               describe(ConnectionFailure::IdentityMismatch));
}

TEST(ErrorsTest, CaughtAsBenchError) {
  try {
    throw UsageError(UsageFault::NotConnected, "smu is not connected");
  } catch (const BenchError &ex) {
    EXPECT_EQ(ErrorCategory::Usage, ex.category());
    EXPECT_STREQ("usage", to_string(ex.category()));
  }
}
