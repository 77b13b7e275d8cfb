#include "instrument-bench/discovery/DevicePool.hpp"
#include "test_utils/MockDriver.hpp"
#include "test_utils/TestFixtures.hpp"

#include <gtest/gtest.h>
#include <map>

using namespace instbench;
using instbench::test::MockDriver;

class DevicePoolTest : public test::BenchTest {
protected:
  void SetUp() override {
    BenchTest::SetUp();
    pool_ = std::make_unique<DevicePool>(DeviceKind::PowerSupply, factory());
  }

  DriverFactory factory() {
    return [this](DeviceKind kind, const std::string &name) {
      auto driver = std::make_shared<MockDriver>(name, kind);
      drivers_[name] = driver;
      ++created_;
      return driver;
    };
  }

  static ConnectionParams params(const std::string &target) {
    return ConnectionParams::parse(target);
  }

  std::map<std::string, std::shared_ptr<MockDriver>> drivers_;
  int created_ = 0;
  std::unique_ptr<DevicePool> pool_;
};

TEST_F(DevicePoolTest, FirstDeviceBecomesActive) {
  std::vector<std::string> active;
  pool_->active_changed.connect(
      [&](const std::string &port, const std::string &) {
        active.push_back(port);
      });

  ASSERT_TRUE(pool_->connect("/dev/ttyUSB0", params("/dev/ttyUSB0")));
  ASSERT_TRUE(pool_->connect("/dev/ttyUSB1", params("/dev/ttyUSB1")));

  EXPECT_EQ(2u, pool_->size());
  EXPECT_EQ("/dev/ttyUSB0", pool_->active_port().value());
  EXPECT_EQ(drivers_["/dev/ttyUSB0"], pool_->active());
  EXPECT_EQ((std::vector<std::string>{"/dev/ttyUSB0"}), active);

  auto info = pool_->info("/dev/ttyUSB1");
  ASSERT_TRUE(info.has_value());
  EXPECT_TRUE(info->connected);
  EXPECT_EQ(9600, info->baud_rate);
  EXPECT_EQ(DeviceKind::PowerSupply, info->kind);
}

TEST_F(DevicePoolTest, ConnectIsIdempotent) {
  ASSERT_TRUE(pool_->connect("/dev/ttyUSB0", params("/dev/ttyUSB0")));
  ASSERT_TRUE(pool_->connect("/dev/ttyUSB0", params("/dev/ttyUSB0")));
  EXPECT_EQ(1, created_);
  EXPECT_EQ(1u, pool_->size());
  EXPECT_EQ(1, drivers_["/dev/ttyUSB0"]->open_calls());
}

TEST_F(DevicePoolTest, FailedConnectLeavesPoolUnchanged) {
  std::vector<std::pair<std::string, bool>> status;
  pool_ = std::make_unique<DevicePool>(
      DeviceKind::PowerSupply, [](DeviceKind kind, const std::string &name) {
        auto d = std::make_shared<MockDriver>(name, kind);
        d->fail_open(ConnectionFailure::TimedOut);
        return d;
      });
  pool_->device_status_changed.connect(
      [&](const std::string &port, bool up) { status.emplace_back(port, up); });

  EXPECT_FALSE(pool_->connect("/dev/ttyUSB0", params("/dev/ttyUSB0")));
  EXPECT_EQ(0u, pool_->size());
  EXPECT_FALSE(pool_->active_port().has_value());
  ASSERT_EQ(1u, status.size());
  EXPECT_FALSE(status[0].second);
}

TEST_F(DevicePoolTest, DisconnectPromotesAnotherMember) {
  for (const char *port : {"/dev/ttyUSB0", "/dev/ttyUSB1", "/dev/ttyUSB2"}) {
    ASSERT_TRUE(pool_->connect(port, params(port)));
  }
  std::string announced = "unset";
  pool_->active_changed.connect(
      [&](const std::string &port, const std::string &) { announced = port; });

  ASSERT_TRUE(pool_->disconnect("/dev/ttyUSB0"));
  EXPECT_EQ(1, drivers_["/dev/ttyUSB0"]->disconnect_calls());
  EXPECT_EQ("/dev/ttyUSB1", pool_->active_port().value());
  EXPECT_EQ("/dev/ttyUSB1", announced);

  // Removing a non-active member leaves the active device alone
  announced = "unset";
  ASSERT_TRUE(pool_->disconnect("/dev/ttyUSB2"));
  EXPECT_EQ("/dev/ttyUSB1", pool_->active_port().value());
  EXPECT_EQ("unset", announced);

  ASSERT_TRUE(pool_->disconnect("/dev/ttyUSB1"));
  EXPECT_FALSE(pool_->active_port().has_value());
  EXPECT_EQ("", announced);
  EXPECT_EQ(nullptr, pool_->active());

  EXPECT_FALSE(pool_->disconnect("/dev/ttyUSB1"));
}

TEST_F(DevicePoolTest, SetActiveRequiresMembership) {
  ASSERT_TRUE(pool_->connect("/dev/ttyUSB0", params("/dev/ttyUSB0")));
  ASSERT_TRUE(pool_->connect("/dev/ttyUSB1", params("/dev/ttyUSB1")));

  EXPECT_FALSE(pool_->set_active("/dev/ttyUSB9"));
  EXPECT_EQ("/dev/ttyUSB0", pool_->active_port().value());

  EXPECT_TRUE(pool_->set_active("/dev/ttyUSB1"));
  EXPECT_EQ(drivers_["/dev/ttyUSB1"], pool_->active());
}

TEST_F(DevicePoolTest, DisconnectAllSurvivesAThrowingDriver) {
  for (const char *port : {"/dev/ttyUSB0", "/dev/ttyUSB1", "/dev/ttyUSB2"}) {
    ASSERT_TRUE(pool_->connect(port, params(port)));
  }
  drivers_["/dev/ttyUSB1"]->throw_on_disconnect(true);

  std::vector<std::string> membership{"unset"};
  pool_->devices_changed.connect(
      [&](const std::vector<std::string> &ports) { membership = ports; });

  pool_->disconnect_all();

  EXPECT_EQ(0u, pool_->size());
  EXPECT_FALSE(pool_->active_port().has_value());
  EXPECT_TRUE(membership.empty());
  for (const auto &[port, driver] : drivers_) {
    EXPECT_EQ(1, driver->disconnect_calls()) << port;
    EXPECT_FALSE(driver->is_connected()) << port;
  }
}

TEST_F(DevicePoolTest, AdoptRequiresAConnectedDriver) {
  auto driver = std::make_shared<MockDriver>("smu", DeviceKind::SourceMeter);
  EXPECT_FALSE(pool_->adopt("10.0.0.2", driver, params("10.0.0.2")));

  driver->connect(params("10.0.0.2"));
  EXPECT_TRUE(pool_->adopt("10.0.0.2", driver, params("10.0.0.2")));
  EXPECT_EQ(driver, pool_->get("10.0.0.2"));
  EXPECT_EQ(DeviceKind::SourceMeter, pool_->info("10.0.0.2")->kind);
}

TEST_F(DevicePoolTest, LostPortIsDropped) {
  std::vector<PortEntry> ports{{"/dev/ttyUSB0", ""}};
  PortRegistry registry([&] { return ports; },
                        [](const std::string &, int, std::chrono::milliseconds)
                            -> std::optional<std::string> { return ""; });
  registry.scan(false);

  DevicePool pool(DeviceKind::PowerSupply, factory(), &registry);
  ASSERT_TRUE(pool.connect("/dev/ttyUSB0", params("/dev/ttyUSB0")));
  EXPECT_TRUE(registry.device("/dev/ttyUSB0")->connected);

  ports.clear();
  registry.scan(false);
  EXPECT_FALSE(pool.contains("/dev/ttyUSB0"));
  EXPECT_EQ(1, drivers_["/dev/ttyUSB0"]->disconnect_calls());
}

TEST_F(DevicePoolTest, NetworkDevicesAreNotMarkedInRegistry) {
  PortRegistry registry([] { return std::vector<PortEntry>{}; },
                        [](const std::string &, int, std::chrono::milliseconds)
                            -> std::optional<std::string> { return ""; });
  DevicePool pool(DeviceKind::SourceMeter, factory(), &registry);
  ASSERT_TRUE(pool.connect("10.0.0.2", params("tcp:10.0.0.2")));
  EXPECT_FALSE(registry.device("10.0.0.2").has_value());
  EXPECT_TRUE(registry.scan(false).empty());
  EXPECT_TRUE(pool.contains("10.0.0.2"));
}
