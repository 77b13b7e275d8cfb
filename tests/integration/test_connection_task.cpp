#include "instrument-bench/driver/SourceMeter.hpp"
#include "instrument-bench/worker/ConnectionTask.hpp"
#include "test_utils/FakeScpiServer.hpp"
#include "test_utils/MockDriver.hpp"
#include "test_utils/TestFixtures.hpp"

#include <gtest/gtest.h>
#include <mutex>

using namespace instbench;
using instbench::test::FakeScpiServer;
using instbench::test::MockDriver;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<ScpiSourceMeter> make_source_meter() {
  SourceMeterProfile profile;
  profile.reset_settle = 1ms;
  return std::make_shared<ScpiSourceMeter>("smu", make_transport, profile);
}

ConnectionParams local_params(int port) {
  auto params = ConnectionParams::parse("tcp:127.0.0.1:" + std::to_string(port));
  params.timeout = 1s;
  params.probe_timeout = 1s;
  return params;
}

struct FailureLog {
  std::mutex mutex;
  std::vector<std::pair<ConnectionFailure, std::string>> entries;

  void attach(ConnectionTask &task) {
    task.connection_failed.connect(
        [this](ConnectionFailure failure, const std::string &message) {
          std::lock_guard lock(mutex);
          entries.emplace_back(failure, message);
        });
  }
};

} // namespace

class ConnectionTaskTest : public test::BenchTest {};

TEST_F(ConnectionTaskTest, UnreachableHostFailsFast) {
  auto driver = make_source_meter();
  ConnectionTask task(driver, local_params(1));
  FailureLog log;
  log.attach(task);

  auto begin = std::chrono::steady_clock::now();
  ASSERT_TRUE(task.start());
  ASSERT_TRUE(task.wait(5s));
  auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_EQ(WorkerStatus::Failed, task.status());
  EXPECT_FALSE(task.succeeded());
  EXPECT_LT(elapsed, 3s);

  ASSERT_EQ(1u, log.entries.size());
  EXPECT_EQ(ConnectionFailure::Unreachable, log.entries[0].first);
  EXPECT_NE(std::string::npos, log.entries[0].second.find("unreachable"));
  EXPECT_FALSE(driver->is_connected());

  auto error = task.last_error();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(ErrorCategory::Connection, error->category);
}

TEST_F(ConnectionTaskTest, ConnectsToLiveInstrument) {
  FakeScpiServer server;
  ASSERT_TRUE(server.start());

  auto driver = make_source_meter();
  ConnectionTask task(driver, local_params(server.port()));

  std::mutex mutex;
  std::string connected_identity;
  std::vector<int> progress;
  task.connected.connect([&](const std::string &id) {
    std::lock_guard lock(mutex);
    connected_identity = id;
  });
  task.progress.connect([&](int p) {
    std::lock_guard lock(mutex);
    progress.push_back(p);
  });

  ASSERT_TRUE(task.start());
  ASSERT_TRUE(task.wait(5s));

  EXPECT_EQ(WorkerStatus::Completed, task.status());
  EXPECT_TRUE(task.succeeded());
  EXPECT_EQ("KEITHLEY INSTRUMENTS,MODEL 2461,04419571,1.7.0", task.identity());
  EXPECT_EQ(task.identity(), connected_identity);
  EXPECT_TRUE(driver->is_connected());

  ASSERT_FALSE(progress.empty());
  EXPECT_EQ(100, progress.back());
  for (size_t i = 1; i < progress.size(); ++i) {
    EXPECT_LE(progress[i - 1], progress[i]);
  }

  EXPECT_TRUE(server.received_command("*RST"));
  EXPECT_TRUE(server.received_command("*CLS"));

  driver->disconnect();
  server.stop();
}

TEST_F(ConnectionTaskTest, WrongInstrumentIsRejected) {
  FakeScpiServer server("RIGOL TECHNOLOGIES,DP711,DP7A1234,00.01.05");
  ASSERT_TRUE(server.start());

  auto driver = make_source_meter();
  ConnectionTask task(driver, local_params(server.port()));
  FailureLog log;
  log.attach(task);

  ASSERT_TRUE(task.start());
  ASSERT_TRUE(task.wait(5s));

  EXPECT_EQ(WorkerStatus::Failed, task.status());
  ASSERT_EQ(1u, log.entries.size());
  EXPECT_EQ(ConnectionFailure::IdentityMismatch, log.entries[0].first);
  EXPECT_FALSE(driver->is_connected());
  EXPECT_FALSE(server.received_command("*RST"));

  server.stop();
}

TEST_F(ConnectionTaskTest, SilentInstrumentTimesOut) {
  FakeScpiServer server;
  ASSERT_TRUE(server.start());
  server.set_silent(true);

  auto driver = make_source_meter();
  auto params = local_params(server.port());
  params.timeout = 200ms;
  ConnectionTask task(driver, params);
  FailureLog log;
  log.attach(task);

  ASSERT_TRUE(task.start());
  ASSERT_TRUE(task.wait(5s));

  EXPECT_EQ(WorkerStatus::Failed, task.status());
  ASSERT_EQ(1u, log.entries.size());
  EXPECT_EQ(ConnectionFailure::TimedOut, log.entries[0].first);
  EXPECT_FALSE(driver->is_connected());

  server.stop();
}

TEST_F(ConnectionTaskTest, MissingDriverFailsSetup) {
  ConnectionTask task(nullptr, local_params(1));
  ASSERT_TRUE(task.start());
  ASSERT_TRUE(task.wait(2s));
  EXPECT_EQ(WorkerStatus::Failed, task.status());
}

TEST(ProbeTargetTest, ResolvesVisaResource) {
  FakeScpiServer server;
  ASSERT_TRUE(server.start());

  auto params = ConnectionParams::parse(
      "visa:TCPIP0::127.0.0.1::" + std::to_string(server.port()) +
      "::SOCKET");
  EXPECT_TRUE(probe_target(params).reachable);
  server.stop();
}

// ---------------------------------------------------------------------------

class ReconnectionTaskTest : public test::BenchTest {
protected:
  ReconnectPolicy fast_policy(int attempts) {
    ReconnectPolicy policy;
    policy.max_attempts = attempts;
    policy.retry_delay = 5ms;
    policy.settle = 1ms;
    return policy;
  }

  ConnectionParams params_ = ConnectionParams::parse("tcp:10.0.0.9");
};

TEST_F(ReconnectionTaskTest, SucceedsAfterTransientFailures) {
  auto driver = std::make_shared<MockDriver>("smu");
  driver->fail_open_times(2, ConnectionFailure::TimedOut);

  ReconnectionTask task(driver, params_, fast_policy(5));
  std::mutex mutex;
  std::vector<int> attempts;
  std::vector<int> failed;
  std::string identity;
  task.attempt.connect([&](int n) {
    std::lock_guard lock(mutex);
    attempts.push_back(n);
  });
  task.attempt_failed.connect([&](int n, const std::string &) {
    std::lock_guard lock(mutex);
    failed.push_back(n);
  });
  task.reconnected.connect([&](const std::string &id) {
    std::lock_guard lock(mutex);
    identity = id;
  });

  ASSERT_TRUE(task.start());
  ASSERT_TRUE(task.wait(5s));

  EXPECT_EQ(WorkerStatus::Completed, task.status());
  EXPECT_TRUE(task.succeeded());
  EXPECT_EQ(3, task.attempts());
  EXPECT_EQ((std::vector<int>{1, 2, 3}), attempts);
  EXPECT_EQ((std::vector<int>{1, 2}), failed);
  EXPECT_FALSE(identity.empty());
  EXPECT_TRUE(driver->is_connected());
}

TEST_F(ReconnectionTaskTest, GivesUpAfterMaxAttempts) {
  auto driver = std::make_shared<MockDriver>("smu");
  driver->fail_open(ConnectionFailure::Unreachable);

  ReconnectionTask task(driver, params_, fast_policy(3));
  std::atomic<int> gave_up{0};
  task.max_attempts_reached.connect([&](int n) { gave_up = n; });

  ASSERT_TRUE(task.start());
  ASSERT_TRUE(task.wait(5s));

  EXPECT_EQ(WorkerStatus::Failed, task.status());
  EXPECT_FALSE(task.succeeded());
  EXPECT_EQ(3, task.attempts());
  EXPECT_EQ(3, gave_up.load());
  EXPECT_EQ(3, driver->open_calls());
}

TEST_F(ReconnectionTaskTest, DropsStaleLinkBeforeRetrying) {
  auto driver = std::make_shared<MockDriver>("smu");
  driver->connect(params_);
  ASSERT_TRUE(driver->is_connected());

  ReconnectionTask task(driver, params_, fast_policy(2));
  ASSERT_TRUE(task.start());
  ASSERT_TRUE(task.wait(5s));

  EXPECT_EQ(WorkerStatus::Completed, task.status());
  EXPECT_EQ(1, driver->disconnect_calls());
  EXPECT_EQ(2, driver->open_calls());
}

TEST_F(ReconnectionTaskTest, StopInterruptsRetryDelay) {
  auto driver = std::make_shared<MockDriver>("smu");
  driver->fail_open(ConnectionFailure::Unreachable);
  auto policy = fast_policy(10);
  policy.retry_delay = 10s;

  ReconnectionTask task(driver, params_, policy);
  ASSERT_TRUE(task.start());
  ASSERT_TRUE(test::wait_for([&] { return driver->open_calls() >= 1; }));

  auto begin = std::chrono::steady_clock::now();
  EXPECT_TRUE(task.stop());
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
  EXPECT_EQ(WorkerStatus::Idle, task.status());
  EXPECT_FALSE(task.succeeded());
}

// ---------------------------------------------------------------------------

class BatchConnectionTaskTest : public test::BenchTest {};

TEST_F(BatchConnectionTaskTest, CountsSuccessesAndFailures) {
  auto good1 = std::make_shared<MockDriver>("a");
  auto bad = std::make_shared<MockDriver>("b");
  bad->fail_open(ConnectionFailure::Unreachable);
  auto good2 = std::make_shared<MockDriver>("c", DeviceKind::PowerSupply);

  std::vector<BatchTarget> targets = {
      {"/dev/ttyUSB0", good1, ConnectionParams::parse("serial:/dev/ttyUSB0")},
      {"10.0.0.7", bad, ConnectionParams::parse("tcp:10.0.0.7")},
      {"10.0.0.8", good2, ConnectionParams::parse("tcp:10.0.0.8")},
      {"missing", nullptr, ConnectionParams::parse("tcp:10.0.0.9")},
  };
  BatchConnectionTask task(std::move(targets));

  std::mutex mutex;
  std::vector<std::string> connected;
  std::vector<std::string> failed;
  task.device_connected.connect(
      [&](const std::string &port, const std::string &) {
        std::lock_guard lock(mutex);
        connected.push_back(port);
      });
  task.device_failed.connect(
      [&](const std::string &port, const std::string &) {
        std::lock_guard lock(mutex);
        failed.push_back(port);
      });

  ASSERT_TRUE(task.start());
  ASSERT_TRUE(task.wait(5s));

  EXPECT_EQ(WorkerStatus::Completed, task.status());
  EXPECT_EQ(2u, task.connected_count());
  EXPECT_EQ(2u, task.failed_count());
  EXPECT_EQ((std::vector<std::string>{"/dev/ttyUSB0", "10.0.0.8"}), connected);
  EXPECT_EQ((std::vector<std::string>{"10.0.0.7", "missing"}), failed);
  EXPECT_TRUE(good1->is_connected());
  EXPECT_TRUE(good2->is_connected());
  EXPECT_FALSE(bad->is_connected());
}
