#include "instrument-bench/driver/SourceMeter.hpp"
#include "test_utils/MockTransport.hpp"
#include "test_utils/TestFixtures.hpp"

#include <gtest/gtest.h>

using namespace instbench;
using instbench::test::MockScpiInstrument;

namespace {

const char *kIdn = "KEITHLEY INSTRUMENTS,MODEL 2461,04471234,1.7.3b";

SourceMeterProfile fast_profile() {
  SourceMeterProfile profile;
  profile.reset_settle = std::chrono::milliseconds(1);
  return profile;
}

} // namespace

class SourceMeterTest : public test::BenchTest {
protected:
  void SetUp() override {
    BenchTest::SetUp();
    mock_ = std::make_shared<MockScpiInstrument>();
    mock_->set_response("*IDN?", kIdn);
    mock_->set_response(":MEAS:VOLT?", "1.000000E+00");
    mock_->set_response(":MEAS:CURR?", "1.000000E-03");
    mock_->set_response(":MEAS:RES?", "1.000000E+03");
    mock_->set_response(":MEAS:POW?", "1.000000E-03");
    mock_->set_response(ScpiSourceMeter::batched_measure_query(),
                        "1.000000E+00;1.000000E-03;1.000000E+03;1.000000E-03");
    smu_ = std::make_unique<ScpiSourceMeter>("smu", mock_->transport_factory(),
                                             fast_profile());
  }

  void connect() { smu_->connect(ConnectionParams::parse("tcp:10.0.0.2")); }

  std::shared_ptr<MockScpiInstrument> mock_;
  std::unique_ptr<ScpiSourceMeter> smu_;
};

TEST_F(SourceMeterTest, ConnectIdentifiesAndResets) {
  connect();
  EXPECT_TRUE(smu_->is_connected());
  EXPECT_EQ(kIdn, smu_->identity());
  EXPECT_EQ(DeviceKind::SourceMeter, smu_->kind());

  auto idn = mock_->index_of("*IDN?");
  auto rst = mock_->index_of("*RST");
  auto cls = mock_->index_of("*CLS");
  ASSERT_GE(idn, 0);
  EXPECT_LT(idn, rst);
  EXPECT_LT(rst, cls);
  EXPECT_GE(mock_->count_of(":SYST:ERR?"), 1u);
}

TEST_F(SourceMeterTest, WrongIdentityClosesTransport) {
  mock_->set_response("*IDN?", "RIGOL TECHNOLOGIES,DP711,DP7A1234,00.01.05");
  try {
    connect();
    FAIL() << "connected to the wrong instrument";
  } catch (const ConnectionError &ex) {
    EXPECT_EQ(ConnectionFailure::IdentityMismatch, ex.failure());
  }
  EXPECT_FALSE(smu_->is_connected());
  EXPECT_FALSE(mock_->is_open());
  EXPECT_EQ(-1, mock_->index_of("*RST"));
}

TEST_F(SourceMeterTest, UnreachableIsReported) {
  mock_->fail_next_open(ConnectionFailure::Unreachable);
  try {
    connect();
    FAIL() << "expected a connection error";
  } catch (const ConnectionError &ex) {
    EXPECT_EQ(ConnectionFailure::Unreachable, ex.failure());
    EXPECT_EQ(ErrorCategory::Connection, ex.category());
  }
  EXPECT_FALSE(smu_->is_connected());
}

TEST_F(SourceMeterTest, OperationsRequireConnection) {
  try {
    smu_->measure_voltage();
    FAIL() << "measured while disconnected";
  } catch (const UsageError &ex) {
    EXPECT_EQ(UsageFault::NotConnected, ex.fault());
  }
  EXPECT_THROW(smu_->output_on(), UsageError);
  EXPECT_THROW(smu_->set_voltage(1.0, 0.1), UsageError);
}

TEST_F(SourceMeterTest, SetVoltageSequence) {
  connect();
  mock_->clear_history();
  smu_->set_voltage("500mV", "10mA");

  auto history = mock_->command_history();
  ASSERT_GE(history.size(), 5u);
  EXPECT_EQ(":SOUR:FUNC VOLT", history[0]);
  EXPECT_EQ("*CLS", history[1]);
  EXPECT_EQ(":SOUR:VOLT:LEV 0.5", history[2]);
  EXPECT_EQ(":SOUR:VOLT:ILIM 0.01", history[3]);
  EXPECT_EQ(":SYST:ERR?", history[4]);
  EXPECT_EQ(SourceFunction::Voltage, smu_->source_function());
}

TEST_F(SourceMeterTest, SetCurrentSwitchesFunction) {
  connect();
  mock_->clear_history();
  smu_->set_current(0.002, 5.0);
  EXPECT_GE(mock_->index_of(":SOUR:FUNC CURR"), 0);
  EXPECT_GE(mock_->index_of(":SOUR:CURR:LEV 0.002"), 0);
  EXPECT_GE(mock_->index_of(":SOUR:CURR:VLIM 5"), 0);
  EXPECT_EQ(SourceFunction::Current, smu_->source_function());
}

TEST_F(SourceMeterTest, InstrumentErrorBecomesProtocolFault) {
  connect();
  mock_->queue_response(":SYST:ERR?", "-222,\"Data out of range\"");
  try {
    smu_->set_voltage(500.0, 0.1);
    FAIL() << "instrument error was ignored";
  } catch (const ProtocolError &ex) {
    EXPECT_EQ(ProtocolFault::InstrumentFault, ex.fault());
    EXPECT_NE(std::string::npos, std::string(ex.what()).find("-222"));
  }
}

TEST_F(SourceMeterTest, BatchedAndIndividualReadingsAgree) {
  connect();
  Reading batched = smu_->measure_all();

  mock_->queue_response(ScpiSourceMeter::batched_measure_query(), "1.0;0.001");
  Reading fallback = smu_->measure_all();

  EXPECT_DOUBLE_EQ(batched.voltage, fallback.voltage);
  EXPECT_DOUBLE_EQ(batched.current, fallback.current);
  EXPECT_DOUBLE_EQ(*batched.resistance, *fallback.resistance);
  EXPECT_DOUBLE_EQ(*batched.power, *fallback.power);
  EXPECT_EQ(1u, mock_->count_of(":MEAS:VOLT?"));
  EXPECT_EQ(1u, mock_->count_of(":MEAS:POW?"));
}

TEST_F(SourceMeterTest, GarbledBatchFallsBack) {
  connect();
  mock_->queue_response(ScpiSourceMeter::batched_measure_query(),
                        "1.0;ERR;1000;0.001");
  Reading r = smu_->measure_all();
  EXPECT_DOUBLE_EQ(1.0, r.voltage);
  EXPECT_DOUBLE_EQ(1e-3, r.current);
  EXPECT_EQ(1u, mock_->count_of(":MEAS:CURR?"));
}

TEST_F(SourceMeterTest, OutputStateAndSpeed) {
  connect();
  mock_->set_response(":OUTP:STAT?", "1");
  smu_->output_on();
  EXPECT_TRUE(smu_->output_state());
  EXPECT_GE(mock_->index_of(":OUTP:STAT ON"), 0);

  smu_->set_measurement_speed(1.0);
  EXPECT_GE(mock_->index_of(":SENS:VOLT:NPLC 1"), 0);
  EXPECT_THROW(smu_->set_measurement_speed(20.0), UsageError);
}

TEST_F(SourceMeterTest, ReconnectOpensFreshTransport) {
  connect();
  smu_->disconnect();
  EXPECT_FALSE(smu_->is_connected());
  connect();
  EXPECT_EQ(2, mock_->open_count());
  EXPECT_TRUE(smu_->is_connected());
}
