// ivbench headers
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "devices/InstrumentSession.hpp"
#include "devices/LoadController.hpp"
#include "devices/SourceController.hpp"

// ivbench-Fake headers
#include "BenchPlan.hpp"
#include "FakeTransport.hpp"
#include "MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <cmath>
#include <sstream>
#include <string>
#include <vector>

namespace ivbench::test {

  using core::InstrumentFault;
  using devices::LoadController;
  using devices::SessionMode;
  using devices::SourceController;
  using testing::HasSubstr;

  class ControllerTest : public ::testing::Test {
  protected:
    void SetUp() override {
      errorMonitor = std::make_shared<testing::NiceMock<MockErrorMonitor>>();
      bench = std::make_shared<FakeBench>();
      plan = benchPlan();

      auto s = std::make_unique<FakeTransport>("Source", bench);
      auto l = std::make_unique<FakeTransport>("Load", bench);
      sourceLink = s.get();
      loadLink = l.get();
      source = std::make_unique<SourceController>(std::move(s), plan, errorMonitor, log);
      load = std::make_unique<LoadController>(std::move(l), plan, errorMonitor, log);
    }

    std::ostringstream console;
    core::Logger log{ console, core::Severity::Debug };
    std::shared_ptr<testing::NiceMock<MockErrorMonitor>> errorMonitor;
    std::shared_ptr<FakeBench> bench;
    core::SweepPlan plan;

    FakeTransport* sourceLink = nullptr; // owned by source
    FakeTransport* loadLink = nullptr;   // owned by load
    std::unique_ptr<SourceController> source;
    std::unique_ptr<LoadController> load;
  };

  //---SourceController---------------------------------------------------------

  TEST_F(ControllerTest, source_bringUp_configures_protection_before_output) {
    source->bringUp(plan.limits, 100.0);

    EXPECT_EQ(source->mode(), SessionMode::Energized);
    auto cmds = bench->payloads("Source");
    ASSERT_FALSE(cmds.empty());
    EXPECT_EQ(cmds.front(), "INSTrument:NSELect 3");

    int outputOn = bench->indexOf("Source", "OUTPut ON");
    ASSERT_GE(outputOn, 0);
    for (const char* setup : { "SOURce:CURRent 20", "SOURce:POWer 2500", "SOURce:VOLTage:PROTection 300",
                               "SOURce:FREQuency 60", "VOLTage 100" }) {
      int at = bench->indexOf("Source", setup);
      ASSERT_GE(at, 0) << setup;
      EXPECT_LT(at, outputOn) << setup;
    }
    EXPECT_GE(bench->indexOf("Source", "SOURce:SAFety?"), 0);
    EXPECT_GT(bench->indexOf("Source", "OUTPut?"), outputOn);
  }

  TEST_F(ControllerTest, source_bringUp_logs_safety_table) {
    sourceLink->reply("SOURce:SAFety?", "300,424,45,65,20,60,1,1,2500,2500,2500,0.5,3,40,60,0");
    source->bringUp(plan.limits, 100.0);
    EXPECT_THAT(console.str(), HasSubstr("Max Peak Current (A)"));

    auto table = source->readSafetyTable();
    ASSERT_EQ(table.size(), 16u);
    EXPECT_EQ(table[8].first, "Max Power (W)");
    EXPECT_EQ(table[8].second, "2500");
  }

  TEST_F(ControllerTest, source_readback_mismatch_faults_after_retry_budget) {
    sourceLink->reply("SOURce:FREQuency?", "50");

    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("SOURce:FREQuency 60"))).Times(1);
    EXPECT_THROW(source->bringUp(plan.limits, 100.0), InstrumentFault);

    EXPECT_EQ(bench->count("Source", "SOURce:FREQuency 60"), plan.readback.attempts);
    EXPECT_EQ(source->mode(), SessionMode::Faulted);
    EXPECT_LT(bench->indexOf("Source", "OUTPut ON"), 0);
  }

  TEST_F(ControllerTest, source_setVoltage_retries_transient_failure) {
    source->bringUp(plan.limits, 100.0);
    sourceLink->failOn("MEASure:VOLTage?", 0, 1); // first readback lost

    EXPECT_DOUBLE_EQ(source->setVoltage(110.0), 110.0);
    EXPECT_EQ(bench->count("Source", "VOLTage 110"), 2);
    EXPECT_EQ(source->session().lastSetpoint(), 110.0);
  }

  TEST_F(ControllerTest, source_setVoltage_out_of_tolerance_faults) {
    source->bringUp(plan.limits, 100.0);
    sourceLink->reply("MEASure:VOLTage?", "95.0");

    try {
      source->setVoltage(110.0);
      FAIL() << "expected InstrumentFault";
    } catch (const InstrumentFault& e) {
      EXPECT_EQ(e.instrument(), "Source");
      EXPECT_THAT(e.what(), HasSubstr("not reached"));
    }
  }

  TEST_F(ControllerTest, source_bringDown_is_idempotent_and_ramps_first) {
    source->bringUp(plan.limits, 100.0);
    source->bringDown();
    source->bringDown();

    EXPECT_EQ(source->mode(), SessionMode::Disabled);
    EXPECT_EQ(bench->count("Source", "OUTPut OFF"), 1);
    EXPECT_LT(bench->indexOf("Source", "VOLTage 0"), bench->indexOf("Source", "OUTPut OFF"));
    EXPECT_FALSE(sourceLink->isOpen());
  }

  TEST_F(ControllerTest, source_bringDown_never_connected_sends_nothing) {
    source->bringDown();
    EXPECT_EQ(source->mode(), SessionMode::Uninitialized);
    EXPECT_TRUE(bench->log.empty());
  }

  TEST_F(ControllerTest, source_bringDown_reconnects_lost_link) {
    source->bringUp(plan.limits, 100.0);
    sourceLink->dropLink();

    source->bringDown();

    EXPECT_EQ(sourceLink->openCount(), 2);
    EXPECT_EQ(bench->count("Source", "OUTPut OFF"), 1);
    EXPECT_EQ(source->mode(), SessionMode::Disabled);
  }

  TEST_F(ControllerTest, source_bringDown_failure_is_swallowed_and_marks_faulted) {
    source->bringUp(plan.limits, 100.0);
    sourceLink->failOn("VOLTage 0");

    EXPECT_NO_THROW(source->bringDown());

    // output still switched off even though the ramp command failed
    EXPECT_EQ(bench->count("Source", "OUTPut OFF"), 1);
    EXPECT_EQ(source->mode(), SessionMode::Faulted);
    EXPECT_NE(source->mode(), SessionMode::Energized);
  }

  TEST_F(ControllerTest, unreachable_source_faults_on_connect) {
    sourceLink->failOpen();
    EXPECT_THROW(source->bringUp(plan.limits, 100.0), InstrumentFault);
    EXPECT_EQ(source->mode(), SessionMode::Faulted);

    source->bringDown(); // nothing to talk to, must not throw
    EXPECT_EQ(source->mode(), SessionMode::Faulted);
  }

  //---LoadController-----------------------------------------------------------

  TEST_F(ControllerTest, load_enable_input_only_after_mode_and_limits) {
    load->bringUp(plan.limits);

    EXPECT_EQ(load->mode(), SessionMode::Energized);
    int loadOn = bench->indexOf("Load", "LOAD ON");
    ASSERT_GE(loadOn, 0);
    for (const char* setup : { "*RST", "*CLS", "MODE ACF", "CFACTor 1.414", "PFACtor 1",
                               "CURRent:MAXimum:AC 20", "SYSTem:ERRor?" }) {
      int at = bench->indexOf("Load", setup);
      ASSERT_GE(at, 0) << setup;
      EXPECT_LT(at, loadOn) << setup;
    }
    EXPECT_GT(bench->indexOf("Load", "LOAD:STATus?"), loadOn);
  }

  TEST_F(ControllerTest, load_never_selects_constant_current_mode) {
    load->bringUp(plan.limits);
    load->setCurrent(1.0);
    for (const auto& cmd : bench->payloads("Load"))
      EXPECT_EQ(cmd.rfind("MODE CC", 0), std::string::npos) << cmd;
  }

  TEST_F(ControllerTest, load_error_queue_entry_fails_bringUp) {
    loadLink->reply("SYSTem:ERRor?", "-222,\"Data out of range\"");

    EXPECT_THROW(load->bringUp(plan.limits), InstrumentFault);
    EXPECT_EQ(load->mode(), SessionMode::Faulted);
    EXPECT_LT(bench->indexOf("Load", "LOAD ON"), 0);
  }

  TEST_F(ControllerTest, load_setCurrent_sends_rms_then_peak_trigger) {
    load->bringUp(plan.limits);
    auto before = bench->log.size();

    EXPECT_DOUBLE_EQ(load->setCurrent(2.0), 2.0);
    EXPECT_TRUE(load->sinking());

    ASSERT_GE(bench->log.size(), before + 2);
    EXPECT_EQ(bench->log[before].payload, "CURR 2");
    EXPECT_EQ(bench->log[before + 1].payload, "CURRent:PEAK:MAXimum:AC 3");
  }

  TEST_F(ControllerTest, load_zero_amp_step_uses_minimum_peak_trigger) {
    load->bringUp(plan.limits);
    load->setCurrent(0.0);
    EXPECT_GE(bench->indexOf("Load", "CURRent:PEAK:MAXimum:AC 0.1"), 0);
  }

  TEST_F(ControllerTest, load_lost_peak_trigger_is_flagged_not_sinking) {
    load->bringUp(plan.limits);
    loadLink->drop("CURRent:PEAK:MAXimum:AC");

    try {
      load->setCurrent(1.5);
      FAIL() << "expected InstrumentFault";
    } catch (const InstrumentFault& e) {
      EXPECT_EQ(e.instrument(), "Load");
      EXPECT_THAT(e.what(), HasSubstr("not sinking"));
    }
    EXPECT_FALSE(load->sinking());
    EXPECT_EQ(load->mode(), SessionMode::Faulted);
    // every retry re-sent the pair
    EXPECT_EQ(bench->count("Load", "CURR 1.5"), plan.readback.attempts);
    EXPECT_EQ(bench->count("Load", "CURRent:PEAK:MAXimum:AC 2.25"), plan.readback.attempts);
  }

  TEST_F(ControllerTest, load_measure_reports_nan_for_garbage) {
    load->bringUp(plan.limits);
    bench->voltage = 120.0;
    load->setCurrent(2.0);
    loadLink->reply("MEASure:POWer?", "OVERRANGE,");

    auto r = load->measure();
    EXPECT_DOUBLE_EQ(r.voltage, 120.0);
    EXPECT_DOUBLE_EQ(r.current, 2.0);
    EXPECT_TRUE(std::isnan(r.power));
  }

  TEST_F(ControllerTest, load_bringDown_disables_input_once) {
    load->bringUp(plan.limits);
    load->bringDown();
    load->bringDown();

    EXPECT_EQ(bench->count("Load", "LOAD OFF"), 1);
    EXPECT_EQ(load->mode(), SessionMode::Disabled);
    EXPECT_EQ(loadLink->closeCount(), 1);

    auto cmds = bench->payloads("Load");
    ASSERT_GE(cmds.size(), 3u);
    std::vector<std::string> tail(cmds.end() - 3, cmds.end());
    EXPECT_EQ(tail, (std::vector<std::string>{ "LOAD OFF", "CURRent 0", "*RST" }));
  }

  TEST_F(ControllerTest, load_bringDown_reset_failure_keeps_input_off_state) {
    load->bringUp(plan.limits);
    loadLink->failOn("*RST");

    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("*RST"))).Times(1);
    EXPECT_NO_THROW(load->bringDown());
    EXPECT_EQ(load->mode(), SessionMode::Disabled);
    EXPECT_EQ(bench->count("Load", "LOAD OFF"), 1);
  }

  TEST_F(ControllerTest, load_bringDown_failure_reported_not_thrown) {
    load->bringUp(plan.limits);
    loadLink->failOn("LOAD OFF");

    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("LOAD OFF"))).Times(1);
    EXPECT_NO_THROW(load->bringDown());
    EXPECT_EQ(load->mode(), SessionMode::Faulted);
    EXPECT_FALSE(loadLink->isOpen());
    // clean-up still attempted
    EXPECT_GT(bench->indexOf("Load", "*RST"), bench->indexOf("Load", "LOAD OFF"));
  }

  //---InstrumentSession----------------------------------------------------------

  TEST_F(ControllerTest, session_translates_transport_errors_to_instrument_faults) {
    auto t = std::make_unique<FakeTransport>("Aux", bench);
    devices::InstrumentSession session("Aux", std::move(t), plan.readback, errorMonitor, log);

    // not connected yet: the fake refuses I/O
    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("[Aux]"))).Times(1);
    EXPECT_THROW(session.sendCommand(protocols::Command{ "*CLS" }), InstrumentFault);

    session.connect();
    EXPECT_TRUE(session.isConnected());
    EXPECT_EQ(session.query(protocols::Command{ "*IDN?" }).text, "FAKE,Aux,0,1.0");
  }

} // namespace ivbench::test
