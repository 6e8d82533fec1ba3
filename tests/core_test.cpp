// ivbench headers
#include "core/AbortMonitor.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"
#include "core/SweepPlan.hpp"

// ivbench-Fake headers
#include "BenchPlan.hpp"
#include "FakeKeyInput.hpp"
#include "MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// Third-party headers
#include <nlohmann/json.hpp>

// STL headers
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace ivbench::test {

  using core::ConfigurationError;
  using core::SweepPlan;
  using core::SweepRange;
  using testing::HasSubstr;
  using namespace std::chrono_literals;

  namespace {

    const char* kMinimalPlan = R"({
      "source":  { "host": "192.168.0.149" },
      "load":    { "resource": "GPIB0::8::INSTR", "controller": "/dev/ttyUSB0" },
      "voltage": { "start": 100, "stop": 150, "step": 25 },
      "current": { "start": 0, "stop": 10, "step": 2.5 }
    })";

    std::string writeTemp(const std::string& content) {
      char tmpl[] = "/tmp/ivbench_plan_XXXXXX";
      int fd = mkstemp(tmpl);
      if (fd >= 0)
        ::close(fd);
      std::ofstream(tmpl) << content;
      return tmpl;
    }

  } // namespace

  //---ErrorMonitor-------------------------------------------------------------

  TEST(error_monitor, escalates_each_unique_failure_once) {
    core::ErrorMonitor monitor;
    std::vector<std::string> escalated;
    monitor.registerEscalation([&](const std::string& msg) { escalated.push_back(msg); });

    monitor.notifyFailure("[Load] 'CURR 1' failed");
    monitor.notifyFailure("[Load] 'CURR 1' failed"); // retry loop repeats itself
    monitor.notifyFailure("[Source] connect failed");

    EXPECT_EQ(escalated.size(), 2u);
    EXPECT_EQ(monitor.failures().size(), 2u);
    EXPECT_EQ(monitor.notificationCount(), 3u);
  }

  TEST(error_monitor, mock_still_applies_dedup_by_default) {
    testing::NiceMock<MockErrorMonitor> monitor;
    EXPECT_CALL(monitor, notifyFailure(HasSubstr("timeout"))).Times(2);

    monitor.notifyFailure("timeout on MODE?");
    monitor.notifyFailure("timeout on MODE?");

    EXPECT_EQ(monitor.failures().size(), 1u);
  }

  //---RingBuffer---------------------------------------------------------------

  TEST(ring_buffer, drops_oldest_when_full) {
    core::RingBuffer<int> rb(3);
    EXPECT_TRUE(rb.push(1));
    EXPECT_TRUE(rb.push(2));
    EXPECT_TRUE(rb.push(3));
    EXPECT_FALSE(rb.push(4)); // 1 is gone

    EXPECT_EQ(rb.size(), 3u);
    EXPECT_EQ(rb.pop(), 2);
    EXPECT_EQ(rb.pop(), 3);
    EXPECT_EQ(rb.pop(), 4);
    EXPECT_FALSE(rb.pop());
    EXPECT_TRUE(rb.empty());
  }

  //---Logger-------------------------------------------------------------------

  TEST(logger, filters_console_by_severity_and_writes_event_csv) {
    std::ostringstream console;
    core::Logger log(console, core::Severity::Info);

    char tmpl[] = "/tmp/ivbench_events_XXXXXX";
    int fd = mkstemp(tmpl);
    ASSERT_GE(fd, 0);
    ::close(fd);

    ASSERT_TRUE(log.startNewRun(tmpl));
    log.debug("SweepEngine", "Idle -> SourceUp");
    log.info("Source", "output ON at 100.000 V");
    log.error("Load", "bring-down incomplete, \"check\" panel");
    log.finishRun();

    auto text = console.str();
    EXPECT_THAT(text, HasSubstr("[INFO] [Source] output ON at 100.000 V"));
    EXPECT_THAT(text, HasSubstr("[ERROR] [Load]"));
    EXPECT_THAT(text, testing::Not(HasSubstr("Idle -> SourceUp")));

    std::ifstream in(tmpl);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);)
      lines.push_back(line);
    ASSERT_EQ(lines.size(), 4u); // header + all three, debug included
    EXPECT_EQ(lines[0], "time,severity,source,message");
    EXPECT_THAT(lines[1], HasSubstr(",DEBUG,\"SweepEngine\",\"Idle -> SourceUp\""));
    EXPECT_THAT(lines[3], HasSubstr("\"\"check\"\""));
    std::remove(tmpl);
  }

  TEST(logger, writes_synchronously_outside_a_run) {
    std::ostringstream console;
    core::Logger log(console, core::Severity::Debug);
    log.warning("ivsweep", "stdin not readable");
    EXPECT_THAT(console.str(), HasSubstr("[WARN] [ivsweep] stdin not readable"));
  }

  TEST(logger, keeps_order_across_worker_thread) {
    std::ostringstream console;
    core::Logger log(console, core::Severity::Info, 4096);
    ASSERT_TRUE(log.startNewRun(""));
    for (int i = 0; i < 100; ++i)
      log.info("seq", std::to_string(i));
    log.finishRun();

    EXPECT_EQ(log.dropped(), 0u);
    auto text = console.str();
    EXPECT_LT(text.find("] 10\n"), text.find("] 99\n"));
  }

  //---AbortMonitor-------------------------------------------------------------

  TEST(abort_monitor, flag_is_sticky_and_first_reason_wins) {
    core::AbortMonitor abort;
    int callbacks = 0;
    abort.registerCallback([&](const std::string&) { ++callbacks; });

    EXPECT_FALSE(abort.abortRequested());
    abort.requestAbort("operator pressed 'q'");
    abort.requestAbort("SIGINT");

    EXPECT_TRUE(abort.abortRequested());
    EXPECT_EQ(abort.reason(), "operator pressed 'q'");
    EXPECT_EQ(callbacks, 1);
  }

  TEST(abort_monitor, waitFor_returns_early_on_abort) {
    core::AbortMonitor abort;
    EXPECT_FALSE(abort.waitFor(5ms));

    std::thread t([&] {
      std::this_thread::sleep_for(20ms);
      abort.requestAbort("test");
    });
    auto t0 = std::chrono::steady_clock::now();
    EXPECT_TRUE(abort.waitFor(10s));
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 5s);
    t.join();

    // already aborted: no wait at all
    EXPECT_TRUE(abort.waitFor(10s));
  }

  TEST(abort_monitor, watcher_thread_reacts_to_abort_key_case_insensitively) {
    core::AbortMonitor abort('q');
    auto keys = std::make_unique<FakeKeyInput>();
    auto* fake = keys.get();
    ASSERT_TRUE(keys->open(0));
    abort.start(std::move(keys));

    fake->press('x'); // ignored
    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(abort.abortRequested());

    fake->press('Q');
    EXPECT_TRUE(abort.waitFor(2s));
    EXPECT_THAT(abort.reason(), HasSubstr("'q'"));
    abort.stop();
  }

  TEST(abort_monitor, ctrl_c_byte_is_an_abort) {
    core::AbortMonitor abort('s');
    auto keys = std::make_unique<FakeKeyInput>();
    auto* fake = keys.get();
    keys->open(0);
    abort.start(std::move(keys));

    fake->press(io::KeyInput::kInterrupt);
    EXPECT_TRUE(abort.waitFor(2s));
    EXPECT_THAT(abort.reason(), HasSubstr("Ctrl-C"));
  } // destructor stops the watcher

  TEST(abort_monitor, closed_input_ends_watcher_without_abort) {
    core::AbortMonitor abort;
    auto keys = std::make_unique<FakeKeyInput>();
    auto* fake = keys.get();
    keys->open(0);
    abort.start(std::move(keys));

    fake->hangUp();
    std::this_thread::sleep_for(150ms);
    EXPECT_FALSE(abort.abortRequested());
    abort.stop();
  }

  //---SweepRange / SweepPlan -----------------------------------------------------

  TEST(sweep_range, inclusive_of_stop_in_both_directions) {
    EXPECT_EQ((SweepRange{ 0.0, 10.0, 2.5, "A" }.values()),
              (std::vector<double>{ 0.0, 2.5, 5.0, 7.5, 10.0 }));
    EXPECT_EQ((SweepRange{ 120.0, 100.0, -10.0, "V" }.values()),
              (std::vector<double>{ 120.0, 110.0, 100.0 }));
    EXPECT_EQ((SweepRange{ 5.0, 5.0, 1.0, "V" }.count()), 1u);
    // stop not on the grid: last value stays inside the range
    EXPECT_EQ((SweepRange{ 0.0, 1.0, 0.3, "A" }.count()), 4u);
    // accumulated float error must not lose the endpoint
    EXPECT_EQ((SweepRange{ 0.0, 1.0, 0.1, "A" }.count()), 11u);
  }

  TEST(sweep_range, last_value_is_exactly_stop) {
    auto amps = SweepRange{ 0.0, 0.3, 0.1, "A" }.values();
    ASSERT_EQ(amps.size(), 4u);
    EXPECT_EQ(amps.back(), 0.3);
    auto volts = SweepRange{ 0.3, 0.0, -0.1, "V" }.values();
    ASSERT_EQ(volts.size(), 4u);
    EXPECT_EQ(volts.back(), 0.0);
  }

  TEST(sweep_plan, range_ending_on_the_safety_limit_is_accepted) {
    SweepPlan plan = benchPlan({ 100.0, 120.0, 10.0, "V" }, { 0.0, 0.3, 0.1, "A" });
    plan.limits.maxCurrent = 0.3;
    EXPECT_NO_THROW(plan.validate());
  }

  TEST(sweep_range, rejects_degenerate_ranges) {
    EXPECT_THROW((SweepRange{ 0.0, 10.0, 0.0, "A" }.values()), ConfigurationError);
    EXPECT_THROW((SweepRange{ 0.0, 10.0, -1.0, "A" }.values()), ConfigurationError);
    EXPECT_THROW((SweepRange{ 0.0, 1e9, 1e-3, "A" }.values()), ConfigurationError);
  }

  TEST(sweep_plan, minimal_json_gets_defaults) {
    auto plan = SweepPlan::fromJson(nlohmann::json::parse(kMinimalPlan));

    EXPECT_EQ(plan.source.host, "192.168.0.149");
    EXPECT_EQ(plan.source.port, 5025);
    EXPECT_EQ(plan.source.channel, 3);
    EXPECT_EQ(plan.load.resource, "GPIB0::8::INSTR");
    EXPECT_EQ(plan.voltage.count(), 3u);
    EXPECT_EQ(plan.current.count(), 5u);
    EXPECT_EQ(plan.voltage.unit, "V");
    EXPECT_EQ(plan.readback.attempts, 3);
    EXPECT_DOUBLE_EQ(plan.readback.voltageTolerance, 0.5);
    EXPECT_DOUBLE_EQ(plan.limits.crestFactor, 1.414);
    EXPECT_EQ(plan.timing.settle, 20000ms);
    EXPECT_EQ(plan.abortKey, 'q');
  }

  TEST(sweep_plan, optional_blocks_override_defaults) {
    auto j = nlohmann::json::parse(kMinimalPlan);
    j["readback"] = { { "attempts", 5 }, { "current_tolerance", 0.05 }, { "retry_delay_ms", 10 } };
    j["timing"] = { { "settle_ms", 500 } };
    j["limits"] = { { "max_current", 12 }, { "peak_factor", 1.6 } };
    j["abort_key"] = "x";

    auto plan = SweepPlan::fromJson(j);
    EXPECT_EQ(plan.readback.attempts, 5);
    EXPECT_DOUBLE_EQ(plan.readback.currentTolerance, 0.05);
    EXPECT_EQ(plan.readback.retryDelay, 10ms);
    EXPECT_EQ(plan.timing.settle, 500ms);
    EXPECT_EQ(plan.timing.sourceSettle, 1500ms);
    EXPECT_DOUBLE_EQ(plan.peakCurrentFor(2.0), 3.2);
    EXPECT_DOUBLE_EQ(plan.peakCurrentFor(0.0), 0.1);
    EXPECT_EQ(plan.abortKey, 'x');
  }

  TEST(sweep_plan, schema_and_invariant_violations_are_configuration_errors) {
    auto base = nlohmann::json::parse(kMinimalPlan);

    auto noLoad = base;
    noLoad.erase("load");
    EXPECT_THROW(SweepPlan::fromJson(noLoad), ConfigurationError);

    auto wrongType = base;
    wrongType["voltage"]["step"] = "ten";
    EXPECT_THROW(SweepPlan::fromJson(wrongType), ConfigurationError);

    auto overLimit = base;
    overLimit["current"]["stop"] = 25; // above max_current 20
    EXPECT_THROW(SweepPlan::fromJson(overLimit), ConfigurationError);

    auto badPf = base;
    badPf["limits"] = { { "power_factor", 1.2 } };
    EXPECT_THROW(SweepPlan::fromJson(badPf), ConfigurationError);

    auto badKey = base;
    badKey["abort_key"] = "quit";
    EXPECT_THROW(SweepPlan::fromJson(badKey), ConfigurationError);

    auto badPort = base;
    badPort["source"]["port"] = 70000;
    EXPECT_THROW(SweepPlan::fromJson(badPort), ConfigurationError);

    auto noAttempts = base;
    noAttempts["readback"] = { { "attempts", 0 } };
    EXPECT_THROW(SweepPlan::fromJson(noAttempts), ConfigurationError);
  }

  //---ConfigLoader---------------------------------------------------------------

  TEST(config_loader, loads_plan_with_comments) {
    auto path = writeTemp(std::string("// bench 2, Croma + NHR\n") + kMinimalPlan);
    auto plan = core::ConfigLoader(path).loadPlan();
    EXPECT_EQ(plan.voltage.count(), 3u);
    std::remove(path.c_str());
  }

  TEST(config_loader, reports_path_on_every_error) {
    try {
      core::ConfigLoader("/nonexistent/plan.json").load();
      FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
      EXPECT_THAT(e.what(), HasSubstr("/nonexistent/plan.json"));
    }

    auto broken = writeTemp("{ \"source\": ");
    EXPECT_THROW(core::ConfigLoader(broken).load(), ConfigurationError);
    std::remove(broken.c_str());

    auto invalid = writeTemp(R"({ "source": { "host": "h" } })");
    try {
      core::ConfigLoader(invalid).loadPlan();
      FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
      EXPECT_THAT(e.what(), HasSubstr("load"));
      EXPECT_THAT(e.what(), HasSubstr(invalid));
    }
    std::remove(invalid.c_str());
  }

} // namespace ivbench::test
