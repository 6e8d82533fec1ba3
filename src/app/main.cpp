/* @file main.cpp
 * @brief ivsweep entry point: load a plan, run one V/I sweep, map the outcome to an exit code
 *
 * © 2025 The ivbench authors — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <exception>
#include <memory>
#include <string>
#include <thread>

// Linux header
#include <pthread.h>
#include <unistd.h>

// ivbench headers
#include "core/AbortMonitor.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/SweepEngine.hpp"
#include "devices/LoadController.hpp"
#include "devices/SourceController.hpp"
#include "io/CsvResultSink.hpp"
#include "io/GpibTransport.hpp"
#include "io/KeyInput.hpp"
#include "io/SocketTransport.hpp"

using namespace ivbench;

namespace {

  constexpr int kExitCompleted = 0;
  constexpr int kExitFailed = 1;
  constexpr int kExitAborted = 2;

  void printUsage(const char* argv0) {
    std::fprintf(stderr,
                 "Usage: %s --config <plan.json> [options]\n"
                 "\n"
                 "  --config <file>  sweep plan (JSON)\n"
                 "  --out <file>     result CSV (default: ivsweep_<date>_<time>.csv)\n"
                 "  --log <file>     event log CSV (default: none)\n"
                 "  --verbose        debug output on the console\n"
                 "  --help           this text\n"
                 "\n"
                 "Press the abort key (default 'q') or Ctrl-C during the sweep to stop;\n"
                 "both instruments are always switched off before exit.\n"
                 "Exit status: 0 completed, 2 aborted, 1 failed or bad arguments.\n",
                 argv0);
  }

  std::string defaultResultPath() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char buf[64];
    std::strftime(buf, sizeof(buf), "ivsweep_%Y%m%d_%H%M%S.csv", &local);
    return buf;
  }

  /**
   * SIGINT/SIGTERM are blocked in every thread and collected here instead, so a
   * signal becomes an abort request and the run still passes through shutdown.
   */
  class SignalWatcher {
  public:
    SignalWatcher() {
      sigemptyset(&set_);
      sigaddset(&set_, SIGINT);
      sigaddset(&set_, SIGTERM);
      pthread_sigmask(SIG_BLOCK, &set_, nullptr);
    }
    ~SignalWatcher() { stop(); }

    void start(core::AbortMonitor& abort) {
      running_ = true;
      worker_ = std::thread([this, &abort] {
        timespec tick{ 0, 200 * 1000 * 1000 };
        while (running_) {
          int sig = sigtimedwait(&set_, nullptr, &tick);
          if (sig == SIGINT || sig == SIGTERM)
            abort.requestAbort(sig == SIGINT ? "SIGINT" : "SIGTERM");
        }
      });
    }

    void stop() {
      running_ = false;
      if (worker_.joinable())
        worker_.join();
    }

  private:
    sigset_t set_{};
    std::atomic<bool> running_{ false };
    std::thread worker_;
  };

} // namespace

int main(int argc, char* argv[]) {
  std::string configPath;
  std::string resultPath;
  std::string eventLogPath;
  bool verbose = false;

  // Parse command-line arguments
  for (int i = 1; i < argc; i++) {
    std::string s(argv[i]);
    bool hasValue = i + 1 < argc;

    if (s == "--help") {
      printUsage(argv[0]);
      return kExitCompleted;
    } else if (s == "--config" && hasValue)
      configPath = argv[++i];
    else if (s == "--out" && hasValue)
      resultPath = argv[++i];
    else if (s == "--log" && hasValue)
      eventLogPath = argv[++i];
    else if (s == "--verbose")
      verbose = true;
    else {
      std::fprintf(stderr, "Unrecognized or incomplete argument \"%s\", use --help\n", s.c_str());
      return kExitFailed;
    }
  }
  if (configPath.empty()) {
    printUsage(argv[0]);
    return kExitFailed;
  }
  if (resultPath.empty())
    resultPath = defaultResultPath();

  // Plan first: nothing is contacted until it parses and validates
  core::SweepPlan plan;
  try {
    plan = core::ConfigLoader(configPath).loadPlan();
  } catch (const core::ConfigurationError& e) {
    std::fprintf(stderr, "%s\n", e.what());
    return kExitFailed;
  }

  SignalWatcher signals; // before any other thread exists

  core::Logger log(std::cerr, verbose ? core::Severity::Debug : core::Severity::Info);
  if (!log.startNewRun(eventLogPath)) {
    std::fprintf(stderr, "cannot open event log %s\n", eventLogPath.c_str());
    return kExitFailed;
  }

  auto errorMonitor = std::make_shared<core::ErrorMonitor>();
  errorMonitor->registerEscalation([&log](const std::string& msg) { log.error("ErrorMonitor", msg); });

  std::unique_ptr<io::CsvResultSink> sink;
  std::unique_ptr<devices::SourceController> source;
  std::unique_ptr<devices::LoadController> load;
  try {
    sink = std::make_unique<io::CsvResultSink>(resultPath);
    source = std::make_unique<devices::SourceController>(
        std::make_unique<io::SocketTransport>(plan.source.host, plan.source.port, plan.source.timeout),
        plan, errorMonitor, log);
    load = std::make_unique<devices::LoadController>(
        std::make_unique<io::GpibTransport>(plan.load.resource, plan.load.controller, plan.load.timeout),
        plan, errorMonitor, log);
  } catch (const std::exception& e) {
    log.error("ivsweep", e.what());
    log.finishRun();
    return kExitFailed;
  }

  core::AbortMonitor abort(plan.abortKey);
  abort.registerCallback([&log](const std::string& reason) {
    log.warning("AbortMonitor", "abort requested (" + reason + "), finishing current step");
  });

  auto keys = std::make_unique<io::KeyInput>();
  if (keys->open(STDIN_FILENO))
    abort.start(std::move(keys));
  else
    log.warning("ivsweep", "stdin not readable, abort key disabled");
  signals.start(abort);

  log.info("ivsweep", std::string("plan ") + configPath + ", results -> " + resultPath +
                          ", press '" + plan.abortKey + "' to abort");

  int exitCode = kExitFailed;
  try {
    core::SweepEngine engine(plan, *source, *load, errorMonitor, log);
    auto result = engine.run(abort, *sink);
    switch (result.outcome.status) {
    case core::RunOutcome::Status::Completed:
      exitCode = kExitCompleted;
      break;
    case core::RunOutcome::Status::Aborted:
      exitCode = kExitAborted;
      break;
    case core::RunOutcome::Status::Failed:
      exitCode = kExitFailed;
      break;
    }
  } catch (const std::exception& e) {
    // engine construction only; run() itself always shuts down and returns
    log.error("ivsweep", e.what());
  }

  signals.stop();
  abort.stop();
  log.finishRun();
  return exitCode;
}
