#include "instrument-bench/BenchContext.hpp"
#include "instrument-bench/Config.hpp"
#include "instrument-bench/Logger.hpp"
#include "instrument-bench/UnitCodec.hpp"
#include "instrument-bench/worker/ConnectionTask.hpp"
#include "instrument-bench/worker/MeasurementTask.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <vector>

using namespace instbench;

static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int sig) {
  (void)sig;
  g_running = 0;
}

void print_usage() {
  std::cout << "Usage: instrument-bench <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  ports                              Scan and identify serial "
               "ports\n";
  std::cout << "  identify <target>                  Connect and print the "
               "identity\n";
  std::cout << "  measure <target> [--count N] [--interval MS]\n";
  std::cout << "                                     Continuous measurement\n";
  std::cout << "  sweep <target> --start V --stop V --step V [--delay MS] "
               "[--limit I]\n";
  std::cout << "                                     Voltage sweep, saved as "
               "a session\n";
  std::cout << "  help                               Show this message\n";
  std::cout << "\nTargets:\n";
  std::cout << "  tcp:HOST[:PORT]   visa:TCPIP0::HOST::PORT::SOCKET   "
               "serial:/dev/ttyUSB0[:BAUD]\n";
  std::cout << "\nOptions:\n";
  std::cout << "  --config <file>      YAML configuration\n";
  std::cout << "  --log-level <level>  Log level (default: info)\n";
  std::cout << "  --kind <smu|psu>     Instrument kind (default: smu, psu for "
               "serial)\n";
  std::cout << "  --out <dir>          Session output directory\n";
  std::cout << "  --format <csv|json>  Session file format\n";
  std::cout << "  --session <name>     Session name (default: "
               "session_YYYYmmdd_HHMMSS)\n";
  std::cout << "\nExamples:\n";
  std::cout << "  instrument-bench identify tcp:192.168.0.100\n";
  std::cout << "  instrument-bench measure serial:/dev/ttyUSB0 --count 10\n";
  std::cout << "  instrument-bench sweep tcp:192.168.0.100 --start 0 --stop 5 "
               "--step 500m\n";
}

struct CliOptions {
  std::vector<std::string> positional;
  std::map<std::string, std::string> values;

  bool has(const std::string &key) const { return values.count(key) > 0; }

  std::string value(const std::string &key,
                    const std::string &fallback = "") const {
    auto it = values.find(key);
    return it == values.end() ? fallback : it->second;
  }
};

/// Every option takes a value
bool parse_options(int argc, char **argv, CliOptions &out) {
  for (int i = 0; i < argc; i++) {
    std::string arg = argv[i];
    if (arg.rfind("--", 0) == 0) {
      if (i + 1 >= argc) {
        std::cerr << "Error: option " << arg << " needs a value\n";
        return false;
      }
      out.values[arg.substr(2)] = argv[++i];
    } else {
      out.positional.push_back(arg);
    }
  }
  return true;
}

bool load_config(const CliOptions &opts, ConfigStore &config) {
  if (opts.has("config") && !config.load_file(opts.value("config"))) {
    std::cerr << "Error: cannot load configuration " << opts.value("config")
              << "\n";
    return false;
  }
  if (opts.has("out")) {
    config.set("data.storage.base_path", opts.value("out"));
  }
  if (opts.has("format")) {
    config.set("data.storage.default_format", opts.value("format"));
  }

  std::string level = opts.value(
      "log-level", config.get("logging.level", "info"));
  InstrumentLogger::instance().init(
      config.get("logging.file", "instrument_bench.log"),
      parse_log_level(level));
  return true;
}

DeviceKind resolve_kind(const CliOptions &opts, const std::string &target) {
  if (opts.has("kind")) {
    return parse_device_kind(opts.value("kind"));
  }
  bool serial = target.rfind("serial:", 0) == 0 ||
                target.rfind("/dev/", 0) == 0 ||
                target.rfind("COM", 0) == 0;
  return serial ? DeviceKind::PowerSupply : DeviceKind::SourceMeter;
}

/// Runs a task until it finishes or Ctrl-C, then stops it
void run_until_done(WorkerEngine &task) {
  while (g_running && !is_terminal(task.status()) &&
         task.status() != WorkerStatus::Idle) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  if (!is_terminal(task.status())) {
    task.stop();
  }
}

void print_error(const WorkerEngine &task) {
  if (auto err = task.last_error()) {
    std::cerr << "Error: " << err->message << "\n";
  }
}

/// Connected driver, or nullptr after printing why not
std::shared_ptr<PowerSupplyLike> connect_target(BenchContext &ctx,
                                                const CliOptions &opts,
                                                const std::string &target) {
  DeviceKind kind = resolve_kind(opts, target);
  if (kind == DeviceKind::Unknown) {
    std::cerr << "Error: unknown --kind " << opts.value("kind") << "\n";
    return nullptr;
  }

  ConnectionParams params;
  std::shared_ptr<PowerSupplyLike> driver;
  try {
    params = connection_params_for(kind, target, ctx.config());
    driver = make_driver(kind, target, ctx.config());
  } catch (const BenchError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return nullptr;
  }

  std::cout << "Connecting to " << params.to_string() << " ("
            << to_string(kind) << ")...\n";
  ConnectionTask task(driver, params);
  task.connection_failed.connect(
      [](ConnectionFailure, const std::string &diagnostic) {
        std::cerr << "Connection failed: " << diagnostic << "\n";
      });
  task.start();
  run_until_done(task);

  if (!task.succeeded()) {
    print_error(task);
    return nullptr;
  }
  std::cout << "Connected: " << task.identity() << "\n";
  ctx.pool(kind).adopt(target, driver, params);
  return driver;
}

void print_sample(const Sample &s) {
  std::string resistance =
      s.resistance() ? UnitCodec::format(*s.resistance(), "Ohm") : "-";
  std::cout << format_timestamp(s.timestamp()) << "  "
            << UnitCodec::format(s.voltage(), "V") << "  "
            << UnitCodec::format(s.current(), "A") << "  " << resistance
            << "  " << UnitCodec::format(s.power(), "W") << "\n";
}

int run_measurement(BenchContext &ctx, std::shared_ptr<PowerSupplyLike> driver,
                    std::unique_ptr<MeasurementStrategy> strategy,
                    const nlohmann::json &params,
                    const std::string &session_name) {
  auto &sessions = ctx.sessions();
  sessions.start(session_name);

  MeasurementTask task(driver, std::move(strategy), params);
  task.sample.connect([&sessions](const Sample &s) {
    sessions.add_sample(s);
    print_sample(s);
  });
  sessions.anomaly_detected.connect([](const Anomaly &a) {
    std::cout << "  ! anomalous " << a.quantity << " (z=" << a.z_score
              << ")\n";
  });

  task.start();
  run_until_done(task);
  WorkerStatus final_status = task.status();
  if (final_status == WorkerStatus::Failed) {
    print_error(task);
  }

  auto stats = sessions.end();
  if (stats) {
    std::cout << "\nSession " << stats->session_name << ": "
              << stats->total_samples << " samples";
    if (stats->saved_path) {
      std::cout << ", saved to " << *stats->saved_path;
    }
    std::cout << "\n";
    for (const auto &[id, st] : stats->instruments) {
      std::cout << "  " << id << ": avg "
                << UnitCodec::format(st.voltage.mean, "V") << " / "
                << UnitCodec::format(st.current.mean, "A") << ", max "
                << UnitCodec::format(st.power.max, "W") << "\n";
    }
  }

  ctx.pool(driver->kind()).disconnect(driver->name());
  return final_status == WorkerStatus::Failed ? 1 : 0;
}

int cmd_ports(BenchContext &ctx, const CliOptions &) {
  auto devices = ctx.ports().scan(true);
  if (devices.empty()) {
    std::cout << "No serial ports found\n";
    return 0;
  }
  for (const auto &d : devices) {
    std::cout << d.address << "  " << d.device_type;
    if (!d.device_id.empty()) {
      std::cout << "  [" << d.device_id << "]";
    }
    if (!d.description.empty()) {
      std::cout << "  " << d.description;
    }
    std::cout << "\n";
  }
  return 0;
}

int cmd_identify(BenchContext &ctx, const CliOptions &opts) {
  if (opts.positional.size() < 2) {
    std::cerr << "Error: identify needs a target\n";
    return 1;
  }
  const std::string &target = opts.positional[1];
  auto driver = connect_target(ctx, opts, target);
  if (!driver) {
    return 1;
  }
  ctx.pool(driver->kind()).disconnect(target);
  return 0;
}

int cmd_measure(BenchContext &ctx, const CliOptions &opts) {
  if (opts.positional.size() < 2) {
    std::cerr << "Error: measure needs a target\n";
    return 1;
  }
  const std::string &target = opts.positional[1];

  nlohmann::json params;
  params["instrument_id"] = target;
  try {
    params["interval_ms"] = std::stoi(opts.value(
        "interval",
        std::to_string(ctx.config().get<int>("measurement.interval_ms", 1000))));
    if (opts.has("count")) {
      params["max_measurements"] = std::stoul(opts.value("count"));
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: bad numeric option: " << e.what() << "\n";
    return 1;
  }

  auto driver = connect_target(ctx, opts, target);
  if (!driver) {
    return 1;
  }
  return run_measurement(ctx, driver, std::make_unique<ContinuousStrategy>(),
                         params, opts.value("session"));
}

int cmd_sweep(BenchContext &ctx, const CliOptions &opts) {
  if (opts.positional.size() < 2) {
    std::cerr << "Error: sweep needs a target\n";
    return 1;
  }
  for (const char *required : {"start", "stop", "step"}) {
    if (!opts.has(required)) {
      std::cerr << "Error: sweep needs --" << required << "\n";
      return 1;
    }
  }
  const std::string &target = opts.positional[1];

  nlohmann::json params;
  params["instrument_id"] = target;
  params["start"] = opts.value("start");
  params["stop"] = opts.value("stop");
  params["step"] = opts.value("step");
  params["delay_ms"] = ctx.config().get<int>("measurement.sweep_delay_ms", 100);
  params["current_limit"] =
      ctx.config().get<double>("instruments.source_meter.current_limit", 0.1);

  try {
    if (opts.has("delay")) {
      params["delay_ms"] = std::stoi(opts.value("delay"));
    }
    if (opts.has("limit")) {
      params["current_limit"] = UnitCodec::parse(opts.value("limit"));
    }
    auto points = SweepPlan::from_json(params).targets();
    std::cout << "Sweep of " << points.size() << " points\n";
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  auto driver = connect_target(ctx, opts, target);
  if (!driver) {
    return 1;
  }
  return run_measurement(ctx, driver, std::make_unique<SweepStrategy>(),
                         params, opts.value("session"));
}

int main(int argc, char **argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string first = argv[1];
  if (first == "help" || first == "--help" || first == "-h") {
    print_usage();
    return 0;
  }

  CliOptions opts;
  if (!parse_options(argc - 1, argv + 1, opts) || opts.positional.empty()) {
    print_usage();
    return 1;
  }

  std::string command = opts.positional[0];
  if (command == "help") {
    print_usage();
    return 0;
  }

  ConfigStore config;
  if (!load_config(opts, config)) {
    return 1;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  int rc = 1;
  try {
    BenchContext ctx(config);
    if (command == "ports") {
      rc = cmd_ports(ctx, opts);
    } else if (command == "identify") {
      rc = cmd_identify(ctx, opts);
    } else if (command == "measure") {
      rc = cmd_measure(ctx, opts);
    } else if (command == "sweep") {
      rc = cmd_sweep(ctx, opts);
    } else {
      std::cerr << "Unknown command: " << command << "\n\n";
      print_usage();
    }
  } catch (const BenchError &e) {
    LOG_ERROR("CLI", command, "{}", e.what());
    std::cerr << "Error: " << e.what() << "\n";
    rc = 1;
  }

  InstrumentLogger::instance().shutdown();
  return rc;
}
