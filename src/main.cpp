#include <csignal>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <chronicle/anchor/context.hpp>
#include <chronicle/common/critical.hpp>
#include <chronicle/ledger/development_ledger.hpp>
#include <chronicle/service/backend.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto data_dir = std::string{};
  auto config_file = std::string{};
  auto log_file = std::string{};
  auto log_level = std::string{};
  auto flush_period = int64_t{};
  auto flush_offset = int64_t{};
  auto stuck_multiple = uint32_t{};
  auto confirm_after = int64_t{};
  auto enable_collections = false;

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Chronicle"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", boost::program_options::value<std::string>(&config_file),
      "Options file in key=value form")(
      "data-dir,d",
      boost::program_options::value<std::string>(&data_dir)
          ->default_value("chronicle-data"),
      "RocksDB directory")(
      "flush-period",
      boost::program_options::value<int64_t>(&flush_period)
          ->default_value(3600),
      "Seconds between batch closures")(
      "flush-offset",
      boost::program_options::value<int64_t>(&flush_offset)
          ->default_value(10),
      "Seconds past each period boundary to flush")(
      "stuck-multiple",
      boost::program_options::value<uint32_t>(&stuck_multiple)
          ->default_value(24),
      "Flush periods after which a pending digest is reported stuck")(
      "enable-collections",
      boost::program_options::bool_switch(&enable_collections),
      "Serve digests grouped by collection window")(
      "dev-ledger-confirm-after",
      boost::program_options::value<int64_t>(&confirm_after)
          ->default_value(60),
      "Seconds before the development ledger confirms a submission")(
      "fsck", "Run a consistency check before serving")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)
          ->default_value("chronicled.log"),
      "Log file path")(
      "log-level",
      boost::program_options::value<std::string>(&log_level)
          ->default_value("info"),
      "trace|debug|info|warn|error|critical|off");
  boost::program_options::store(
      boost::program_options::parse_command_line(argc, argv, description), vm);
  if (vm.contains("config")) {
    auto config = std::ifstream{vm["config"].as<std::string>()};
    if (!config) {
      std::cerr << "cannot read config file " << vm["config"].as<std::string>()
                << std::endl;
      return 1;
    }
    boost::program_options::store(
        boost::program_options::parse_config_file(config, description), vm);
  }
  boost::program_options::notify(vm);

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "chronicled", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  if (flush_period <= 0 || flush_offset < 0 || flush_offset >= flush_period) {
    chronicle::common::critical(
        "flush offset {}s must lie within a positive flush period, got {}s",
        flush_offset, flush_period);
  }

  auto options = chronicle::service::backend_options{
      .flush_period = std::chrono::seconds{flush_period},
      .flush_offset = std::chrono::seconds{flush_offset},
      .stuck_multiple = stuck_multiple,
      .enable_collections = enable_collections};

  auto storage =
      chronicle::storage::make_storage<chronicle::storage::rocksdb_storage_tag>(
          data_dir);
  auto ledger = chronicle::ledger::development_ledger{
      storage, chronicle::anchor::system_clock_seconds, confirm_after};
  auto backend = chronicle::service::backend{
      storage, ledger.client(), chronicle::anchor::system_clock_seconds,
      options};
  spdlog::warn("Anchoring to the in-process development ledger");

  if (vm.contains("fsck")) {
    auto report = backend.fsck(chronicle::schema::fsck_options{
        .query_ledger = false, .stuck_multiple = stuck_multiple});
    if (report.code != 0) {
      spdlog::warn("Startup fsck reported {} findings", report.findings.size());
    }
  }

  backend.start();
  spdlog::info("chronicled serving {} (flush every {}s at +{}s)", data_dir,
               flush_period, flush_offset);

  while (!shutdown_requested()) {
    std::this_thread::sleep_for(std::chrono::seconds(1));
  }

  spdlog::info("Shutdown requested, draining");
  backend.close();
  spdlog::shutdown();
  return 0;
}
