#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <chronicle/anchor/context.hpp>
#include <chronicle/common/critical.hpp>
#include <chronicle/ledger/ledger_client.hpp>
#include <chronicle/schema/error_code.hpp>
#include <chronicle/service/backend.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace {

namespace po = boost::program_options;

// The tool never submits; ledger queries need a wallet client it does not
// carry.
chronicle::ledger::ledger_client offline_ledger() {
  return chronicle::ledger::ledger_client{
      .submit =
          [](const chronicle::schema::root_t&) {
            return chronicle::ledger::submit_result{
                .code = chronicle::schema::to_code(
                    chronicle::schema::error_code::unsupported),
                .log = "dbutil does not submit"};
          },
      .query =
          [](const std::string&) {
            return chronicle::ledger::query_result{
                .code = chronicle::schema::to_code(
                    chronicle::schema::error_code::ledger_unavailable),
                .log = "no ledger client configured"};
          }};
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  chronicle_dbutil --data-dir DIR --dump FILE [--human]\n"
            << "  chronicle_dbutil --data-dir DIR --restore FILE\n"
            << "  chronicle_dbutil --data-dir DIR --fsck [--query-ledger]\n"
            << "  chronicle_dbutil --data-dir DIR --purge DIGEST\n\n";
  std::cout << options << '\n';
}

int report(const chronicle::schema::operation_result_t& result) {
  if (result.code != 0) {
    std::cerr << chronicle::schema::to_string(
                     static_cast<chronicle::schema::error_code>(result.code))
              << ": " << result.log << '\n';
    return 1;
  }
  return 0;
}

}  // namespace

int main(int argc, const char** argv) {
  auto data_dir = std::string{};
  auto flush_period = int64_t{};
  auto stuck_multiple = uint32_t{};
  auto options = po::options_description{"chronicle_dbutil options"};
  options.add_options()("help,h", "show help")(
      "data-dir,d",
      po::value<std::string>(&data_dir)->default_value("chronicle-data"),
      "RocksDB directory")("dump", po::value<std::string>(),
                           "write every digest and batch to FILE, - for stdout")(
      "human", "dump one line per row instead of the restorable form")(
      "restore", po::value<std::string>(),
      "load a dump from FILE, - for stdin, into an empty store")(
      "fsck", "check batch roots, digest links and stuck digests")(
      "query-ledger", "during fsck, re-query the ledger for submitted batches")(
      "print-hashes", "during fsck, log every batch member")(
      "purge", po::value<std::string>(), "remove a pending digest (hex)")(
      "flush-period", po::value<int64_t>(&flush_period)->default_value(3600),
      "flush period the store was written with, seconds")(
      "stuck-multiple", po::value<uint32_t>(&stuck_multiple)->default_value(24),
      "flush periods after which a pending digest is stuck")(
      "verbose,v", "log every batch checked");

  auto vm = po::variables_map{};
  po::store(po::parse_command_line(argc, argv, options), vm);
  po::notify(vm);

  auto commands = vm.count("dump") + vm.count("restore") + vm.count("fsck") +
                  vm.count("purge");
  if (vm.contains("help") || commands != 1) {
    print_help(options);
    return vm.contains("help") ? 0 : 1;
  }

  spdlog::set_default_logger(spdlog::stderr_color_mt("dbutil"));
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  if (flush_period <= 0) {
    chronicle::common::critical("flush period must be positive, got {}",
                                flush_period);
  }
  auto purge_digest = std::optional<chronicle::schema::digest_t>{};
  if (vm.contains("purge")) {
    purge_digest =
        chronicle::schema::try_parse_hash32(vm["purge"].as<std::string>());
    if (!purge_digest.has_value()) {
      chronicle::common::critical("purge expects 64 hex digits, got {}",
                                  vm["purge"].as<std::string>());
    }
  }

  auto storage =
      chronicle::storage::make_storage<chronicle::storage::rocksdb_storage_tag>(
          data_dir);
  auto backend = chronicle::service::backend{
      storage, offline_ledger(), chronicle::anchor::system_clock_seconds,
      chronicle::service::backend_options{
          .flush_period = std::chrono::seconds{flush_period},
          .flush_offset = std::chrono::seconds{0},
          .stuck_multiple = stuck_multiple}};

  auto status = 0;
  if (vm.contains("dump")) {
    auto path = vm["dump"].as<std::string>();
    auto human = vm.contains("human");
    if (path == "-") {
      status = report(backend.dump(std::cout, human));
    } else {
      auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
      if (!out) {
        chronicle::common::critical("cannot open dump file {} for writing",
                                    path);
      }
      status = report(backend.dump(out, human));
    }
  } else if (vm.contains("restore")) {
    auto path = vm["restore"].as<std::string>();
    auto verbose = vm.contains("verbose");
    if (path == "-") {
      status = report(backend.restore(std::cin, verbose, data_dir));
    } else {
      auto in = std::ifstream{path, std::ios::binary};
      if (!in) {
        chronicle::common::critical("cannot open dump file {} for reading",
                                    path);
      }
      status = report(backend.restore(in, verbose, data_dir));
    }
  } else if (vm.contains("fsck")) {
    auto result = backend.fsck(chronicle::schema::fsck_options{
        .verbose = vm.contains("verbose"),
        .print_hashes = vm.contains("print-hashes"),
        .query_ledger = vm.contains("query-ledger"),
        .stuck_multiple = stuck_multiple});
    for (const auto& finding : result.findings) {
      std::cout << chronicle::schema::to_string(finding.code) << ' '
                << chronicle::schema::to_hex(finding.subject) << ' '
                << finding.detail << '\n';
    }
    std::cout << result.batches_checked << " batches, "
              << result.digests_checked << " digests ("
              << result.pending_digests << " pending), "
              << result.findings.size() << " findings\n";
    status = result.code == 0 ? 0 : 1;
  } else {
    status = report(backend.purge(purge_digest.value()));
  }

  backend.close();
  spdlog::shutdown();
  return status;
}
