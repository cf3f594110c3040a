#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <stakeline/common/critical.hpp>
#include <stakeline/crypto/deposit_data_root.hpp>
#include <stakeline/execution/engine.hpp>
#include <stakeline/schema/encoding/scale/encoder.hpp>
#include <stakeline/storage/rocksdb/storage.hpp>

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace stakeline::schema;

namespace {

namespace po = boost::program_options;

void print_help(const po::options_description& options) {
  std::cout << "usage: stakeline <command> [options]\n\n"
            << "commands:\n"
            << "  deposit-root            compute deposit_data_root\n"
            << "  withdrawal-credentials  0x01 credentials for an address\n"
            << "  inspect                 print committed engine state\n\n"
            << options << std::endl;
}

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    stakeline::common::critical("missing required option --{}", name);
  }
  return vm[name].as<std::string>();
}

bytes_t require_hex(const po::variables_map& vm, const std::string& name) {
  auto bytes = try_from_hex(require(vm, name));
  if (!bytes) {
    stakeline::common::critical("--{} is not valid hex", name);
  }
  return *bytes;
}

address_t require_address(const po::variables_map& vm,
                          const std::string& name) {
  auto address = try_make_address(require(vm, name));
  if (!address) {
    stakeline::common::critical("--{} is not a 20-byte hex address", name);
  }
  return *address;
}

amount_t parse_amount(const std::string& value) {
  try {
    return amount_t{value};
  } catch (const std::runtime_error& ex) {
    stakeline::common::critical("invalid amount '{}': {}", value, ex.what());
  }
}

int run_deposit_root(const po::variables_map& vm) {
  auto pubkey = require_hex(vm, "pubkey");
  auto signature = require_hex(vm, "signature");
  auto credentials = hash32_t{};
  if (vm.contains("withdrawal-credentials")) {
    auto parsed = try_make_hash32(require(vm, "withdrawal-credentials"));
    if (!parsed) {
      stakeline::common::critical(
          "--withdrawal-credentials must be 32 bytes of hex");
    }
    credentials = *parsed;
  } else {
    credentials = stakeline::crypto::make_withdrawal_credentials(
        require_address(vm, "withdrawal-address"));
  }

  auto gwei = stakeline::crypto::to_gwei(
      parse_amount(vm["stake-wei"].as<std::string>()));
  if (!gwei) {
    stakeline::common::critical("--stake-wei must be a whole number of gwei");
  }

  auto root = stakeline::crypto::deposit_data_root(pubkey, credentials,
                                                   signature, *gwei);
  if (!root) {
    auto code = stakeline::crypto::check_deposit_lengths(pubkey, signature);
    spdlog::error("{}: pubkey={} bytes signature={} bytes", to_string(code),
                  pubkey.size(), signature.size());
    return 1;
  }
  std::cout << to_hex(*root) << std::endl;
  return 0;
}

int run_withdrawal_credentials(const po::variables_map& vm) {
  auto credentials = stakeline::crypto::make_withdrawal_credentials(
      require_address(vm, "withdrawal-address"));
  std::cout << to_hex(credentials) << std::endl;
  return 0;
}

int run_inspect(const po::variables_map& vm) {
  auto status_filter = std::optional<deposit_status_t>{};
  if (vm.contains("status")) {
    status_filter = try_deposit_status_from_string(require(vm, "status"));
    if (!status_filter) {
      stakeline::common::critical("unknown deposit status '{}'",
                                  require(vm, "status"));
    }
  }

  auto encoder = stakeline::schema::encoding::scale_encoder_t{};
  auto storage = stakeline::storage::make_storage<
      stakeline::storage::rocksdb_storage_tag>(require(vm, "db"));
  if (!storage.load_committed_state()) {
    spdlog::error("database has no committed state");
    return 1;
  }

  auto config = stakeline::execution::engine_config{};
  config.stake_amount = parse_amount(vm["stake-wei"].as<std::string>());
  auto engine = stakeline::execution::engine{
      encoder, storage, config, stakeline::execution::collaborators_t{}};

  auto info = engine.info();
  std::cout << "height " << info.last_committed_height << " state_root "
            << to_hex(info.last_committed_state_root) << "\n";
  std::cout << "owner " << to_hex(engine.owner()) << "\n";

  auto totals = engine.custody();
  std::cout << "custody pending=" << to_string(totals.pending)
            << " committed=" << to_string(totals.committed)
            << " exited=" << to_string(totals.exited)
            << " held=" << to_string(totals.held) << "\n";

  for (const auto& record : engine.deposits()) {
    if (status_filter && record.status != *status_filter) {
      continue;
    }
    std::cout << "deposit " << record.id << " " << to_string(record.status)
              << " withdrawal=" << to_hex(record.withdrawal_address)
              << " pubkey=" << to_hex(record.pubkey) << "\n";
  }
  if (!status_filter) {
    for (const auto& request : engine.requests()) {
      std::cout << "request " << request.id << " " << to_string(request.kind)
                << " " << to_string(request.status)
                << " amount=" << to_string(request.amount)
                << " owner=" << to_hex(request.owner) << "\n";
    }
    for (const auto& validator : engine.validators()) {
      std::cout << "validator " << validator.id << " "
                << to_string(validator.status)
                << " owner=" << to_hex(validator.owner)
                << " pubkey=" << to_hex(validator.pubkey) << "\n";
    }
  }
  std::cout << std::flush;
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto command = std::string{};
  auto log_file = std::string{};
  auto options = po::options_description{"stakeline options"};
  options.add_options()("help,h", "show help")("verbose,v",
                                               "enable debug logging")(
      "log-file",
      po::value<std::string>(&log_file)->default_value("stakeline.log"),
      "log file path")(
      "command", po::value<std::string>(&command),
      "deposit-root|withdrawal-credentials|inspect")(
      "pubkey", po::value<std::string>(), "48-byte BLS pubkey hex")(
      "signature", po::value<std::string>(), "96-byte BLS signature hex")(
      "withdrawal-address", po::value<std::string>(),
      "20-byte execution address hex")(
      "withdrawal-credentials", po::value<std::string>(),
      "32-byte withdrawal credentials hex")(
      "stake-wei",
      po::value<std::string>()->default_value(to_string(kStakeAmount)),
      "stake unit in wei")("db", po::value<std::string>(),
                           "RocksDB directory")(
      "status", po::value<std::string>(), "only list deposits in this status");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "stakeline", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);

  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::warn);

  auto status = 0;
  if (vm.contains("help") || command.empty()) {
    print_help(options);
  } else if (command == "deposit-root") {
    status = run_deposit_root(vm);
  } else if (command == "withdrawal-credentials") {
    status = run_withdrawal_credentials(vm);
  } else if (command == "inspect") {
    status = run_inspect(vm);
  } else {
    spdlog::error("unknown command '{}'", command);
    print_help(options);
    status = 1;
  }

  spdlog::shutdown();
  return status;
}
