#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <cadence/execution/engine.hpp>
#include <cadence/schema/error_code.hpp>
#include <cadence/storage/rocksdb/storage.hpp>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

std::optional<cadence::schema::account_id_t> parse_account(
    const std::string& option,
    const std::string& value) {
  auto account = cadence::schema::try_make_hash32(std::string_view{value});
  if (!account) {
    spdlog::error("--{} expects 64 hex characters, got '{}'", option, value);
  }
  return account;
}

std::optional<std::vector<cadence::schema::bytes_t>> read_calls(
    const std::string& path) {
  auto input = std::ifstream{path};
  if (!input) {
    spdlog::error("Cannot open call file '{}'", path);
    return std::nullopt;
  }
  auto calls = std::vector<cadence::schema::bytes_t>{};
  auto line = std::string{};
  auto line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    if (line.empty() || line.front() == '#') {
      continue;
    }
    auto decoded = cadence::schema::try_from_hex(line);
    if (!decoded) {
      spdlog::error("{}:{} is not valid hex", path, line_number);
      return std::nullopt;
    }
    calls.push_back(std::move(*decoded));
  }
  return calls;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::info);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("cadence.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "cadence", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);

  auto db_path = std::string{};
  auto config_path = std::string{};
  auto vault_hex = std::string{};
  auto registry_hex = std::string{};
  auto tracker_hex = std::string{};
  auto owner_hexes = std::vector<std::string>{};
  auto required = uint32_t{1};
  auto call_fee_budget = cadence::gateway::kDefaultCallFeeBudget;
  auto notification_fee_budget =
      cadence::execution::kDefaultNotificationFeeBudget;
  auto max_call_depth = cadence::gateway::kDefaultMaxCallDepth;
  auto calls_path = std::string{};
  auto timestamp = uint64_t{};

  auto vm = boost::program_options::variables_map{};
  auto generic = boost::program_options::options_description{"Generic"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", boost::program_options::value<std::string>(&config_path),
      "INI-style configuration file")("verbose,v", "Enable verbose output");

  auto vault = boost::program_options::options_description{"Vault"};
  vault.add_options()(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "cadence.db"),
      "RocksDB directory holding the vault tables")(
      "vault-id", boost::program_options::value<std::string>(&vault_hex),
      "Vault account id (hex)")(
      "registry-id", boost::program_options::value<std::string>(&registry_hex),
      "Operator registry account id (hex). This binary binds no registry or "
      "token collaborators, so only owners can execute subscriptions and the "
      "token-backed variants fail to settle")(
      "payment-tracker-id",
      boost::program_options::value<std::string>(&tracker_hex),
      "Payment tracker account id (hex)")(
      "owner", boost::program_options::value(&owner_hexes)->composing(),
      "Initial owner (hex); repeat for each owner of a fresh vault")(
      "required", boost::program_options::value<uint32_t>(&required),
      "Initial confirmation threshold of a fresh vault")(
      "call-fee-budget",
      boost::program_options::value<uint64_t>(&call_fee_budget),
      "Fee budget for outbound calls")(
      "notification-fee-budget",
      boost::program_options::value<uint64_t>(&notification_fee_budget),
      "Fee budget for registry notifications")(
      "max-call-depth",
      boost::program_options::value<uint32_t>(&max_call_depth),
      "Maximum nesting of external calls");

  auto block = boost::program_options::options_description{"Block"};
  block.add_options()(
      "calls", boost::program_options::value<std::string>(&calls_path),
      "File with one hex-encoded call envelope per line")(
      "timestamp,t", boost::program_options::value<uint64_t>(&timestamp),
      "Block timestamp in milliseconds");

  auto description = boost::program_options::options_description{"Cadence"};
  description.add(generic).add(vault).add(block);
  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    if (vm.contains("config")) {
      auto config = std::ifstream{vm["config"].as<std::string>()};
      if (!config) {
        spdlog::error("Cannot open config file '{}'",
                      vm["config"].as<std::string>());
        spdlog::shutdown();
        return 1;
      }
      boost::program_options::store(
          boost::program_options::parse_config_file(config, description), vm);
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    spdlog::error("{}", ex.what());
    spdlog::shutdown();
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    spdlog::shutdown();
    return 0;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto options = cadence::execution::engine_options_t{};
  auto vault_id = parse_account("vault-id", vault_hex);
  if (!vault_id) {
    spdlog::shutdown();
    return 1;
  }
  options.vault_id = *vault_id;
  if (!registry_hex.empty()) {
    auto registry_id = parse_account("registry-id", registry_hex);
    if (!registry_id) {
      spdlog::shutdown();
      return 1;
    }
    options.registry_id = *registry_id;
  }
  if (!tracker_hex.empty()) {
    auto tracker_id = parse_account("payment-tracker-id", tracker_hex);
    if (!tracker_id) {
      spdlog::shutdown();
      return 1;
    }
    options.payment_tracker_id = *tracker_id;
  }
  for (const auto& owner_hex : owner_hexes) {
    auto owner = parse_account("owner", owner_hex);
    if (!owner) {
      spdlog::shutdown();
      return 1;
    }
    options.initial_owners.push_back(*owner);
  }
  options.initial_required = required;
  options.call_fee_budget = call_fee_budget;
  options.notification_fee_budget = notification_fee_budget;

  auto calls = std::vector<cadence::schema::bytes_t>{};
  if (!calls_path.empty()) {
    auto loaded = read_calls(calls_path);
    if (!loaded) {
      spdlog::shutdown();
      return 1;
    }
    calls = std::move(*loaded);
  }

  auto encoder = cadence::schema::scale_encoder_t{};
  auto storage =
      cadence::storage::make_storage<cadence::storage::rocksdb_storage_tag>(
          db_path);
  auto gateway = cadence::gateway::external_call_gateway{max_call_depth};
  auto directory = cadence::execution::collaborator_directory{};
  auto engine = cadence::execution::engine{encoder, storage, gateway,
                                           directory, std::move(options)};

  auto exit_code = 0;
  if (!calls.empty()) {
    auto result = engine.apply_block(timestamp, calls);
    for (auto i = std::size_t{0}; i < result.call_results.size(); ++i) {
      const auto& call_result = result.call_results[i];
      std::cout << i << ' ' << call_result.code << ' '
                << call_result.codespace << ' ' << call_result.log;
      if (call_result.record_id) {
        std::cout << " id=" << *call_result.record_id;
      }
      if (!call_result.info.empty()) {
        std::cout << " (" << call_result.info << ')';
      }
      std::cout << '\n';
      if (cadence::schema::category_of(call_result.code) !=
              cadence::schema::error_category_t::none &&
          cadence::schema::category_of(call_result.code) !=
              cadence::schema::error_category_t::external_call) {
        exit_code = 2;
      }
    }
  }

  auto info = engine.info();
  spdlog::info("{} {} vault {}: {} event(s), state root {}", info.data,
               info.app_version, cadence::schema::to_hex(info.vault_id),
               info.event_count, cadence::schema::to_hex(info.state_root));

  spdlog::shutdown();
  return exit_code;
}
