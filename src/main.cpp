#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <leasegate/execution/engine.hpp>
#include <leasegate/schema/error_code.hpp>
#include <leasegate/storage/rocksdb/storage.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

struct block_line final {
  uint64_t height{};
  leasegate::schema::timestamp_seconds_t time{};
  std::vector<leasegate::schema::bytes_t> txs;
};

std::optional<block_line> parse_block_line(const std::string& line) {
  auto stream = std::istringstream{line};
  auto block = block_line{};
  if (!(stream >> block.height >> block.time)) {
    return std::nullopt;
  }
  auto hex = std::string{};
  while (stream >> hex) {
    auto raw = leasegate::schema::try_from_hex(hex);
    if (!raw) {
      return std::nullopt;
    }
    block.txs.push_back(std::move(*raw));
  }
  return block;
}

// "<account-hex>:<decimal amount>"
std::optional<std::pair<leasegate::schema::account_id_t,
                        leasegate::schema::amount_t>>
parse_genesis_balance(const std::string& entry) {
  auto separator = entry.find(':');
  if (separator == std::string::npos) {
    return std::nullopt;
  }
  auto account = leasegate::schema::try_make_hash32(
      std::string_view{entry}.substr(0, separator));
  auto amount = leasegate::schema::try_parse_amount(
      std::string_view{entry}.substr(separator + 1));
  if (!account || !amount) {
    return std::nullopt;
  }
  return std::pair{*account, *amount};
}

std::optional<leasegate::schema::bytes_t> read_file(const std::string& path) {
  auto input = std::ifstream{path, std::ios::binary};
  if (!input) {
    return std::nullopt;
  }
  return leasegate::schema::bytes_t{std::istreambuf_iterator<char>{input},
                                    std::istreambuf_iterator<char>{}};
}

void install_logger(const std::string& log_file, const bool verbose) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "leasegate", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

}  // namespace

int main(int argc, char* argv[]) {
  auto config_path = std::string{};
  auto db_path = std::string{};
  auto chain_id_hex = std::string{};
  auto blocks_path = std::string{};
  auto issuer_text = std::string{};
  auto administrator_hex = std::string{};
  auto domain_name = std::string{};
  auto proof_mode_text = std::string{};
  auto verification_key_path = std::string{};
  auto log_file = std::string{};
  auto reentrancy_guard = true;
  auto strict_crypto = true;
  auto genesis = std::vector<std::string>{};

  auto description = po::options_description{"leasegate node"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI config file; command line values take precedence")(
      "db-path", po::value<std::string>(&db_path)->default_value("leasegate.db"),
      "RocksDB directory")("chain-id",
                           po::value<std::string>(&chain_id_hex)
                               ->default_value(std::string(64, '0')),
                           "32-byte chain id hex")(
      "blocks", po::value<std::string>(&blocks_path),
      "block file: one '<height> <time> <hex-tx>...' per line")(
      "issuer", po::value<std::string>(&issuer_text),
      "trusted attestation issuer, ed25519:<hex> or secp256k1:<hex>")(
      "gate-administrator", po::value<std::string>(&administrator_hex),
      "account allowed to rotate the issuer (defaults to the issuer)")(
      "domain-name",
      po::value<std::string>(&domain_name)
          ->default_value("leasegate.attestation"),
      "attestation signing domain name")(
      "proof-verifier",
      po::value<std::string>(&proof_mode_text)->default_value("stub"),
      "stub|backend")("verification-key",
                      po::value<std::string>(&verification_key_path),
                      "verification key file for the backend verifier")(
      "reentrancy-guard",
      po::value<bool>(&reentrancy_guard)->default_value(true),
      "refuse nested escrow entry")(
      "strict-crypto", po::value<bool>(&strict_crypto)->default_value(true),
      "verify transaction signatures")(
      "genesis-balance",
      po::value<std::vector<std::string>>(&genesis)->composing(),
      "<account-hex>:<amount>, repeatable")(
      "log-file", po::value<std::string>(&log_file)->default_value("leasegate.log"),
      "log file path")("verbose,v", "Enable debug logging");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto config = std::ifstream{vm["config"].as<std::string>()};
      if (!config) {
        std::cerr << "cannot open config file " << vm["config"].as<std::string>()
                  << '\n';
        return 1;
      }
      po::store(po::parse_config_file(config, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n' << description << '\n';
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  install_logger(log_file, vm.contains("verbose"));

  auto options = leasegate::execution::engine_options{};
  auto chain_id = leasegate::schema::try_make_hash32(chain_id_hex);
  if (!chain_id) {
    spdlog::error("--chain-id must be 32 bytes of hex");
    spdlog::shutdown();
    return 1;
  }
  options.chain_id = *chain_id;

  auto issuer = leasegate::schema::try_parse_signer(issuer_text);
  if (!issuer) {
    spdlog::error("--issuer must be ed25519:<hex> or secp256k1:<hex>");
    spdlog::shutdown();
    return 1;
  }
  options.issuer = *issuer;

  if (!administrator_hex.empty()) {
    auto administrator = leasegate::schema::try_make_hash32(administrator_hex);
    if (!administrator) {
      spdlog::error("--gate-administrator must be 32 bytes of hex");
      spdlog::shutdown();
      return 1;
    }
    options.gate_administrator = *administrator;
  }
  options.attestation_domain_name = domain_name;

  auto proof_mode =
      leasegate::execution::try_parse_proof_verifier_mode(proof_mode_text);
  if (!proof_mode) {
    spdlog::error("--proof-verifier must be stub or backend");
    spdlog::shutdown();
    return 1;
  }
  options.proof_mode = *proof_mode;
  if (!verification_key_path.empty()) {
    auto key = read_file(verification_key_path);
    if (!key) {
      spdlog::error("cannot read verification key {}", verification_key_path);
      spdlog::shutdown();
      return 1;
    }
    options.verification_key = std::move(*key);
  }
  options.reentrancy_guard = reentrancy_guard;
  options.require_strict_crypto = strict_crypto;

  for (const auto& entry : genesis) {
    auto balance = parse_genesis_balance(entry);
    if (!balance) {
      spdlog::error("invalid genesis balance '{}'", entry);
      spdlog::shutdown();
      return 1;
    }
    options.genesis_balances.push_back(std::move(*balance));
  }

  auto storage =
      leasegate::storage::make_storage<leasegate::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = leasegate::execution::engine{storage, std::move(options)};

  if (blocks_path.empty()) {
    auto info = engine.info();
    spdlog::info("No block file given; state at height {} root {}",
                 info.last_block_height,
                 leasegate::schema::to_hex(info.last_block_state_root));
    spdlog::shutdown();
    return 0;
  }

  auto blocks = std::ifstream{blocks_path};
  if (!blocks) {
    spdlog::error("cannot open block file {}", blocks_path);
    spdlog::shutdown();
    return 1;
  }

  auto line = std::string{};
  auto line_number = size_t{0};
  while (std::getline(blocks, line)) {
    ++line_number;
    if (line.empty() || line.front() == '#') {
      continue;
    }
    auto block = parse_block_line(line);
    if (!block) {
      spdlog::error("{}:{}: malformed block line", blocks_path, line_number);
      spdlog::shutdown();
      return 1;
    }

    auto result = engine.finalize_block(block->height, block->time, block->txs);
    if (result.code != 0) {
      spdlog::error("{}:{}: {}", blocks_path, line_number, result.log);
      spdlog::shutdown();
      return 1;
    }
    for (size_t i = 0; i < result.tx_results.size(); ++i) {
      const auto& tx_result = result.tx_results[i];
      if (tx_result.code == 0) {
        spdlog::info("block {} tx {}: ok {}", block->height, i, tx_result.info);
        for (const auto& event : tx_result.events) {
          spdlog::info("  event {} ({} attributes)", event.type,
                       event.attributes.size());
        }
      } else {
        spdlog::warn(
            "block {} tx {}: {} [{}] {}", block->height, i,
            leasegate::schema::to_string(
                static_cast<leasegate::schema::error_code>(tx_result.code)),
            tx_result.codespace, tx_result.info);
      }
    }
    auto committed = engine.commit();
    spdlog::info("block {} committed, state root {}",
                 committed.committed_height,
                 leasegate::schema::to_hex(committed.state_root));
  }

  spdlog::shutdown();
  return 0;
}
