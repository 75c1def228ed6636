#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <iterator>
#include <leasegate/blake3/hash.hpp>
#include <leasegate/crypto/verify.hpp>
#include <leasegate/execution/engine.hpp>
#include <leasegate/schema/encoding/scale/encoder.hpp>
#include <leasegate/schema/key/engine_keys.hpp>
#include <tuple>
#include <utility>

using namespace leasegate::schema;

namespace {

using encoder_t = leasegate::schema::encoding::scale_encoder_t;

constexpr auto kCheckTxCodespace = std::string_view{"leasegate.checktx"};
constexpr auto kFinalizeCodespace = std::string_view{"leasegate.finalize"};
constexpr auto kQueryCodespace = std::string_view{"leasegate.query"};

leasegate::schema::hash32_t fold_state_root(
    const leasegate::schema::hash32_t& seed,
    const leasegate::schema::bytes_t& tx,
    uint64_t height,
    uint64_t index) {
  auto material = leasegate::schema::bytes_t{};
  material.reserve(seed.size() + tx.size() + 32);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return leasegate::blake3::hash(
      leasegate::schema::bytes_view_t{material.data(), material.size()});
}

std::optional<leasegate::schema::transaction_t> decode_transaction(
    const leasegate::schema::bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<leasegate::schema::transaction_t>(raw_tx);
  if (!tx) {
    error = "malformed SCALE transaction";
  }
  return tx;
}

transaction_result_t make_error_result(const error_code code,
                                       std::string log,
                                       std::string info,
                                       const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

template <typename T>
transaction_result_t to_transaction_result(
    const leasegate::execution::operation_result<T>& outcome,
    std::string accepted) {
  if (!outcome.ok()) {
    return make_error_result(outcome.code, std::string{to_string(outcome.code)},
                             outcome.message, kFinalizeCodespace);
  }
  auto result = transaction_result_t{};
  result.info = std::move(accepted);
  return result;
}

query_result_t make_query_error(const error_code code,
                                std::string log,
                                const bytes_view_t& key,
                                const int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.key = make_bytes(key);
  result.height = height;
  result.codespace = std::string{kQueryCodespace};
  return result;
}

std::unique_ptr<leasegate::eligibility::eligibility_verifier>
make_proof_gate_verifier(
    const leasegate::execution::engine_options& options,
    leasegate::eligibility::backend_proof_verifier*& backend) {
  if (options.proof_mode == leasegate::execution::proof_verifier_mode::backend) {
    auto verifier = std::make_unique<leasegate::eligibility::backend_proof_verifier>(
        options.verification_key);
    backend = verifier.get();
    return std::make_unique<leasegate::eligibility::proof_eligibility_verifier>(
        std::move(verifier));
  }
  return std::make_unique<leasegate::eligibility::proof_eligibility_verifier>(
      std::make_unique<leasegate::eligibility::unsafe_stub_proof_verifier>());
}

std::unique_ptr<leasegate::eligibility::eligibility_verifier>
make_attestation_gate_verifier(
    leasegate::state::journal& journal,
    const leasegate::execution::engine_options& options,
    leasegate::eligibility::attestation_eligibility_verifier*& attestation) {
  auto domain = leasegate::eligibility::attestation_domain{
      .name = options.attestation_domain_name,
      .version = "1",
      .chain_id = options.chain_id,
      .verifying_gate = options.attestation_gate_id.value_or(
          leasegate::eligibility::default_gate_id(options.chain_id))};
  auto administrator = options.gate_administrator.value_or(
      leasegate::crypto::account_of(options.issuer));
  auto verifier =
      std::make_unique<leasegate::eligibility::attestation_eligibility_verifier>(
          journal, options.issuer, std::move(domain), administrator);
  attestation = verifier.get();
  return verifier;
}

}  // namespace

namespace leasegate::execution {

std::optional<proof_verifier_mode> try_parse_proof_verifier_mode(
    const std::string_view value) {
  if (value == "stub") {
    return proof_verifier_mode::stub;
  }
  if (value == "backend") {
    return proof_verifier_mode::backend;
  }
  return std::nullopt;
}

engine::engine(
    leasegate::storage::storage<leasegate::storage::rocksdb_storage_tag>&
        storage,
    engine_options options)
    : storage_{storage},
      options_{std::move(options)},
      journal_{storage_},
      policies_{journal_},
      nullifiers_{journal_},
      eligibility_{journal_},
      ledger_{journal_},
      proof_gate_{journal_, policies_, nullifiers_, eligibility_,
                  make_proof_gate_verifier(options_, backend_verifier_)},
      attestation_gate_{
          journal_, policies_, nullifiers_, eligibility_,
          make_attestation_gate_verifier(journal_, options_,
                                         attestation_verifier_)},
      escrow_{journal_, policies_, eligibility_, ledger_,
              options_.reentrancy_guard},
      signature_verifier_{leasegate::crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  // Any committed checkpoint, height 0 included, already holds genesis.
  if (!load_persisted_state()) {
    for (const auto& [account, amount] : options_.genesis_balances) {
      ledger_.credit(account, amount);
      spdlog::info("Genesis allocation of {} to {}", amount.str(),
                   to_hex(account));
    }
  }
  if (!options_.require_strict_crypto) {
    spdlog::warn("Strict crypto disabled; transaction signatures are not "
                 "verified");
  } else if (!leasegate::crypto::available()) {
    spdlog::warn("OpenSSL lacks ed25519 or secp256k1 support; signed "
                 "transactions will be rejected");
  }
  if (!options_.reentrancy_guard) {
    spdlog::info("Escrow reentrancy guard disabled; relying on effects "
                 "before transfers");
  }
  spdlog::info("Execution engine ready at height {} (chain {})",
               last_committed_height_, to_hex(options_.chain_id));
}

transaction_result_t engine::check_transaction(
    const leasegate::schema::bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error_result(error_code::invalid_transaction,
                             "invalid transaction", decode_error,
                             kCheckTxCodespace);
  }
  return validate_transaction(*maybe_tx, kCheckTxCodespace);
}

block_result_t engine::finalize_block(
    const uint64_t height,
    const leasegate::schema::timestamp_seconds_t time,
    const std::vector<leasegate::schema::bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  if (height == 0 ||
      static_cast<int64_t>(height) <= last_committed_height_) {
    spdlog::warn("Refusing block at height {}; last committed height is {}",
                 height, last_committed_height_);
    result.code = static_cast<uint32_t>(error_code::invalid_block_height);
    result.log = fmt::format("block height {} must exceed committed height {}",
                             height, last_committed_height_);
    result.state_root = last_committed_state_root_;
    return result;
  }
  result.tx_results.reserve(txs.size());
  current_block_time_ = time;

  auto rolling_root = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(make_bytes_view(txs[i]), decode_error);
    if (!maybe_tx) {
      result.tx_results.push_back(
          make_error_result(error_code::invalid_transaction,
                            "invalid transaction", decode_error,
                            kFinalizeCodespace));
      continue;
    }

    auto validation = validate_transaction(*maybe_tx, kFinalizeCodespace);
    if (validation.code != 0) {
      result.tx_results.push_back(std::move(validation));
      continue;
    }

    // The nonce is spent even when the payload fails.
    journal_.put(key::make_nonce_key(journal_.encoder(), maybe_tx->signer),
                 maybe_tx->nonce);

    auto checkpoint = journal_.mark();
    auto tx_result = execute_operation(*maybe_tx);
    if (tx_result.code != 0) {
      journal_.revert_to(checkpoint);
      spdlog::debug("Transaction {} in block {} failed: {} ({})", i, height,
                    tx_result.log, tx_result.info);
    } else {
      tx_result.events = journal_.events_since(checkpoint);
      rolling_root = fold_state_root(rolling_root, txs[i], height, i);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_ = 0;
  }

  journal_.persist(leasegate::storage::committed_state{
      .height = last_committed_height_,
      .state_root = last_committed_state_root_});
  spdlog::info("Committed height {} with state root {}",
               last_committed_height_, to_hex(last_committed_state_root_));

  auto result = commit_result_t{};
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  result.chain_id = options_.chain_id;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const leasegate::schema::bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto encoder = encoder_t{};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};

  auto invalid_key = [&]() {
    return make_query_error(error_code::invalid_query,
                            fmt::format("invalid key for {}", path), data,
                            last_committed_height_);
  };

  if (path == "/engine/info") {
    auto app = app_info_t{};
    app.last_block_height = last_committed_height_;
    app.last_block_state_root = last_committed_state_root_;
    app.chain_id = options_.chain_id;
    result.value = encoder.encode(app);
    return result;
  }
  if (path == "/policy") {
    auto policy_id = encoder.try_decode<policy_id_t>(data);
    if (!policy_id) {
      return invalid_key();
    }
    auto policy = policies_.get_policy(*policy_id);
    if (!policy.ok()) {
      return make_query_error(policy.code, policy.message, data,
                              last_committed_height_);
    }
    result.value = encoder.encode(*policy.value);
    return result;
  }
  if (path == "/policy/next_id") {
    result.value = encoder.encode(policies_.next_policy_id());
    return result;
  }
  if (path == "/eligibility") {
    auto decoded =
        encoder.try_decode<std::tuple<account_id_t, policy_id_t>>(data);
    if (!decoded) {
      return invalid_key();
    }
    result.value = encoder.encode(eligibility_.is_eligible(
        std::get<0>(*decoded), std::get<1>(*decoded)));
    return result;
  }
  if (path == "/nullifier") {
    auto nullifier = encoder.try_decode<nullifier_t>(data);
    if (!nullifier) {
      return invalid_key();
    }
    result.value = encoder.encode(nullifiers_.is_used(*nullifier));
    return result;
  }
  if (path == "/lease") {
    auto decoded =
        encoder.try_decode<std::tuple<policy_id_t, account_id_t>>(data);
    if (!decoded) {
      return invalid_key();
    }
    auto lease = escrow_.get_lease(std::get<0>(*decoded), std::get<1>(*decoded));
    if (!lease) {
      return make_query_error(error_code::lease_not_found, "lease not found",
                              data, last_committed_height_);
    }
    result.value = encoder.encode(*lease);
    return result;
  }
  if (path == "/balance") {
    auto account = encoder.try_decode<account_id_t>(data);
    if (!account) {
      return invalid_key();
    }
    result.value = encoder.encode(to_be_bytes(ledger_.balance_of(*account)));
    return result;
  }
  if (path == "/escrow/balance") {
    result.value = encoder.encode(to_be_bytes(escrow_.escrow_balance()));
    return result;
  }
  if (path == "/issuer") {
    result.value = encoder.encode(attestation_verifier_->issuer());
    return result;
  }
  if (path == "/nonce") {
    auto signer = encoder.try_decode<signer_id_t>(data);
    if (!signer) {
      return invalid_key();
    }
    result.value = encoder.encode(expected_nonce(*signer));
    return result;
  }

  return make_query_error(error_code::unknown_query_path,
                          fmt::format("unsupported path '{}'", path), data,
                          last_committed_height_);
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
  signature_verifier_overridden_ = true;
}

void engine::set_proof_backend(
    leasegate::eligibility::proof_backend_t backend) {
  auto lock = std::scoped_lock{mutex_};
  if (backend_verifier_ == nullptr) {
    spdlog::warn("Proof backend ignored: engine runs the stub verifier");
    return;
  }
  backend_verifier_->set_backend(std::move(backend));
}

const leasegate::eligibility::attestation_domain& engine::attestation_domain()
    const {
  return attestation_verifier_->domain();
}

transaction_result_t engine::validate_transaction(
    const leasegate::schema::transaction_t& tx,
    const std::string_view codespace) {
  if (tx.version != 1) {
    return make_error_result(error_code::unsupported_transaction_version,
                             "unsupported transaction version",
                             "expected version 1", codespace);
  }
  if (tx.chain_id != options_.chain_id) {
    return make_error_result(error_code::invalid_chain_id, "invalid chain id",
                             to_hex(tx.chain_id), codespace);
  }
  if (tx.value != 0 && !std::holds_alternative<start_lease_t>(tx.payload)) {
    return make_error_result(error_code::unexpected_value,
                             "value attached to a non-payable payload",
                             tx.value.str(), codespace);
  }
  auto expected = expected_nonce(tx.signer);
  if (tx.nonce != expected) {
    return make_error_result(
        error_code::invalid_nonce, "invalid nonce",
        fmt::format("expected {}, got {}", expected, tx.nonce), codespace);
  }
  if (options_.require_strict_crypto) {
    if (!signature_verifier_) {
      return make_error_result(error_code::signature_verification_failed,
                               "signature verification failed",
                               "no signature verifier installed", codespace);
    }
    auto payload = make_signing_payload(tx);
    if (!signature_verifier_(make_bytes_view(payload), tx.signer,
                             tx.signature)) {
      return make_error_result(error_code::signature_verification_failed,
                               "signature verification failed",
                               to_string(tx.signer), codespace);
    }
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute_operation(
    const leasegate::schema::transaction_t& tx) {
  const auto ctx = call_context{.caller = leasegate::crypto::account_of(tx.signer),
                                .now = current_block_time_};
  return std::visit(
      overloaded{
          [&](const create_policy_t& operation) {
            auto outcome = policies_.create_policy(ctx, operation.terms);
            auto result = to_transaction_result(
                outcome, outcome.ok()
                             ? fmt::format("policy {} created", *outcome.value)
                             : std::string{});
            if (outcome.ok()) {
              result.data = encoder_t{}.encode(*outcome.value);
            }
            return result;
          },
          [&](const submit_proof_t& operation) {
            return to_transaction_result(
                proof_gate_.submit_proof(ctx, operation.policy_id,
                                         operation.claim),
                "proof accepted");
          },
          [&](const submit_attestation_t& operation) {
            return to_transaction_result(
                attestation_gate_.submit_attestation(ctx,
                                                     operation.attestation),
                "attestation accepted");
          },
          [&](const start_lease_t& operation) {
            return to_transaction_result(
                escrow_.start_lease(ctx, operation.policy_id, tx.value),
                "lease started");
          },
          [&](const owner_confirm_t& operation) {
            return to_transaction_result(
                escrow_.owner_confirm(ctx, operation.policy_id,
                                      operation.tenant),
                "lease released");
          },
          [&](const timeout_refund_t& operation) {
            return to_transaction_result(
                escrow_.timeout_refund(ctx, operation.policy_id),
                "lease refunded");
          },
          [&](const set_issuer_t& operation) {
            return to_transaction_result(
                attestation_verifier_->set_issuer(ctx, operation.issuer),
                "issuer updated");
          }},
      tx.payload);
}

uint64_t engine::expected_nonce(const leasegate::schema::signer_id_t& signer) {
  auto last = journal_.get<uint64_t>(
      key::make_nonce_key(journal_.encoder(), signer));
  return last.value_or(0) + 1;
}

bool engine::load_persisted_state() {
  auto committed = storage_.load_committed_state();
  if (!committed) {
    spdlog::info("No committed state found; starting from genesis");
    return false;
  }
  last_committed_height_ = committed->height;
  last_committed_state_root_ = committed->state_root;
  spdlog::info("Loaded committed state at height {}", last_committed_height_);
  return true;
}

}  // namespace leasegate::execution
