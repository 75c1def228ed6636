#pragma once

#include <leasegate/eligibility/attestation.hpp>
#include <leasegate/eligibility/eligibility_verifier.hpp>
#include <leasegate/eligibility/gate.hpp>
#include <leasegate/eligibility/proof_verifier.hpp>
#include <leasegate/escrow/escrow.hpp>
#include <leasegate/escrow/value_ledger.hpp>
#include <leasegate/execution/signature_verifier.hpp>
#include <leasegate/registry/eligibility_registry.hpp>
#include <leasegate/registry/nullifier_registry.hpp>
#include <leasegate/registry/policy_store.hpp>
#include <leasegate/schema/primitives.hpp>
#include <leasegate/schema/transaction.hpp>
#include <leasegate/schema/transaction_result.hpp>
#include <leasegate/state/journal.hpp>
#include <leasegate/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace leasegate::execution {

enum class proof_verifier_mode : uint8_t { stub = 0, backend = 1 };

std::optional<proof_verifier_mode> try_parse_proof_verifier_mode(
    std::string_view value);

/// Runtime configuration handed to the engine by the node.
struct engine_options final {
  leasegate::schema::hash32_t chain_id{};
  leasegate::schema::signer_id_t issuer{};
  /// May rotate the issuer. Defaults to the account of `issuer`.
  std::optional<leasegate::schema::account_id_t> gate_administrator;
  std::string attestation_domain_name{"leasegate.attestation"};
  /// Defaults to a chain derived id.
  std::optional<leasegate::schema::hash32_t> attestation_gate_id;
  proof_verifier_mode proof_mode{proof_verifier_mode::stub};
  leasegate::schema::bytes_t verification_key;
  bool reentrancy_guard{true};
  bool require_strict_crypto{true};
  std::vector<std::pair<leasegate::schema::account_id_t,
                        leasegate::schema::amount_t>>
      genesis_balances;
};

/// Deterministic rental state machine driven by an ordered transaction log.
///
/// The engine validates envelopes, dispatches payloads to the policy store,
/// the two eligibility gates and the escrow, and exposes a read-only query
/// surface. Each transaction runs under a journal checkpoint: a failing
/// payload leaves no state, nullifier or event behind.
class engine final {
 public:
  /// Construct over an open store. Genesis balances are applied only when
  /// the store has never committed a block.
  explicit engine(
      leasegate::storage::storage<leasegate::storage::rocksdb_storage_tag>&
          storage,
      engine_options options);

  /// Admit a transaction (mempool semantics).
  ///
  /// Performs decode and envelope checks only; never mutates state.
  leasegate::schema::transaction_result_t check_transaction(
      const leasegate::schema::bytes_view_t& raw_tx);

  /// Execute a candidate block at block time `time` (seconds).
  ///
  /// Transactions run in order; every one gets a result even when it fails.
  leasegate::schema::block_result_t finalize_block(
      uint64_t height,
      leasegate::schema::timestamp_seconds_t time,
      const std::vector<leasegate::schema::bytes_t>& txs);

  /// Persist the finalized block, its height and state root in one batch.
  leasegate::schema::commit_result_t commit();

  leasegate::schema::app_info_t info() const;

  /// Read-path query by route. `data` is the SCALE encoded route key.
  leasegate::schema::query_result_t query(
      std::string_view path,
      const leasegate::schema::bytes_view_t& data);

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  /// Install the proving-system entry point. Only meaningful in backend mode.
  void set_proof_backend(leasegate::eligibility::proof_backend_t backend);

  const leasegate::eligibility::attestation_domain& attestation_domain() const;

 private:
  leasegate::schema::transaction_result_t validate_transaction(
      const leasegate::schema::transaction_t& tx,
      std::string_view codespace);

  leasegate::schema::transaction_result_t execute_operation(
      const leasegate::schema::transaction_t& tx);

  uint64_t expected_nonce(const leasegate::schema::signer_id_t& signer);

  bool load_persisted_state();

  mutable std::mutex mutex_;
  leasegate::storage::storage<leasegate::storage::rocksdb_storage_tag>&
      storage_;
  engine_options options_;
  leasegate::state::journal journal_;
  leasegate::registry::policy_store policies_;
  leasegate::registry::nullifier_registry nullifiers_;
  leasegate::registry::eligibility_registry eligibility_;
  leasegate::escrow::state_ledger ledger_;
  leasegate::eligibility::backend_proof_verifier* backend_verifier_{};
  leasegate::eligibility::attestation_eligibility_verifier*
      attestation_verifier_{};
  leasegate::eligibility::gate proof_gate_;
  leasegate::eligibility::gate attestation_gate_;
  leasegate::escrow::escrow escrow_;
  int64_t last_committed_height_{};
  leasegate::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  leasegate::schema::hash32_t pending_state_root_{};
  leasegate::schema::timestamp_seconds_t current_block_time_{};
  bool signature_verifier_overridden_{false};
  signature_verifier_t signature_verifier_;
};

}  // namespace leasegate::execution
