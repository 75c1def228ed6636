#pragma once

#include <leasegate/execution/operation_result.hpp>
#include <leasegate/registry/eligibility_registry.hpp>
#include <leasegate/registry/nullifier_registry.hpp>
#include <leasegate/registry/policy_store.hpp>
#include <leasegate/schema/policy.hpp>
#include <leasegate/state/journal.hpp>
#include <leasegate/storage/rocksdb/storage.hpp>
#include <leasegate/testing/common.hpp>

#include <string_view>

namespace leasegate::testing {

inline constexpr leasegate::schema::timestamp_seconds_t kGenesisTime =
    1'700'000'000;
inline constexpr leasegate::schema::timestamp_seconds_t kDeadline =
    kGenesisTime + 86'400;

/// Terms every registry and gate test starts from.
inline leasegate::schema::policy_terms_t make_terms(
    const leasegate::schema::timestamp_seconds_t deadline = kDeadline) {
  return leasegate::schema::policy_terms_t{
      .min_age = 18,
      .income_multiplier = 3,
      .rent_amount = leasegate::schema::amount_t{1'000'000'000'000'000'000ULL},
      .require_clean_record = true,
      .deadline = deadline};
}

inline leasegate::execution::call_context make_context(
    const leasegate::schema::account_id_t& caller,
    const leasegate::schema::timestamp_seconds_t now = kGenesisTime) {
  return leasegate::execution::call_context{.caller = caller, .now = now};
}

/// RocksDB backed journal with the registries the gates and escrow share.
class state_fixture {
 public:
  explicit state_fixture(const std::string_view db_prefix)
      : db_path_{db_prefix},
        storage_{leasegate::storage::make_storage<
            leasegate::storage::rocksdb_storage_tag>(db_path_.path())},
        journal_{storage_},
        policies_{journal_},
        nullifiers_{journal_},
        eligibility_{journal_} {}

  state_fixture(const state_fixture&) = delete;
  state_fixture& operator=(const state_fixture&) = delete;

  leasegate::storage::rocksdb_storage_t& storage() { return storage_; }
  leasegate::state::journal& journal() { return journal_; }
  leasegate::registry::policy_store& policies() { return policies_; }
  leasegate::registry::nullifier_registry& nullifiers() { return nullifiers_; }
  leasegate::registry::eligibility_registry& eligibility() {
    return eligibility_;
  }

  /// Create a policy owned by `owner` and return its id.
  leasegate::schema::policy_id_t create_policy(
      const leasegate::schema::account_id_t& owner,
      const leasegate::schema::policy_terms_t& terms = make_terms()) {
    auto created = policies_.create_policy(make_context(owner), terms);
    if (!created.ok()) {
      return 0;
    }
    return *created.value;
  }

 private:
  scoped_db_path db_path_;
  leasegate::storage::rocksdb_storage_t storage_;
  leasegate::state::journal journal_;
  leasegate::registry::policy_store policies_;
  leasegate::registry::nullifier_registry nullifiers_;
  leasegate::registry::eligibility_registry eligibility_;
};

}  // namespace leasegate::testing
