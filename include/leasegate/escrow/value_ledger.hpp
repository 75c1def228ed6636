#pragma once

#include <leasegate/schema/primitives.hpp>
#include <leasegate/state/journal.hpp>

namespace leasegate::escrow {

/// Native value movements the escrow relies on. A transfer either moves the
/// whole amount or nothing.
class value_ledger {
 public:
  virtual ~value_ledger() = default;

  virtual leasegate::schema::amount_t balance_of(
      const leasegate::schema::account_id_t& account) = 0;

  virtual bool transfer(const leasegate::schema::account_id_t& from,
                        const leasegate::schema::account_id_t& to,
                        const leasegate::schema::amount_t& amount) = 0;
};

/// Engine owned account holding escrowed rent.
leasegate::schema::account_id_t custody_account();

/// Balances kept in the state journal.
class state_ledger final : public value_ledger {
 public:
  explicit state_ledger(leasegate::state::journal& journal);

  leasegate::schema::amount_t balance_of(
      const leasegate::schema::account_id_t& account) override;

  bool transfer(const leasegate::schema::account_id_t& from,
                const leasegate::schema::account_id_t& to,
                const leasegate::schema::amount_t& amount) override;

  /// Mint into `account`. Genesis allocation only.
  void credit(const leasegate::schema::account_id_t& account,
              const leasegate::schema::amount_t& amount);

 private:
  void set_balance(const leasegate::schema::account_id_t& account,
                   const leasegate::schema::amount_t& amount);

  leasegate::state::journal& journal_;
};

}  // namespace leasegate::escrow
