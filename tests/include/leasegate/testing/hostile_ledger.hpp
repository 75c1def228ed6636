#pragma once

#include <leasegate/escrow/value_ledger.hpp>

#include <functional>

namespace leasegate::testing {

/// Ledger whose recipients run code on receipt. Every transfer out of
/// custody invokes `on_receive` before settling, the way a contract recipient
/// would call back into the escrow.
class reentrant_ledger final : public leasegate::escrow::value_ledger {
 public:
  using callback_t = std::function<void()>;

  explicit reentrant_ledger(leasegate::escrow::state_ledger& inner)
      : inner_{inner} {}

  void on_receive(callback_t callback) { callback_ = std::move(callback); }

  leasegate::schema::amount_t balance_of(
      const leasegate::schema::account_id_t& account) override {
    return inner_.balance_of(account);
  }

  bool transfer(const leasegate::schema::account_id_t& from,
                const leasegate::schema::account_id_t& to,
                const leasegate::schema::amount_t& amount) override {
    if (from == leasegate::escrow::custody_account() && callback_ &&
        !in_callback_) {
      in_callback_ = true;
      callback_();
      in_callback_ = false;
    }
    return inner_.transfer(from, to, amount);
  }

 private:
  leasegate::escrow::state_ledger& inner_;
  callback_t callback_;
  bool in_callback_{false};
};

/// Ledger that refuses every transfer.
class failing_ledger final : public leasegate::escrow::value_ledger {
 public:
  explicit failing_ledger(leasegate::escrow::state_ledger& inner)
      : inner_{inner} {}

  leasegate::schema::amount_t balance_of(
      const leasegate::schema::account_id_t& account) override {
    return inner_.balance_of(account);
  }

  bool transfer(const leasegate::schema::account_id_t&,
                const leasegate::schema::account_id_t&,
                const leasegate::schema::amount_t&) override {
    return false;
  }

 private:
  leasegate::escrow::state_ledger& inner_;
};

}  // namespace leasegate::testing
