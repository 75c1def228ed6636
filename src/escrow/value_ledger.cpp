#include <leasegate/blake3/hash.hpp>
#include <leasegate/common/critical.hpp>
#include <leasegate/escrow/value_ledger.hpp>
#include <leasegate/schema/key/engine_keys.hpp>

#include <limits>

#include <spdlog/spdlog.h>

namespace leasegate::escrow {

leasegate::schema::account_id_t custody_account() {
  static const auto account = leasegate::blake3::derive(
      "leasegate.custody.v1",
      leasegate::schema::make_bytes_view(std::string_view{"escrow"}));
  return account;
}

state_ledger::state_ledger(leasegate::state::journal& journal)
    : journal_{journal} {}

leasegate::schema::amount_t state_ledger::balance_of(
    const leasegate::schema::account_id_t& account) {
  auto stored = journal_.get<leasegate::schema::hash32_t>(
      leasegate::schema::key::make_balance_key(journal_.encoder(), account));
  if (!stored) {
    return 0;
  }
  return leasegate::schema::from_be_bytes(*stored);
}

bool state_ledger::transfer(const leasegate::schema::account_id_t& from,
                            const leasegate::schema::account_id_t& to,
                            const leasegate::schema::amount_t& amount) {
  auto from_balance = balance_of(from);
  if (from_balance < amount) {
    spdlog::warn("Transfer of {} from {} exceeds balance {}", amount.str(),
                 leasegate::schema::to_hex(from), from_balance.str());
    return false;
  }
  if (from == to) {
    return true;
  }
  auto to_balance = balance_of(to);
  if (std::numeric_limits<leasegate::schema::amount_t>::max() - to_balance <
      amount) {
    return false;
  }
  set_balance(from, from_balance - amount);
  set_balance(to, to_balance + amount);
  return true;
}

void state_ledger::credit(const leasegate::schema::account_id_t& account,
                          const leasegate::schema::amount_t& amount) {
  auto balance = balance_of(account);
  if (std::numeric_limits<leasegate::schema::amount_t>::max() - balance <
      amount) {
    leasegate::common::critical("genesis allocation overflows balance");
  }
  set_balance(account, balance + amount);
}

void state_ledger::set_balance(const leasegate::schema::account_id_t& account,
                               const leasegate::schema::amount_t& amount) {
  journal_.put(
      leasegate::schema::key::make_balance_key(journal_.encoder(), account),
      leasegate::schema::to_be_bytes(amount));
}

}  // namespace leasegate::escrow
