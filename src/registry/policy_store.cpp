#include <leasegate/registry/policy_store.hpp>
#include <leasegate/schema/key/engine_keys.hpp>
#include <leasegate/schema/transaction_event.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace leasegate::registry {

using leasegate::schema::error_code;

policy_store::policy_store(leasegate::state::journal& journal)
    : journal_{journal} {}

leasegate::execution::operation_result<leasegate::schema::policy_id_t>
policy_store::create_policy(const leasegate::execution::call_context& ctx,
                            const leasegate::schema::policy_terms_t& terms) {
  using result_t = leasegate::schema::policy_id_t;
  if (terms.deadline <= ctx.now) {
    return leasegate::execution::make_failure<result_t>(
        error_code::invalid_deadline,
        fmt::format("deadline {} is not after {}", terms.deadline, ctx.now));
  }
  if (terms.min_age == 0 || terms.income_multiplier == 0 ||
      terms.rent_amount == 0) {
    return leasegate::execution::make_failure<result_t>(
        error_code::invalid_terms,
        "min_age, income_multiplier and rent_amount must be non-zero");
  }

  const auto policy_id = next_policy_id();
  auto stored = leasegate::schema::policy_t{
      .min_age = terms.min_age,
      .income_multiplier = terms.income_multiplier,
      .rent_amount = terms.rent_amount,
      .require_clean_record = terms.require_clean_record,
      .deadline = terms.deadline,
      .owner = ctx.caller,
      .content_hash = leasegate::schema::compute_policy_hash(terms, ctx.caller)};

  auto& encoder = journal_.encoder();
  journal_.put(leasegate::schema::key::make_policy_key(encoder, policy_id),
               stored);
  journal_.put(leasegate::schema::key::make_policy_seq_key(encoder),
               policy_id + 1);
  journal_.emit(leasegate::schema::make_policy_created_event(
      policy_id, stored.owner, stored.content_hash));

  spdlog::info("Policy {} created by {} (hash {})", policy_id,
               leasegate::schema::to_hex(stored.owner),
               leasegate::schema::to_hex(stored.content_hash));
  return leasegate::execution::make_success(policy_id);
}

leasegate::execution::operation_result<leasegate::schema::policy_t>
policy_store::get_policy(const leasegate::schema::policy_id_t policy_id) {
  auto stored = journal_.get<leasegate::schema::policy_t>(
      leasegate::schema::key::make_policy_key(journal_.encoder(), policy_id));
  if (!stored) {
    return leasegate::execution::make_failure<leasegate::schema::policy_t>(
        error_code::policy_not_found,
        fmt::format("policy {} does not exist", policy_id));
  }
  return leasegate::execution::make_success(std::move(*stored));
}

bool policy_store::is_owner(const leasegate::schema::policy_id_t policy_id,
                            const leasegate::schema::account_id_t& account) {
  auto stored = get_policy(policy_id);
  return stored.ok() && stored.value->owner == account;
}

leasegate::schema::policy_id_t policy_store::next_policy_id() {
  auto next = journal_.get<uint64_t>(
      leasegate::schema::key::make_policy_seq_key(journal_.encoder()));
  return next.value_or(1);
}

uint64_t policy_store::policy_count() {
  return next_policy_id() - 1;
}

}  // namespace leasegate::registry
