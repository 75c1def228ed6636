#pragma once

#include <leasegate/schema/primitives.hpp>
#include <leasegate/schema/transaction_event.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace leasegate::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

// Schema type: block result.
// Finalize output: per-transaction results plus the candidate state root.
template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  uint16_t version{1};
  // Non-zero when the block itself was refused; no transaction ran.
  uint32_t code{};
  std::string log;
  std::vector<transaction_result_t> tx_results;
  hash32_t state_root;
};

using block_result_t = block_result<1>;

template <uint16_t Version>
struct commit_result;

template <>
struct commit_result<1> final {
  uint16_t version{1};
  int64_t committed_height{};
  hash32_t state_root;
};

using commit_result_t = commit_result<1>;

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t schema_version{1};
  std::string data{"leasegate"};
  std::string version{"0.1.0"};
  int64_t last_block_height{};
  hash32_t last_block_state_root;
  hash32_t chain_id;
};

using app_info_t = app_info<1>;

// Schema type: query result.
// Read API envelope: deterministic output, key echo, height and error metadata.
template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  bytes_t key;
  bytes_t value;
  int64_t height{};
  std::string codespace;
};

using query_result_t = query_result<1>;

}  // namespace leasegate::schema
