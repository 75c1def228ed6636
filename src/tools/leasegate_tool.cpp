#include <boost/program_options.hpp>
#include <leasegate/common/critical.hpp>
#include <leasegate/crypto/verify.hpp>
#include <leasegate/eligibility/attestation.hpp>
#include <leasegate/schema/encoding/scale/encoder.hpp>
#include <leasegate/schema/policy.hpp>
#include <leasegate/schema/transaction.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <string>
#include <tuple>
#include <vector>

namespace {

using encoder_t = leasegate::schema::encoding::scale_encoder_t;
namespace po = boost::program_options;

std::string get_string(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    leasegate::common::critical("missing required argument --" + name);
  }
  return vm[name].as<std::string>();
}

leasegate::schema::hash32_t get_hash32(const po::variables_map& vm,
                                       const std::string& name) {
  auto hash = leasegate::schema::try_make_hash32(get_string(vm, name));
  if (!hash) {
    leasegate::common::critical("--" + name + " must be 32 bytes of hex");
  }
  return *hash;
}

leasegate::schema::amount_t get_amount(const po::variables_map& vm,
                                       const std::string& name) {
  auto amount = leasegate::schema::try_parse_amount(get_string(vm, name));
  if (!amount) {
    leasegate::common::critical("--" + name + " must be a decimal integer");
  }
  return *amount;
}

leasegate::schema::signer_id_t get_signer(const po::variables_map& vm,
                                          const std::string& name) {
  auto signer = leasegate::schema::try_parse_signer(get_string(vm, name));
  if (!signer) {
    leasegate::common::critical("--" + name +
                                " must be ed25519:<hex> or secp256k1:<hex>");
  }
  return *signer;
}

// Zero signature of the right kind when no hex is given; used to build the
// payload a key holder signs.
leasegate::schema::signature_t get_signature(
    const po::variables_map& vm,
    const std::string& name,
    const leasegate::schema::signer_id_t& signer) {
  auto hex = vm.contains(name) ? vm[name].as<std::string>() : std::string{};
  auto bytes = leasegate::schema::try_from_hex(hex);
  if (!bytes) {
    leasegate::common::critical("--" + name + " must be hex");
  }
  if (std::holds_alternative<leasegate::schema::ed25519_signer_id>(signer)) {
    auto signature = leasegate::schema::ed25519_signature_t{};
    if (!bytes->empty()) {
      if (bytes->size() != signature.size()) {
        leasegate::common::critical("ed25519 signature must be 64 bytes");
      }
      std::copy(std::begin(*bytes), std::end(*bytes), std::begin(signature));
    }
    return signature;
  }
  auto signature = leasegate::schema::secp256k1_signature_t{};
  if (!bytes->empty()) {
    if (bytes->size() != signature.size()) {
      leasegate::common::critical("secp256k1 signature must be 65 bytes");
    }
    std::copy(std::begin(*bytes), std::end(*bytes), std::begin(signature));
  }
  return signature;
}

leasegate::schema::policy_terms_t make_terms(const po::variables_map& vm) {
  return leasegate::schema::policy_terms_t{
      .min_age = vm["min-age"].as<uint32_t>(),
      .income_multiplier = vm["income-multiplier"].as<uint32_t>(),
      .rent_amount = get_amount(vm, "rent-amount"),
      .require_clean_record = vm["require-clean-record"].as<bool>(),
      .deadline = vm["deadline"].as<uint64_t>()};
}

leasegate::schema::attestation_claim_t make_attestation(
    const po::variables_map& vm) {
  return leasegate::schema::attestation_claim_t{
      .wallet = get_hash32(vm, "wallet"),
      .policy_id = vm["policy-id"].as<uint64_t>(),
      .expiry = vm["expiry"].as<uint64_t>(),
      .nullifier = get_hash32(vm, "nullifier"),
      .pass_bitmask = static_cast<uint8_t>(vm["pass-bitmask"].as<uint32_t>())};
}

leasegate::eligibility::attestation_domain make_domain(
    const po::variables_map& vm) {
  auto chain_id = get_hash32(vm, "chain-id");
  return leasegate::eligibility::attestation_domain{
      .name = vm["domain-name"].as<std::string>(),
      .version = "1",
      .chain_id = chain_id,
      .verifying_gate = vm.contains("gate-id")
                            ? get_hash32(vm, "gate-id")
                            : leasegate::eligibility::default_gate_id(chain_id)};
}

leasegate::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = get_string(vm, "payload");
  if (payload == "create_policy") {
    return leasegate::schema::create_policy_t{.terms = make_terms(vm)};
  }
  if (payload == "submit_proof") {
    auto proof = leasegate::schema::try_from_hex(get_string(vm, "proof-hex"));
    if (!proof) {
      leasegate::common::critical("--proof-hex must be hex");
    }
    auto inputs = std::vector<leasegate::schema::field_element_t>{};
    if (vm.contains("public-input")) {
      for (const auto& value :
           vm["public-input"].as<std::vector<std::string>>()) {
        auto parsed = leasegate::schema::try_parse_amount(value);
        if (!parsed) {
          leasegate::common::critical("--public-input must be decimal");
        }
        inputs.push_back(*parsed);
      }
    }
    return leasegate::schema::submit_proof_t{
        .policy_id = vm["policy-id"].as<uint64_t>(),
        .claim = leasegate::schema::proof_claim_t{
            .proof = std::move(*proof), .public_inputs = std::move(inputs)}};
  }
  if (payload == "submit_attestation") {
    auto issuer = get_signer(vm, "issuer");
    return leasegate::schema::submit_attestation_t{
        .attestation = leasegate::schema::signed_attestation_t{
            .claim = make_attestation(vm),
            .signature =
                get_signature(vm, "attestation-signature-hex", issuer)}};
  }
  if (payload == "start_lease") {
    return leasegate::schema::start_lease_t{
        .policy_id = vm["policy-id"].as<uint64_t>()};
  }
  if (payload == "owner_confirm") {
    return leasegate::schema::owner_confirm_t{
        .policy_id = vm["policy-id"].as<uint64_t>(),
        .tenant = get_hash32(vm, "tenant")};
  }
  if (payload == "timeout_refund") {
    return leasegate::schema::timeout_refund_t{
        .policy_id = vm["policy-id"].as<uint64_t>()};
  }
  if (payload == "set_issuer") {
    return leasegate::schema::set_issuer_t{.issuer = get_signer(vm, "issuer")};
  }
  leasegate::common::critical("unsupported payload type");
}

leasegate::schema::transaction_t build_transaction(
    const po::variables_map& vm) {
  auto signer = get_signer(vm, "signer");
  auto value = vm.contains("value") ? get_amount(vm, "value")
                                    : leasegate::schema::amount_t{0};
  return leasegate::schema::transaction_t{
      .version = 1,
      .chain_id = get_hash32(vm, "chain-id"),
      .nonce = vm["nonce"].as<uint64_t>(),
      .signer = signer,
      .value = value,
      .payload = build_payload(vm),
      .signature = get_signature(vm, "signature-hex", signer)};
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  leasegate_tool policy-hash [options]\n"
            << "  leasegate_tool attestation-digest [options]\n"
            << "  leasegate_tool nullifier --high <n> --low <n>\n"
            << "  leasegate_tool account-id --signer <kind:hex>\n"
            << "  leasegate_tool signing-payload --payload <type> [options]\n"
            << "  leasegate_tool transaction --payload <type> [options]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"leasegate_tool options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "policy-hash|attestation-digest|nullifier|account-id|signing-payload|"
      "transaction")("min-age", po::value<uint32_t>()->default_value(0),
                     "policy minimum age")(
      "income-multiplier", po::value<uint32_t>()->default_value(0),
      "policy income multiplier")("rent-amount", po::value<std::string>(),
                                  "policy rent, decimal smallest unit")(
      "require-clean-record", po::value<bool>()->default_value(false),
      "policy clean record requirement")(
      "deadline", po::value<uint64_t>()->default_value(0),
      "policy deadline, seconds")("owner", po::value<std::string>(),
                                  "owner account hex")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "gate-id", po::value<std::string>(), "verifying gate id hex")(
      "domain-name",
      po::value<std::string>()->default_value("leasegate.attestation"),
      "attestation domain name")("wallet", po::value<std::string>(),
                                 "attested wallet account hex")(
      "policy-id", po::value<uint64_t>()->default_value(0), "policy id")(
      "expiry", po::value<uint64_t>()->default_value(0),
      "attestation expiry, seconds")("nullifier", po::value<std::string>(),
                                     "32-byte nullifier hex")(
      "pass-bitmask", po::value<uint32_t>()->default_value(0),
      "attestation pass bitmask")("high", po::value<std::string>(),
                                  "nullifier high limb, decimal")(
      "low", po::value<std::string>(), "nullifier low limb, decimal")(
      "signer", po::value<std::string>(), "ed25519:<hex> or secp256k1:<hex>")(
      "payload", po::value<std::string>(), "transaction payload type")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "value", po::value<std::string>(), "attached value, decimal")(
      "signature-hex", po::value<std::string>(), "envelope signature hex")(
      "tenant", po::value<std::string>(), "tenant account hex")(
      "issuer", po::value<std::string>(), "issuer ed25519:<hex>|secp256k1:<hex>")(
      "attestation-signature-hex", po::value<std::string>(),
      "issuer signature over the attestation digest")(
      "proof-hex", po::value<std::string>(), "proof bytes hex")(
      "public-input", po::value<std::vector<std::string>>()->multitoken(),
      "proof public inputs, decimal");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "policy-hash") {
    std::cout << leasegate::schema::to_hex(leasegate::schema::compute_policy_hash(
                     make_terms(vm), get_hash32(vm, "owner")))
              << '\n';
    return 0;
  }
  if (command == "attestation-digest") {
    std::cout << leasegate::schema::to_hex(leasegate::eligibility::attestation_digest(
                     make_domain(vm), make_attestation(vm)))
              << '\n';
    return 0;
  }
  if (command == "nullifier") {
    auto high = get_amount(vm, "high");
    auto low = get_amount(vm, "low");
    const auto bound = leasegate::schema::field_element_t{1} << 128;
    if (high >= bound || low >= bound) {
      leasegate::common::critical("nullifier limbs must be below 2^128");
    }
    std::cout << leasegate::schema::to_hex(
                     leasegate::eligibility::nullifier_from_limbs(high, low))
              << '\n';
    return 0;
  }
  if (command == "account-id") {
    std::cout << leasegate::schema::to_hex(
                     leasegate::crypto::account_of(get_signer(vm, "signer")))
              << '\n';
    return 0;
  }
  if (command == "signing-payload") {
    auto payload =
        leasegate::schema::make_signing_payload(build_transaction(vm));
    std::cout << leasegate::schema::to_hex(
                     leasegate::schema::make_bytes_view(payload))
              << '\n';
    return 0;
  }
  if (command == "transaction" || command == "tx") {
    auto encoder = encoder_t{};
    auto encoded = encoder.encode(build_transaction(vm));
    std::cout << leasegate::schema::to_hex(
                     leasegate::schema::make_bytes_view(encoded))
              << '\n';
    return 0;
  }

  print_help(options);
  return 1;
}
