#include <boost/program_options.hpp>
#include <guardrail/common/critical.hpp>
#include <guardrail/crypto/attestation_message.hpp>
#include <guardrail/crypto/sign.hpp>
#include <guardrail/crypto/verify.hpp>
#include <guardrail/schema/primitives.hpp>

#include <iostream>
#include <optional>
#include <string>

namespace {

namespace po = boost::program_options;

void print_help(const po::options_description& options) {
  std::cout << "usage: guardrail_attestor <command> [options]\n"
            << "commands:\n"
            << "  keygen      generate an attestor key pair\n"
            << "  public-key  derive the public key for --private-key\n"
            << "  sign        sign --account with --private-key\n"
            << "  verify      check --signature for --account against "
               "--public-key\n\n"
            << options << std::endl;
}

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    guardrail::common::critical("missing required --" + name);
  }
  return vm[name].as<std::string>();
}

std::optional<char> network_prefix(const po::variables_map& vm) {
  auto prefix = vm["network-prefix"].as<std::string>();
  if (prefix.size() > 1) {
    guardrail::common::critical("--network-prefix must be a single character");
  }
  if (prefix.empty()) {
    return std::nullopt;
  }
  return prefix.front();
}

guardrail::schema::ed25519_private_key_t private_key(
    const po::variables_map& vm) {
  auto key =
      guardrail::schema::try_make_ed25519_private_key(require(vm, "private-key"));
  if (!key.has_value()) {
    guardrail::common::critical("--private-key must be 32 bytes of hex");
  }
  return *key;
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"guardrail_attestor options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "keygen|public-key|sign|verify")("private-key", po::value<std::string>(),
                                       "attestor private key hex")(
      "public-key", po::value<std::string>(), "attestor public key hex")(
      "account", po::value<std::string>(), "account identifier")(
      "signature", po::value<std::string>(), "signature hex")(
      "network-prefix", po::value<std::string>()->default_value("3"),
      "leading account character stripped before signing; empty to disable");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& error) {
    std::cerr << error.what() << std::endl;
    print_help(options);
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "keygen") {
    auto keypair = guardrail::crypto::generate_ed25519_keypair();
    if (!keypair.has_value()) {
      guardrail::common::critical("failed to generate Ed25519 key pair");
    }
    std::cout << "private_key=" << guardrail::schema::to_hex(keypair->private_key)
              << '\n'
              << "public_key=" << guardrail::schema::to_hex(keypair->public_key)
              << std::endl;
    return 0;
  }

  if (command == "public-key") {
    auto public_key = guardrail::crypto::derive_ed25519_public_key(private_key(vm));
    if (!public_key.has_value()) {
      guardrail::common::critical("failed to derive public key");
    }
    std::cout << guardrail::schema::to_hex(*public_key) << std::endl;
    return 0;
  }

  if (command == "sign") {
    auto account = require(vm, "account");
    auto message =
        guardrail::crypto::make_attestation_message(account, network_prefix(vm));
    auto signature = guardrail::crypto::sign_ed25519(message, private_key(vm));
    if (!signature.has_value()) {
      guardrail::common::critical("failed to sign account");
    }
    std::cout << guardrail::schema::to_hex(*signature) << std::endl;
    return 0;
  }

  if (command == "verify") {
    auto account = require(vm, "account");
    auto public_key = guardrail::schema::try_from_hex(require(vm, "public-key"));
    auto signature = guardrail::schema::try_from_hex(require(vm, "signature"));
    if (!public_key.has_value() || !signature.has_value()) {
      guardrail::common::critical("--public-key and --signature must be hex");
    }
    auto message =
        guardrail::crypto::make_attestation_message(account, network_prefix(vm));
    auto ok = guardrail::crypto::verify_ed25519(message, *public_key, *signature);
    std::cout << (ok ? "valid" : "invalid") << std::endl;
    return ok ? 0 : 1;
  }

  guardrail::common::critical("unknown command: " + command);
}
