#include <guardrail/crypto/sign.hpp>

#include <openssl/evp.h>

#include <memory>

namespace guardrail::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

evp_pkey_ptr load_private_key(
    const guardrail::schema::ed25519_private_key_t& private_key) {
  return evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                   private_key.data(), private_key.size()),
      EVP_PKEY_free};
}

std::optional<guardrail::schema::ed25519_public_key_t> raw_public_key(
    EVP_PKEY* pkey) {
  auto public_key = guardrail::schema::ed25519_public_key_t{};
  auto public_key_size = public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey, public_key.data(), &public_key_size) !=
          1 ||
      public_key_size != public_key.size()) {
    return std::nullopt;
  }
  return public_key;
}

}  // namespace

std::optional<ed25519_keypair> generate_ed25519_keypair() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    return std::nullopt;
  }
  auto* raw = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
    return std::nullopt;
  }
  auto pkey = evp_pkey_ptr{raw, EVP_PKEY_free};

  auto keypair = ed25519_keypair{};
  auto private_key_size = keypair.private_key.size();
  if (EVP_PKEY_get_raw_private_key(pkey.get(), keypair.private_key.data(),
                                   &private_key_size) != 1 ||
      private_key_size != keypair.private_key.size()) {
    return std::nullopt;
  }
  auto public_key = raw_public_key(pkey.get());
  if (!public_key) {
    return std::nullopt;
  }
  keypair.public_key = *public_key;
  return keypair;
}

std::optional<guardrail::schema::ed25519_public_key_t>
derive_ed25519_public_key(
    const guardrail::schema::ed25519_private_key_t& private_key) {
  auto pkey = load_private_key(private_key);
  if (!pkey) {
    return std::nullopt;
  }
  return raw_public_key(pkey.get());
}

std::optional<guardrail::schema::ed25519_signature_t> sign_ed25519(
    const guardrail::schema::bytes_view_t& message,
    const guardrail::schema::ed25519_private_key_t& private_key) {
  auto pkey = load_private_key(private_key);
  if (!pkey) {
    return std::nullopt;
  }
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
      1) {
    return std::nullopt;
  }
  auto signature = guardrail::schema::ed25519_signature_t{};
  auto signature_size = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &signature_size,
                     message.data(), message.size()) != 1 ||
      signature_size != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

}  // namespace guardrail::crypto
