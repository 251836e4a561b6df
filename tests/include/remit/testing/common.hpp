#pragma once

#include <openssl/evp.h>
#include <remit/crypto/verify.hpp>
#include <remit/schema/encoding/scale/encoder.hpp>
#include <remit/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace remit::testing {

using scale_encoder_t = remit::schema::encoding::encoder<
    remit::schema::encoding::scale_encoder_tag>;

inline remit::schema::address_t make_address(const uint8_t seed) {
  auto out = remit::schema::address_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Signer with an arbitrary public key; only usable with a permissive
/// verifier.
inline remit::schema::ed25519_signer_id make_ed25519_signer(
    const uint8_t seed) {
  auto signer = remit::schema::ed25519_signer_id{};
  for (std::size_t i = 0; i < signer.public_key.size(); ++i) {
    signer.public_key[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return signer;
}

inline remit::schema::address_t address_of(
    const remit::schema::signer_id_t& signer) {
  return remit::crypto::derive_address(signer);
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Freshly generated ed25519 key pair backed by OpenSSL.
class ed25519_keypair final {
 public:
  ed25519_keypair() : key_{nullptr, EVP_PKEY_free} {
    auto ctx = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
      throw std::runtime_error{"ed25519 keygen unavailable"};
    }
    auto* raw = static_cast<EVP_PKEY*>(nullptr);
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
      throw std::runtime_error{"ed25519 keygen failed"};
    }
    key_.reset(raw);

    auto length = signer_.public_key.size();
    if (EVP_PKEY_get_raw_public_key(key_.get(), signer_.public_key.data(),
                                    &length) != 1 ||
        length != signer_.public_key.size()) {
      throw std::runtime_error{"ed25519 public key export failed"};
    }
  }

  remit::schema::signer_id_t signer() const { return signer_; }

  remit::schema::address_t address() const { return address_of(signer_); }

  remit::schema::signature_t sign(
      const remit::schema::bytes_view_t& message) const {
    auto ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>{
        EVP_MD_CTX_new(), EVP_MD_CTX_free};
    auto signature = remit::schema::ed25519_signature_t{};
    auto length = signature.size();
    if (!ctx ||
        EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) !=
            1 ||
        EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(),
                       message.size()) != 1) {
      throw std::runtime_error{"ed25519 signing failed"};
    }
    return signature;
  }

 private:
  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key_;
  remit::schema::ed25519_signer_id signer_{};
};

}  // namespace remit::testing
