#include <remit/blake3/hash.hpp>
#include <remit/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>

#include <algorithm>
#include <iterator>
#include <memory>
#include <optional>

namespace remit::crypto {

namespace {

using pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using pkey_ctx_ptr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using param_bld_ptr =
    std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
using param_ptr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;

constexpr auto kSecpCurve = "secp256k1";
constexpr auto kScalarSize = 32;

/// Compact secp256k1 signatures are [v || r || s]; v is 0..3 or 27..30.
bool is_recovery_id(const uint8_t v) {
  return v <= 3 || (v >= 27 && v <= 30);
}

pkey_ptr load_public_key(const remit::schema::ed25519_signer_id& signer) {
  return pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                              signer.public_key.data(),
                                              signer.public_key.size()),
                  EVP_PKEY_free};
}

pkey_ptr load_public_key(const remit::schema::secp256k1_signer_id& signer) {
  auto none = pkey_ptr{nullptr, EVP_PKEY_free};
  auto builder = param_bld_ptr{OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free};
  if (!builder ||
      OSSL_PARAM_BLD_push_utf8_string(builder.get(), OSSL_PKEY_PARAM_GROUP_NAME,
                                      kSecpCurve, 0) != 1 ||
      OSSL_PARAM_BLD_push_octet_string(builder.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                       signer.public_key.data(),
                                       signer.public_key.size()) != 1) {
    return none;
  }
  auto params =
      param_ptr{OSSL_PARAM_BLD_to_param(builder.get()), OSSL_PARAM_free};
  auto ctx = pkey_ctx_ptr{EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr),
                          EVP_PKEY_CTX_free};
  if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
    return none;
  }
  auto* key = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(ctx.get(), &key, EVP_PKEY_PUBLIC_KEY, params.get()) !=
      1) {
    return none;
  }
  return pkey_ptr{key, EVP_PKEY_free};
}

/// Signature bytes in the form EVP_DigestVerify expects for each scheme.
std::optional<remit::schema::bytes_t> to_wire(
    const remit::schema::ed25519_signature_t& signature) {
  return remit::schema::bytes_t{std::begin(signature), std::end(signature)};
}

std::optional<remit::schema::bytes_t> to_wire(
    const remit::schema::secp256k1_signature_t& signature) {
  if (!is_recovery_id(signature[0])) {
    return std::nullopt;
  }
  const auto* r_bytes = signature.data() + 1;
  const auto* s_bytes = r_bytes + kScalarSize;
  auto sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  auto* r = BN_bin2bn(r_bytes, kScalarSize, nullptr);
  auto* s = BN_bin2bn(s_bytes, kScalarSize, nullptr);
  if (!sig || r == nullptr || s == nullptr ||
      ECDSA_SIG_set0(sig.get(), r, s) != 1) {
    BN_free(r);
    BN_free(s);
    return std::nullopt;
  }

  auto size = i2d_ECDSA_SIG(sig.get(), nullptr);
  if (size <= 0) {
    return std::nullopt;
  }
  auto der = remit::schema::bytes_t(static_cast<std::size_t>(size));
  auto* cursor = der.data();
  if (i2d_ECDSA_SIG(sig.get(), &cursor) != size) {
    return std::nullopt;
  }
  return der;
}

/// ed25519 signs the message itself; secp256k1 signs its sha256 digest.
const EVP_MD* message_digest(const remit::schema::ed25519_signer_id&) {
  return nullptr;
}

const EVP_MD* message_digest(const remit::schema::secp256k1_signer_id&) {
  return EVP_sha256();
}

template <typename Signature, typename Signer>
bool verify_as(const remit::schema::bytes_view_t& message,
               const Signer& signer,
               const remit::schema::signature_t& signature) {
  const auto* typed = std::get_if<Signature>(&signature);
  if (typed == nullptr) {
    return false;
  }
  auto wire = to_wire(*typed);
  auto key = load_public_key(signer);
  if (!wire || !key) {
    return false;
  }
  auto ctx = md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, message_digest(signer),
                                   nullptr, key.get()) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), wire->data(), wire->size(),
                          message.data(), message.size()) == 1;
}

}  // namespace

bool available() {
  static const auto supported = [] {
    auto ed25519 = pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                                EVP_PKEY_CTX_free};
    auto ec = pkey_ctx_ptr{EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr),
                           EVP_PKEY_CTX_free};
    return ed25519 != nullptr && ec != nullptr;
  }();
  return supported;
}

bool verify_signature(const remit::schema::bytes_view_t& message,
                      const remit::schema::signer_id_t& signer,
                      const remit::schema::signature_t& signature) {
  return std::visit(
      overloaded{[&](const remit::schema::ed25519_signer_id& key) {
                   return verify_as<remit::schema::ed25519_signature_t>(
                       message, key, signature);
                 },
                 [&](const remit::schema::secp256k1_signer_id& key) {
                   return verify_as<remit::schema::secp256k1_signature_t>(
                       message, key, signature);
                 }},
      signer);
}

remit::schema::address_t derive_address(
    const remit::schema::signer_id_t& signer) {
  auto digest = std::visit(
      [](const auto& value) {
        return remit::blake3::hash(remit::schema::bytes_view_t{
            value.public_key.data(), value.public_key.size()});
      },
      signer);
  auto address = remit::schema::address_t{};
  std::copy(std::end(digest) - address.size(), std::end(digest),
            std::begin(address));
  return address;
}

}  // namespace remit::crypto
