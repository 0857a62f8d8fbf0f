/**
 * @file jwk.cpp
 * @brief Implementation of Ed25519 JSON Web Key utilities
 */

#include "keridoc/jwk.hpp"

#include "keridoc/base64.hpp"
#include "keridoc/error.hpp"
#include "keridoc/logging.hpp"

namespace keridoc {
namespace jwk {

OkpJwk createEd25519Jwk(std::string_view kid,
                        std::span<const uint8_t> raw_key) {
  if (raw_key.empty()) {
    throw InvalidKeyMaterialError("public key for " + std::string(kid) +
                                  " has no key bytes");
  }
  if (raw_key.size() != ED25519_PUBLIC_KEY_SIZE) {
    KDOC_LOG_DEBUG("Key {} is {} bytes, not an Ed25519 key; x carries it as is",
                   kid, raw_key.size());
  }

  OkpJwk key;
  key.kid = std::string(kid);
  key.x = base64UrlEncode(raw_key);
  return key;
}

}  // namespace jwk
}  // namespace keridoc
