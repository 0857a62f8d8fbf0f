/**
 * @file jwk.hpp
 * @brief JSON Web Key (RFC 7517, RFC 8037) representation of Ed25519
 * verification keys
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keridoc {

namespace jwk {

constexpr std::string_view KTY_OKP = "OKP";
constexpr std::string_view CRV_ED25519 = "Ed25519";
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;

/**
 * @brief Octet key pair JWK for an Ed25519 public key
 */
struct OkpJwk {
  std::string kid;                          ///< Qualified key identifier
  std::string kty = std::string(KTY_OKP);
  std::string crv = std::string(CRV_ED25519);
  std::string x;                            ///< base64url raw key, unpadded

  bool operator==(const OkpJwk& other) const = default;
};

/**
 * @brief Build an OKP JWK from raw public key bytes
 *
 * Every key state key gets a JWK labelled Ed25519, whatever its length, so
 * keys of other derivation codes still appear in the document with x holding
 * their raw bytes.
 * @param kid Key identifier to carry in the JWK
 * @param raw_key Raw public key, 32 bytes for Ed25519
 * @return JWK with x set to the unpadded base64url key
 * @throws InvalidKeyMaterialError if raw_key is empty
 */
OkpJwk createEd25519Jwk(std::string_view kid, std::span<const uint8_t> raw_key);

}  // namespace jwk
}  // namespace keridoc
