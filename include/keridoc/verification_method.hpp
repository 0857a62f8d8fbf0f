/**
 * @file verification_method.hpp
 * @brief Verification methods synthesized from an identifier's signing keys
 * and signing policy
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "jwk.hpp"
#include "signing_policy.hpp"

namespace keridoc {

constexpr std::string_view VM_TYPE_JSON_WEB_KEY = "JsonWebKey";
constexpr std::string_view VM_TYPE_CONDITIONAL_PROOF = "ConditionalProof2022";

enum class VerificationMethodType { JsonWebKey, ConditionalProof2022 };

/**
 * @brief Current signing key of an identifier
 */
struct VerifyingKey {
  std::string identifier;    ///< Qualified key identifier
  std::vector<uint8_t> raw;  ///< Raw public key bytes
};

/// m-of-n condition over the key verification methods
struct ThresholdCondition {
  uint64_t threshold = 0;
  std::vector<std::string> conditions;  ///< Key verification method ids

  bool operator==(const ThresholdCondition&) const = default;
};

struct WeightedCondition {
  std::string condition;  ///< Key verification method id
  int64_t weight = 0;     ///< Numerator over the common denominator

  bool operator==(const WeightedCondition&) const = default;
};

/// Weighted condition over the key verification methods
struct WeightedThresholdCondition {
  double threshold = 0.0;
  std::vector<WeightedCondition> conditions;

  bool operator==(const WeightedThresholdCondition&) const = default;
};

/**
 * @brief One entry of a DID document's verificationMethod list
 */
struct VerificationMethod {
  using Material =
      std::variant<jwk::OkpJwk, ThresholdCondition, WeightedThresholdCondition>;

  std::string id;          ///< Fragment, "#<key or identifier>"
  std::string controller;  ///< DID without query
  Material material;

  [[nodiscard]] VerificationMethodType type() const noexcept {
    return std::holds_alternative<jwk::OkpJwk>(material)
               ? VerificationMethodType::JsonWebKey
               : VerificationMethodType::ConditionalProof2022;
  }

  [[nodiscard]] std::string_view typeName() const noexcept {
    return type() == VerificationMethodType::JsonWebKey
               ? VM_TYPE_JSON_WEB_KEY
               : VM_TYPE_CONDITIONAL_PROOF;
  }

  bool operator==(const VerificationMethod&) const = default;
};

/**
 * @brief JsonWebKey verification method for one key
 */
VerificationMethod makeJsonWebKeyMethod(const VerifyingKey& key,
                                        std::string_view controller);

/**
 * @brief Encode keys and signing policy into verification methods
 *
 * One JsonWebKey method per key, in key order. A SimpleThreshold above one
 * appends a ConditionalProof2022 listing every key method; a
 * WeightedThreshold appends one carrying the weights scaled to their least
 * common denominator with threshold lcd / 2.
 *
 * @param keys Signing keys in key state order
 * @param policy Signing policy of the key state
 * @param did DID the methods belong to; its query is stripped for controller
 * @param controller_aid Identifier naming the conditional proof method
 * @throws InvalidPolicyError when policy and keys disagree
 * @throws InvalidKeyMaterialError when a key has no key bytes
 */
std::vector<VerificationMethod> encodeVerificationMethods(
    const std::vector<VerifyingKey>& keys, const SigningPolicy& policy,
    std::string_view did, std::string_view controller_aid);

}  // namespace keridoc
