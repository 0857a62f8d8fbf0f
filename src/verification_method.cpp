#include "keridoc/verification_method.hpp"

#include "keridoc/did_uri.hpp"
#include "keridoc/error.hpp"
#include "keridoc/logging.hpp"

namespace keridoc {

namespace {

struct ConditionBuilder {
  const std::vector<VerificationMethod>& key_methods;
  std::string_view controller;
  std::string_view controller_aid;
  std::vector<VerificationMethod>& out;

  void operator()(const SingleKey&) const {}

  void operator()(const SimpleThreshold& simple) const {
    if (simple.threshold <= 1) return;

    ThresholdCondition condition;
    condition.threshold = simple.threshold;
    for (const auto& method : key_methods) {
      condition.conditions.push_back(method.id);
    }
    out.push_back(conditionalProof(std::move(condition)));
  }

  void operator()(const WeightedThreshold& weighted) const {
    NormalizedWeights normalized = normalizeWeights(weighted.weights);

    WeightedThresholdCondition condition;
    condition.threshold = normalized.threshold;
    for (size_t i = 0; i < key_methods.size(); ++i) {
      condition.conditions.push_back(
          WeightedCondition{key_methods[i].id, normalized.numerators[i]});
    }
    out.push_back(conditionalProof(std::move(condition)));
  }

  VerificationMethod conditionalProof(
      VerificationMethod::Material material) const {
    VerificationMethod method;
    method.id = "#" + std::string(controller_aid);
    method.controller = std::string(controller);
    method.material = std::move(material);
    return method;
  }
};

}  // namespace

VerificationMethod makeJsonWebKeyMethod(const VerifyingKey& key,
                                        std::string_view controller) {
  VerificationMethod method;
  method.id = "#" + key.identifier;
  method.controller = std::string(controller);
  method.material = jwk::createEd25519Jwk(key.identifier, key.raw);
  return method;
}

std::vector<VerificationMethod> encodeVerificationMethods(
    const std::vector<VerifyingKey>& keys, const SigningPolicy& policy,
    std::string_view did, std::string_view controller_aid) {
  policy.validate(keys.size());

  const std::string controller = stripQuery(did);
  std::vector<VerificationMethod> methods;
  methods.reserve(keys.size() + 1);
  for (const auto& key : keys) {
    methods.push_back(makeJsonWebKeyMethod(key, controller));
  }

  std::vector<VerificationMethod> conditions;
  std::visit(ConditionBuilder{methods, controller, controller_aid, conditions},
             policy.variant());
  for (auto& condition : conditions) {
    methods.push_back(std::move(condition));
  }

  KDOC_LOG_DEBUG("Encoded {} verification methods for {}", methods.size(),
                 controller);
  return methods;
}

}  // namespace keridoc
