/**
 * @file signing_policy.hpp
 * @brief Signing threshold policies of an identifier's key state
 */

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace keridoc {

/**
 * @brief Positive rational weight
 */
struct Fraction {
  int64_t numerator = 0;
  int64_t denominator = 1;

  /**
   * @brief Parse "n/d" or "n"
   * @throws InvalidPolicyError on malformed text, zero denominator or a
   * non-positive value
   */
  static Fraction parse(std::string_view text);

  [[nodiscard]] std::string toString() const;

  bool operator==(const Fraction& other) const = default;
};

/// One key signs alone
struct SingleKey {
  bool operator==(const SingleKey&) const = default;
};

/// Any `threshold` of the keys must sign
struct SimpleThreshold {
  uint64_t threshold = 1;
  bool operator==(const SimpleThreshold&) const = default;
};

/// Accumulated weights of the signing keys must reach the threshold
struct WeightedThreshold {
  std::vector<Fraction> weights;
  bool operator==(const WeightedThreshold&) const = default;
};

/**
 * @brief Signing policy of a key state
 */
class SigningPolicy {
 public:
  using Variant = std::variant<SingleKey, SimpleThreshold, WeightedThreshold>;

  SigningPolicy() = default;
  SigningPolicy(SingleKey single) : policy_(single) {}
  SigningPolicy(SimpleThreshold simple) : policy_(simple) {}
  SigningPolicy(WeightedThreshold weighted) : policy_(std::move(weighted)) {}

  static SigningPolicy single() { return SigningPolicy(SingleKey{}); }
  static SigningPolicy simple(uint64_t threshold);
  static SigningPolicy weighted(std::vector<Fraction> weights);
  static SigningPolicy weighted(const std::vector<std::string>& weights);

  /**
   * @brief Read a threshold in its key event wire form
   *
   * Accepts an integer, a hex string ("2", "a"), a list of weight strings
   * (["1/2", "1/2"]) or a single-clause list of lists ([["1/2", "1/2"]]).
   * @throws InvalidPolicyError for anything else, including multi-clause
   * weighted thresholds
   */
  static SigningPolicy fromKeriThreshold(const nlohmann::json& sith);

  [[nodiscard]] const Variant& variant() const noexcept { return policy_; }

  [[nodiscard]] bool isWeighted() const noexcept {
    return std::holds_alternative<WeightedThreshold>(policy_);
  }

  /**
   * @brief Check the policy against the number of signing keys
   * @throws InvalidPolicyError when weights and keys disagree in count, or
   * a simple threshold exceeds the key count
   */
  void validate(size_t key_count) const;

  bool operator==(const SigningPolicy& other) const = default;

 private:
  Variant policy_ = SingleKey{};
};

/**
 * @brief Weighted threshold normalized to a common denominator
 */
struct NormalizedWeights {
  int64_t lcd = 1;                  ///< Least common multiple of denominators
  std::vector<int64_t> numerators;  ///< Weight expressed over lcd, per key
  double threshold = 0.5;           ///< lcd / 2
};

/**
 * @brief Scale every weight to the least common denominator
 * @throws InvalidPolicyError on empty input, non-positive weights, overflow
 * or a weight that does not scale to a whole numerator
 */
NormalizedWeights normalizeWeights(const std::vector<Fraction>& weights);

}  // namespace keridoc
