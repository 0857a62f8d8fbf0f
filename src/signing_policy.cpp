#include "keridoc/signing_policy.hpp"

#include <charconv>
#include <limits>
#include <numeric>

#include "keridoc/error.hpp"

namespace keridoc {

namespace {

int64_t parsePositive(std::string_view digits, std::string_view whole) {
  int64_t value = 0;
  auto [end, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (digits.empty() || ec != std::errc() ||
      end != digits.data() + digits.size()) {
    throw InvalidPolicyError("malformed weight '" + std::string(whole) + "'");
  }
  return value;
}

bool checkedMultiply(int64_t a, int64_t b, int64_t& out) noexcept {
  if (a != 0 && b > std::numeric_limits<int64_t>::max() / a) {
    return false;
  }
  out = a * b;
  return true;
}

std::vector<std::string> weightStrings(const nlohmann::json& clause) {
  std::vector<std::string> weights;
  for (const auto& weight : clause) {
    if (!weight.is_string()) {
      throw InvalidPolicyError("weights must be strings, got " +
                               weight.dump());
    }
    weights.push_back(weight.get<std::string>());
  }
  return weights;
}

}  // namespace

Fraction Fraction::parse(std::string_view text) {
  Fraction fraction;
  size_t slash = text.find('/');
  if (slash == std::string_view::npos) {
    fraction.numerator = parsePositive(text, text);
    fraction.denominator = 1;
  } else {
    fraction.numerator = parsePositive(text.substr(0, slash), text);
    fraction.denominator = parsePositive(text.substr(slash + 1), text);
  }
  if (fraction.denominator <= 0) {
    throw InvalidPolicyError("zero denominator in weight '" +
                             std::string(text) + "'");
  }
  if (fraction.numerator <= 0) {
    throw InvalidPolicyError("weight '" + std::string(text) +
                             "' is not positive");
  }
  int64_t divisor = std::gcd(fraction.numerator, fraction.denominator);
  fraction.numerator /= divisor;
  fraction.denominator /= divisor;
  return fraction;
}

std::string Fraction::toString() const {
  if (denominator == 1) {
    return std::to_string(numerator);
  }
  return std::to_string(numerator) + "/" + std::to_string(denominator);
}

SigningPolicy SigningPolicy::simple(uint64_t threshold) {
  if (threshold < 1) {
    throw InvalidPolicyError("threshold must be at least 1");
  }
  return SigningPolicy(SimpleThreshold{threshold});
}

SigningPolicy SigningPolicy::weighted(std::vector<Fraction> weights) {
  if (weights.empty()) {
    throw InvalidPolicyError("weighted threshold has no weights");
  }
  for (const auto& weight : weights) {
    if (weight.numerator <= 0 || weight.denominator <= 0) {
      throw InvalidPolicyError("weight " + weight.toString() +
                               " is not positive");
    }
  }
  return SigningPolicy(WeightedThreshold{std::move(weights)});
}

SigningPolicy SigningPolicy::weighted(const std::vector<std::string>& weights) {
  std::vector<Fraction> fractions;
  fractions.reserve(weights.size());
  for (const auto& weight : weights) {
    fractions.push_back(Fraction::parse(weight));
  }
  return weighted(std::move(fractions));
}

SigningPolicy SigningPolicy::fromKeriThreshold(const nlohmann::json& sith) {
  if (sith.is_number_unsigned() || sith.is_number_integer()) {
    if (sith.is_number_integer() && sith.get<int64_t>() < 1) {
      throw InvalidPolicyError("threshold must be at least 1");
    }
    return simple(sith.get<uint64_t>());
  }

  if (sith.is_string()) {
    const auto text = sith.get<std::string>();
    uint64_t threshold = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                     threshold, 16);
    if (text.empty() || ec != std::errc() ||
        end != text.data() + text.size()) {
      throw InvalidPolicyError("malformed hex threshold '" + text + "'");
    }
    return simple(threshold);
  }

  if (sith.is_array() && !sith.empty()) {
    if (sith.front().is_array()) {
      if (sith.size() != 1) {
        throw InvalidPolicyError(
            "multi-clause weighted thresholds are not supported");
      }
      return weighted(weightStrings(sith.front()));
    }
    return weighted(weightStrings(sith));
  }

  throw InvalidPolicyError("unrecognized threshold " + sith.dump());
}

void SigningPolicy::validate(size_t key_count) const {
  if (key_count == 0) {
    throw InvalidPolicyError("key state has no signing keys");
  }
  if (std::holds_alternative<SingleKey>(policy_)) {
    if (key_count != 1) {
      throw InvalidPolicyError("single key policy with " +
                               std::to_string(key_count) + " keys");
    }
  } else if (const auto* simple = std::get_if<SimpleThreshold>(&policy_)) {
    if (simple->threshold < 1 || simple->threshold > key_count) {
      throw InvalidPolicyError(
          "threshold " + std::to_string(simple->threshold) +
          " cannot be met by " + std::to_string(key_count) + " keys");
    }
  } else if (const auto* weighted = std::get_if<WeightedThreshold>(&policy_)) {
    if (weighted->weights.size() != key_count) {
      throw InvalidPolicyError(
          std::to_string(weighted->weights.size()) + " weights for " +
          std::to_string(key_count) + " keys");
    }
  }
}

NormalizedWeights normalizeWeights(const std::vector<Fraction>& weights) {
  if (weights.empty()) {
    throw InvalidPolicyError("weighted threshold has no weights");
  }

  NormalizedWeights normalized;
  for (const auto& weight : weights) {
    if (weight.numerator <= 0 || weight.denominator <= 0) {
      throw InvalidPolicyError("weight " + weight.toString() +
                               " is not positive");
    }
    int64_t step = weight.denominator / std::gcd(normalized.lcd,
                                                 weight.denominator);
    if (!checkedMultiply(normalized.lcd, step, normalized.lcd)) {
      throw InvalidPolicyError("common denominator overflows");
    }
  }

  normalized.numerators.reserve(weights.size());
  for (const auto& weight : weights) {
    if (normalized.lcd % weight.denominator != 0) {
      throw InvalidPolicyError("weight " + weight.toString() +
                               " does not scale to a whole numerator");
    }
    int64_t numerator = 0;
    if (!checkedMultiply(weight.numerator,
                         normalized.lcd / weight.denominator, numerator)) {
      throw InvalidPolicyError("numerator of weight " + weight.toString() +
                               " overflows");
    }
    normalized.numerators.push_back(numerator);
  }

  normalized.threshold = static_cast<double>(normalized.lcd) / 2.0;
  return normalized;
}

}  // namespace keridoc
