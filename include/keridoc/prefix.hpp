/**
 * @file prefix.hpp
 * @brief Grammar for self-certifying identifier prefixes
 *
 * An identifier prefix is a fully qualified base64url primitive: a derivation
 * code followed by the base64url text of the raw key or digest. The code
 * determines the raw size and therefore the exact total length.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace keridoc {

/**
 * @brief Size table entry for an identifier derivation code
 */
struct PrefixCode {
  std::string_view code;   ///< Derivation code text
  std::string_view name;   ///< Human readable primitive name
  size_t raw_size;         ///< Raw key or digest size in bytes
  size_t full_size;        ///< Total qualified length in characters
};

/**
 * @brief Look up the derivation code a prefix starts with
 * @return Matching table entry, or nullopt when no known code matches
 */
std::optional<PrefixCode> lookupPrefixCode(std::string_view prefix) noexcept;

/**
 * @brief Check a prefix against the grammar
 * @return Empty string when valid, otherwise a description of the failure
 */
std::string describePrefixFailure(std::string_view prefix);

/**
 * @brief True when the prefix satisfies the grammar
 */
inline bool isValidPrefix(std::string_view prefix) {
  return describePrefixFailure(prefix).empty();
}

/**
 * @brief Validate a prefix
 * @throws InvalidIdentifierError naming the offending prefix and the reason
 */
void validatePrefix(std::string_view prefix);

}  // namespace keridoc
