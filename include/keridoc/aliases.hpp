/**
 * @file aliases.hpp
 * @brief Designated aliases declared through self-attested credentials
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "services.hpp"

namespace keridoc {

/// Schema SAID of the designated aliases credential
constexpr std::string_view DES_ALIASES_SCHEMA =
    "EN6Oh5XSD5_q2Hgu-aqpdfbVepdpYpFlgz6zvJL5b_r5";

/// Status event types of a credential that has not been revoked
constexpr std::string_view STATUS_ISSUED = "iss";
constexpr std::string_view STATUS_BACKER_ISSUED = "bis";

/**
 * @brief Alias lists of an identifier split by use in the document
 */
struct DesignatedAliases {
  std::vector<std::string> also_known_as;  ///< Every alias
  std::vector<std::string> equivalent_id;  ///< Only did:webs aliases
};

/**
 * @brief Collect the aliases an identifier designates for itself
 *
 * Keeps credentials that match the schema, have no issuee other than the
 * issuer and whose latest status is iss or bis, then flattens their a.ids
 * lists in enumeration order without de-duplication.
 */
std::vector<std::string> resolveAliases(std::string_view identifier,
                                        const CredentialRegistry& registry,
                                        std::string_view schema =
                                            DES_ALIASES_SCHEMA);

/**
 * @brief Split aliases into alsoKnownAs and equivalentId lists
 */
DesignatedAliases classifyAliases(const std::vector<std::string>& aliases);

}  // namespace keridoc
