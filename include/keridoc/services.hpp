/**
 * @file services.hpp
 * @brief Read-only interfaces to the identity state the resolver consumes
 *
 * Key event log processing, witness location storage and the credential
 * registry live outside this library; callers implement these interfaces
 * over their own stores and pass them to DocumentSynthesizer.
 */

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "signing_policy.hpp"
#include "verification_method.hpp"

namespace keridoc {

/**
 * @brief Current key state of an identifier
 */
struct KeyState {
  std::vector<VerifyingKey> verifying_keys;  ///< In key list order
  SigningPolicy signing_threshold;
  std::vector<std::string> witnesses;        ///< Configured witness order
  uint64_t sequence_number = 0;              ///< Latest event sequence number
};

/**
 * @brief Known network location of a witness
 */
struct LocationRecord {
  std::string scheme;
  std::string url;
};

/// protocol -> host of one endpoint provider
using EndpointLocations = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Endpoint providers authorized for one role
 */
struct RoleEndpoints {
  std::string role;
  /// endpoint identifier -> locations, in enumeration order
  std::vector<std::pair<std::string, EndpointLocations>> endpoints;
};

using EndpointTable = std::vector<RoleEndpoints>;

/**
 * @brief Key state lookups
 */
class KeyStateService {
 public:
  virtual ~KeyStateService() = default;

  /**
   * @brief Key state of an identifier, nullopt when it is unknown
   */
  virtual std::optional<KeyState> getState(std::string_view identifier) const = 0;

  virtual std::vector<LocationRecord> getWitnessLocations(
      std::string_view witness) const = 0;

  /**
   * @brief Endpoints authorized by the identifier for agent, mailbox and
   * other non-witness roles
   */
  virtual EndpointTable getRoleEndpoints(std::string_view identifier) const = 0;

  /**
   * @brief Endpoints of the identifier's witnesses, keyed by the witness role
   */
  virtual EndpointTable getWitnessEndpoints(
      std::string_view identifier) const = 0;

  /**
   * @brief Whether the identifier is controlled by the local keystore
   */
  virtual bool hasLocalIdentity(std::string_view identifier) const = 0;
};

/**
 * @brief Credential as stored by the registry
 */
struct CredentialRecord {
  std::string said;                  ///< Credential digest
  std::string issuer;
  std::optional<std::string> issuee; ///< Absent for self-attested credentials
  std::string schema;
  nlohmann::json attributes;         ///< The credential's "a" section
  std::string status_event_type;     ///< Latest status event: iss, rev, bis, brv
};

/**
 * @brief Credential registry lookups
 */
class CredentialRegistry {
 public:
  virtual ~CredentialRegistry() = default;

  /**
   * @brief Credentials issued by identifier under schema, without an issuee
   */
  virtual std::vector<CredentialRecord> findSelfAttested(
      std::string_view identifier, std::string_view schema) const = 0;
};

}  // namespace keridoc
